/*
hymet assigns taxonomic lineages to metagenomic contigs based on sequence alignment.

Copyright (C) 2010 Johannes Dröge

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program.  If not, see <http://www.gnu.org/licenses/>.

*/

#ifndef candidatelimiter_hh_
#define candidatelimiter_hh_

#include <map>
#include <ostream>
#include <string>
#include <vector>
#include "types.hh"



struct CandidateGenome {
	std::string accession_id;
	std::string species_key;
	std::string source_db; // score table the best score came from, empty if unscored
	double best_score; // -inf if no score table lists the genome
};



struct LimitAudit {
	LimitAudit() : input_count( 0 ), post_dedup_count( 0 ), post_cap_count( 0 ) {}
	std::size_t input_count;
	std::size_t post_dedup_count;
	std::size_t post_cap_count;
};

std::ostream& operator<<( std::ostream& strm, const LimitAudit& audit );



// accession to species key from NCBI assembly_summary_*.txt (species_taxid, else taxid)
class SpeciesMap {
	public:
		// returns false if the file cannot be read
		bool loadAssemblySummary( const std::string& filename );

		// accession of a genome file name or of a plain accession, false if unknown
		bool find( const std::string& candidate, std::string& species_key ) const;

		std::size_t size() const { return accession2species_.size(); }

	private:
		std::map< std::string, std::string > accession2species_;
};



struct ScoreTable {
	std::map< std::string, std::pair< double, std::string > > best; // candidate -> score, source
	std::size_t readable_tables;

	ScoreTable() : readable_tables( 0 ) {}

	// column 1 score, column 5 candidate as written by `mash screen`; false if unreadable
	bool load( const std::string& filename );
};



// species deduplication and size cap of a candidate list
class CandidateLimiter {
	public:
		// throws ConfigurationError for max_candidates < 1
		CandidateLimiter( unsigned int max_candidates, bool dedupe, const SpeciesMap* species = NULL );

		// throws ConfigurationError if none of the score tables could be read; final_list is sorted
		void limit( const std::vector< std::string >& candidates, const ScoreTable& scores, std::vector< std::string >& final_list, LimitAudit& audit ) const;

		void getCandidates( const std::vector< std::string >& candidates, const ScoreTable& scores, std::vector< CandidateGenome >& genomes ) const;

	private:
		const unsigned int max_candidates_;
		const bool dedupe_;
		const SpeciesMap* species_;
};

#endif // candidatelimiter_hh_
