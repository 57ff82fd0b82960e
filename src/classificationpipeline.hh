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

#ifndef classificationpipeline_hh_
#define classificationpipeline_hh_

#include <map>
#include <ostream>
#include <string>
#include <vector>
#include "types.hh"
#include "accessconv.hh"
#include "alignmentrecord.hh"
#include "classificationrecord.hh"
#include "lineageconsensus.hh"
#include "taxontree.hh"

class ProfileAggregator;



struct ClassificationStats {
	ClassificationStats() : records( 0 ), skipped_lines( 0 ), unmapped_hits( 0 ), unknown_taxa( 0 ), queries( 0 ), resolved( 0 ), fallback( false ) {}

	ClassificationStats& operator+=( const ClassificationStats& other );

	very_large_unsigned_int records;
	very_large_unsigned_int skipped_lines;
	very_large_unsigned_int unmapped_hits; // target without taxonomy mapping
	large_unsigned_int unknown_taxa; // mapped to a taxon missing in the hierarchy
	large_unsigned_int queries;
	large_unsigned_int resolved;
	bool fallback;
};

std::ostream& operator<<( std::ostream& strm, const ClassificationStats& stats );



// streams a PAF file through one parsing thread into a fixed number of shard workers, each
// owning the queries that hash to it; the result does not depend on the number of workers
class ClassificationPipeline {
	public:
		// seqid2taxid may be NULL, then nothing can be mapped and the first-hit fallback applies
		ClassificationPipeline( const Taxonomy* tax, const StrIDConverter* seqid2taxid, const ConsensusParameters& params, uint number_threads, std::ostream& logsink );

		// one record per query in input order: the given query identifiers first, then queries
		// only found in the alignments by first appearance; throws CancellationError
		void run( const std::string& paf_filename, const std::vector< std::string >& query_ids, std::vector< ClassificationRecord >& results );

		const ClassificationStats& stats() const { return stats_; }
		uint threads() const { return number_threads_; }

	private:
		typedef std::map< std::string, QueryOrdinal > OrdinalMap;

		void firstHitFallback( const std::string& paf_filename, const OrdinalMap& ordinals, std::vector< ClassificationRecord >& results );

		const Taxonomy* tax_;
		const StrIDConverter* seqid2taxid_;
		const LineageConsensus consensus_;
		uint number_threads_;
		std::ostream& logsink_;
		ClassificationStats stats_;
};



// resolves the reference identifier to a node of the hierarchy, NULL if not possible
const TaxonNode* mapReference( const std::string& target, const StrIDConverter* seqid2taxid, const TaxonomyInterface& taxinter, ClassificationStats& stats );



void writeClassification( std::ostream& strm, const std::vector< ClassificationRecord >& results, const Taxonomy* tax );

void writeClassification( const std::string& filename, const std::vector< ClassificationRecord >& results, const Taxonomy* tax );

// both files are written completely before either replaces its target; if one of them fails
// neither is left behind
void writeClassificationAndProfile( const std::string& filename, const std::vector< ClassificationRecord >& results, const Taxonomy* tax,
                                    const std::string& profile_filename, const ProfileAggregator& profile, const std::string& sampleid );

#endif // classificationpipeline_hh_
