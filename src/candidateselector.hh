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

#ifndef candidateselector_hh_
#define candidateselector_hh_

#include <istream>
#include <ostream>
#include <string>
#include <vector>
#include "types.hh"
#include "constants.hh"



// one row of `mash screen` output
struct ScreenHit {
	std::string genome_id;
	double score; // identity, first column
	std::string raw_metrics; // shared-hashes, median-multiplicity, p-value and comment as written
};



// malformed rows are skipped, their number is returned; the best score per genome is kept and
// hits are ordered by decreasing score, then genome identifier
large_unsigned_int parseScreenTable( std::istream& strm, std::vector< ScreenHit >& hits );
large_unsigned_int parseScreenFile( const std::string& filename, std::vector< ScreenHit >& hits );



struct SelectorParameters {
	SelectorParameters() :
		initial_threshold( default_initial_threshold ),
		min_threshold( default_min_threshold ),
		step( default_threshold_step ),
		fallback_threshold( default_fallback_threshold ),
		per_input_sequence( candidates_per_input_sequence ),
		min_candidates( min_candidates_floor ) {}

	// throws ConfigurationError
	void validate() const;

	// max( min_candidates, ceil( num_input_sequences * per_input_sequence ) )
	unsigned int requiredCandidates( large_unsigned_int num_input_sequences ) const;

	// number of thresholds tried before falling back
	unsigned int maxIterations() const;

	double initial_threshold;
	double min_threshold;
	double step;
	double fallback_threshold;
	double per_input_sequence;
	unsigned int min_candidates;
};



struct SelectionResult {
	SelectionResult() : threshold( 0. ), iterations( 0 ), degraded( false ) {}
	std::vector< std::string > genomes; // sorted
	double threshold;
	unsigned int iterations;
	bool degraded; // no threshold reached the required number, fallback threshold used
};



// lowers the identity threshold stepwise until enough genomes pass
class CandidateSelector {
	public:
		CandidateSelector( const SelectorParameters& params, std::ostream& logsink );

		// hits of one reference database, as returned by parseScreenTable()
		SelectionResult select( const std::vector< ScreenHit >& hits, unsigned int required ) const;

		// union over databases, sorted and without duplicates; throws InputError if nothing was selected at all
		std::vector< std::string > selectAll( const std::vector< std::vector< ScreenHit > >& tables, unsigned int required, std::vector< SelectionResult >* per_table = NULL ) const;

	private:
		double thresholdAt( unsigned int i ) const;

		const SelectorParameters params_;
		std::ostream& logsink_;
};

#endif // candidateselector_hh_
