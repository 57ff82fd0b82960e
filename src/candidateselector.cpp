#include "candidateselector.hh"
#include "exception.hh"
#include "utils.hh"
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <set>



namespace {

bool hitOrder( const ScreenHit& a, const ScreenHit& b ) {
	if( a.score != b.score ) return a.score > b.score;
	return a.genome_id < b.genome_id;
}

}



large_unsigned_int parseScreenTable( std::istream& strm, std::vector< ScreenHit >& hits ) {
	std::map< std::string, ScreenHit > best;
	std::vector< std::string > fields;
	std::string line;
	large_unsigned_int skipped = 0;

	while( std::getline( strm, line ) ) {
		if( ignoreLine( line ) ) continue;
		fields.clear();
		tokenizeSingleCharDelim( line, fields, default_field_separator, 6 );
		if( fields.size() < 5 || trimmed( fields[4] ).empty() ) {
			++skipped;
			continue;
		}
		ScreenHit hit;
		try {
			hit.score = boost::lexical_cast< double >( trimmed( fields[0] ) );
		} catch( boost::bad_lexical_cast& ) {
			++skipped;
			continue;
		}
		hit.genome_id = trimmed( fields[4] );
		hit.raw_metrics = fields[1] + tab + fields[2] + tab + fields[3];
		if( fields.size() > 5 ) hit.raw_metrics += tab + fields[5];

		std::pair< std::map< std::string, ScreenHit >::iterator, bool > ins = best.insert( std::make_pair( hit.genome_id, hit ) );
		if( ! ins.second && hit.score > ins.first->second.score ) ins.first->second = hit;
	}

	const std::size_t offset = hits.size();
	for( std::map< std::string, ScreenHit >::const_iterator it = best.begin(); it != best.end(); ++it ) hits.push_back( it->second );
	std::sort( hits.begin() + offset, hits.end(), hitOrder );
	return skipped;
}



large_unsigned_int parseScreenFile( const std::string& filename, std::vector< ScreenHit >& hits ) {
	std::ifstream handle( filename.c_str() );
	if( ! handle ) BOOST_THROW_EXCEPTION( FileNotFound() << file_info( filename ) );
	return parseScreenTable( handle, hits );
}



void SelectorParameters::validate() const {
	if( ! ( step > 0. ) ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "threshold-step" ) << general_info( "must be positive" ) );
	if( ! ( min_threshold >= 0. && initial_threshold <= 1. && min_threshold <= initial_threshold ) ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "initial-threshold" ) << general_info( "need 0 <= min-threshold <= initial-threshold <= 1" ) );
	if( ! ( fallback_threshold >= 0. && fallback_threshold <= 1. ) ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "fallback-threshold" ) << general_info( "must be in [0,1]" ) );
	if( ! ( per_input_sequence >= 0. ) ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "candidates-per-sequence" ) << general_info( "must not be negative" ) );
}



unsigned int SelectorParameters::requiredCandidates( large_unsigned_int num_input_sequences ) const {
	const double scaled = std::ceil( num_input_sequences*per_input_sequence - 1e-9 );
	return std::max( min_candidates, static_cast< unsigned int >( scaled ) );
}



unsigned int SelectorParameters::maxIterations() const {
	// tolerance against representation error of the decimal parameters
	return static_cast< unsigned int >( std::floor( ( initial_threshold - min_threshold )/step + 1e-6 ) ) + 1;
}



CandidateSelector::CandidateSelector( const SelectorParameters& params, std::ostream& logsink ) : params_( params ), logsink_( logsink ) {
	params_.validate();
}



// rounded so that 0.90 - 5*0.02 compares like the literal 0.80
double CandidateSelector::thresholdAt( unsigned int i ) const {
	return std::floor( ( params_.initial_threshold - i*params_.step )*1e9 + .5 )/1e9;
}



SelectionResult CandidateSelector::select( const std::vector< ScreenHit >& hits, unsigned int required ) const {
	SelectionResult result;
	std::size_t count = 0;
	const unsigned int max_iterations = params_.maxIterations();

	// hits are sorted by decreasing score, the count is the length of the prefix above the threshold
	bool found = false;
	for( unsigned int i = 0; i < max_iterations; ++i ) {
		result.threshold = thresholdAt( i );
		result.iterations = i + 1;
		count = 0;
		while( count < hits.size() && hits[count].score > result.threshold ) ++count;
		logsink_ << "threshold " << formatFixed( result.threshold, 2 ) << ": " << count << " candidates" << endline;
		if( count >= required ) {
			found = true;
			break;
		}
	}

	if( ! found ) {
		result.degraded = true;
		result.threshold = params_.fallback_threshold;
		count = 0;
		while( count < hits.size() && hits[count].score > result.threshold ) ++count;
		warnDegradedMode( "no threshold down to " + formatFixed( params_.min_threshold, 2 ) + " yields " + boost::lexical_cast< std::string >( required ) + " candidates, using " + formatFixed( result.threshold, 2 ) + " with " + boost::lexical_cast< std::string >( count ) + " candidates", logsink_ );
	}

	for( std::size_t i = 0; i < count; ++i ) result.genomes.push_back( hits[i].genome_id );
	std::sort( result.genomes.begin(), result.genomes.end() );
	return result;
}



std::vector< std::string > CandidateSelector::selectAll( const std::vector< std::vector< ScreenHit > >& tables, unsigned int required, std::vector< SelectionResult >* per_table ) const {
	std::set< std::string > selected;
	for( std::vector< std::vector< ScreenHit > >::const_iterator it = tables.begin(); it != tables.end(); ++it ) {
		const SelectionResult result = select( *it, required );
		selected.insert( result.genomes.begin(), result.genomes.end() );
		if( per_table ) per_table->push_back( result );
	}
	if( selected.empty() ) BOOST_THROW_EXCEPTION( InputError() << general_info( "no candidate genome selected from any reference database" ) );
	return std::vector< std::string >( selected.begin(), selected.end() );
}
