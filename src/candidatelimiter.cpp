#include "candidatelimiter.hh"
#include "constants.hh"
#include "exception.hh"
#include "utils.hh"
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <fstream>
#include <limits>
#include <set>



namespace {

// higher score first, then smaller identifier
bool candidateOrder( const CandidateGenome& a, const CandidateGenome& b ) {
	if( a.best_score != b.best_score ) return a.best_score > b.best_score;
	return a.accession_id < b.accession_id;
}

}



std::ostream& operator<<( std::ostream& strm, const LimitAudit& audit ) {
	return strm << "candidates: " << audit.input_count << " input, " << audit.post_dedup_count << " after deduplication, " << audit.post_cap_count << " kept";
}



bool SpeciesMap::loadAssemblySummary( const std::string& filename ) {
	std::ifstream handle( filename.c_str() );
	if( ! handle ) return false;

	std::vector< std::string > fields;
	std::string line;
	while( std::getline( handle, line ) ) {
		if( ignoreLine( line ) ) continue;
		fields.clear();
		tokenizeSingleCharDelim( line, fields, default_field_separator, 9 );
		if( fields.size() < 8 ) continue;
		const std::string accession = trimmed( fields[0] );
		std::string species = trimmed( fields[6] );
		if( species.empty() ) species = trimmed( fields[5] );
		if( species.empty() ) species = accession;
		if( ! accession.empty() ) accession2species_[ accession ] = species;
	}
	return true;
}



bool SpeciesMap::find( const std::string& candidate, std::string& species_key ) const {
	std::map< std::string, std::string >::const_iterator it = accession2species_.find( accessionFromFilename( candidate ) );
	if( it == accession2species_.end() ) return false;
	species_key = it->second;
	return true;
}



bool ScoreTable::load( const std::string& filename ) {
	std::ifstream handle( filename.c_str() );
	if( ! handle ) return false;
	++readable_tables;

	std::vector< std::string > fields;
	std::string line;
	while( std::getline( handle, line ) ) {
		if( ignoreLine( line ) ) continue;
		fields.clear();
		tokenizeSingleCharDelim( line, fields, default_field_separator, 6 );
		if( fields.size() < 5 ) continue;
		const std::string candidate = trimmed( fields[4] );
		if( candidate.empty() ) continue;
		double score;
		try {
			score = boost::lexical_cast< double >( trimmed( fields[0] ) );
		} catch( boost::bad_lexical_cast& ) {
			continue;
		}
		std::map< std::string, std::pair< double, std::string > >::iterator it = best.find( candidate );
		if( it == best.end() ) best.insert( std::make_pair( candidate, std::make_pair( score, filename ) ) );
		else if( score > it->second.first ) it->second = std::make_pair( score, filename );
	}
	return true;
}



CandidateLimiter::CandidateLimiter( unsigned int max_candidates, bool dedupe, const SpeciesMap* species ) :
	max_candidates_( max_candidates ),
	dedupe_( dedupe ),
	species_( species )
{
	if( max_candidates_ < 1 ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "max-candidates" ) << general_info( "must be at least 1" ) );
}



void CandidateLimiter::getCandidates( const std::vector< std::string >& candidates, const ScoreTable& scores, std::vector< CandidateGenome >& genomes ) const {
	std::set< std::string > seen;
	for( std::vector< std::string >::const_iterator it = candidates.begin(); it != candidates.end(); ++it ) {
		if( it->empty() || ! seen.insert( *it ).second ) continue;
		CandidateGenome genome;
		genome.accession_id = *it;
		std::map< std::string, std::pair< double, std::string > >::const_iterator score_it = scores.best.find( *it );
		if( score_it != scores.best.end() ) {
			genome.best_score = score_it->second.first;
			genome.source_db = score_it->second.second;
		} else genome.best_score = -std::numeric_limits< double >::infinity();
		if( ! species_ || ! species_->find( *it, genome.species_key ) ) genome.species_key = accessionFromFilename( *it );
		genomes.push_back( genome );
	}
}



void CandidateLimiter::limit( const std::vector< std::string >& candidates, const ScoreTable& scores, std::vector< std::string >& final_list, LimitAudit& audit ) const {
	if( ! scores.readable_tables ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "score-file" ) << general_info( "no score table could be read" ) );

	std::vector< CandidateGenome > genomes;
	getCandidates( candidates, scores, genomes );
	audit = LimitAudit();
	audit.input_count = genomes.size();

	std::sort( genomes.begin(), genomes.end(), candidateOrder );

	// best of each species comes first in this order
	if( dedupe_ ) {
		std::set< std::string > species_seen;
		std::vector< CandidateGenome > unique;
		for( std::vector< CandidateGenome >::const_iterator it = genomes.begin(); it != genomes.end(); ++it ) {
			if( species_seen.insert( it->species_key ).second ) unique.push_back( *it );
		}
		genomes.swap( unique );
	}
	audit.post_dedup_count = genomes.size();

	if( genomes.size() > max_candidates_ ) genomes.resize( max_candidates_ );
	audit.post_cap_count = genomes.size();

	final_list.clear();
	for( std::vector< CandidateGenome >::const_iterator it = genomes.begin(); it != genomes.end(); ++it ) final_list.push_back( it->accession_id );
	std::sort( final_list.begin(), final_list.end() );
}
