#include "profileaggregator.hh"
#include "atomicoutput.hh"
#include "bioboxes.hh"
#include "constants.hh"
#include "utils.hh"
#include <boost/lexical_cast.hpp>
#include <algorithm>



namespace {

bool entryOrder( const ProfileEntry& a, const ProfileEntry& b ) {
	if( a.percentage != b.percentage ) return a.percentage > b.percentage;
	return a.taxid < b.taxid;
}

}



ProfileAggregator::ProfileAggregator( const Taxonomy* tax, bool renormalize ) :
	taxinter_( tax ),
	renormalize_( renormalize ),
	total_( 0 ),
	counts_( taxinter_.getRankedLevels().size() ),
	reached_( taxinter_.getRankedLevels().size(), 0 )
{}



void ProfileAggregator::add( const TaxonNode* node ) {
	++total_;
	if( ! node ) return;
	const std::vector< const TaxonNode* > slots = taxinter_.getRankedSlots( node );
	for( std::size_t i = 0; i < slots.size(); ++i ) {
		if( ! slots[i] ) continue;
		++counts_[i][ slots[i] ];
		++reached_[i];
	}
}



void ProfileAggregator::getEntries( std::vector< ProfileEntry >& entries ) const {
	entries.clear();
	if( ! total_ ) return;

	for( std::size_t i = 0; i < counts_.size(); ++i ) {
		std::vector< ProfileEntry > level;
		const double denominator = renormalize_ ? reached_[i] : total_;
		for( std::map< const TaxonNode*, large_unsigned_int >::const_iterator it = counts_[i].begin(); it != counts_[i].end(); ++it ) {
			const std::vector< const TaxonNode* > slots = taxinter_.getRankedSlots( it->first );
			ProfileEntry entry;
			entry.taxid = taxinter_.getTaxID( it->first );
			entry.rank = taxinter_.getRankedLevels()[i];
			for( std::size_t j = 0; j <= i; ++j ) {
				if( j ) {
					entry.taxpath += '|';
					entry.taxpathsn += '|';
				}
				if( slots[j] ) {
					entry.taxpath += boost::lexical_cast< std::string >( taxinter_.getTaxID( slots[j] ) );
					entry.taxpathsn += taxinter_.getName( slots[j] );
				}
			}
			entry.percentage = 100.*it->second/denominator;
			level.push_back( entry );
		}
		std::sort( level.begin(), level.end(), entryOrder );
		entries.insert( entries.end(), level.begin(), level.end() );
	}
}



void ProfileAggregator::write( std::ostream& strm, const std::string& sampleid ) const {
	std::vector< ProfileEntry > entries;
	getEntries( entries );
	BioboxesProfilingFormat profile_output( sampleid, taxinter_.getRankedLevels(), empty_string, strm );
	for( std::vector< ProfileEntry >::const_iterator it = entries.begin(); it != entries.end(); ++it ) {
		profile_output.writeBodyLine( boost::lexical_cast< std::string >( it->taxid ), it->rank, it->taxpath, it->taxpathsn, formatFixed( it->percentage, 6 ) );
	}
}



void writeProfile( const std::string& filename, const ProfileAggregator& profile, const std::string& sampleid ) {
	AtomicOutputFile output( filename );
	profile.write( output.stream(), sampleid );
	output.commit();
}



const TaxonNode* resolveLineage( const std::string& lineage, const TaxonomyInterface& taxinter ) {
	std::vector< std::string > tokens;
	tokenizeSingleCharDelim( lineage, tokens, lineage_separator, 0, true );

	// top-down, each name is only looked up below the node resolved so far
	const TaxonNode* resolved = NULL;
	for( std::vector< std::string >::const_iterator it = tokens.begin(); it != tokens.end(); ++it ) {
		const std::string::size_type pos = it->find( rank_name_separator );
		if( pos == std::string::npos ) continue;
		const std::vector< const TaxonNode* > candidates = taxinter.findRankedNodes( trimmed( it->substr( 0, pos ) ), trimmed( it->substr( pos + 1 ) ) );
		for( std::vector< const TaxonNode* >::const_iterator cit = candidates.begin(); cit != candidates.end(); ++cit ) {
			if( ! resolved || taxinter.isParentOf( resolved, *cit ) ) {
				resolved = *cit;
				break;
			}
		}
	}
	return resolved;
}
