#include "classificationrecord.hh"
#include "utils.hh"
#include <vector>



std::string ClassificationRecord::getLineage( const TaxonomyInterface& taxinter ) const {
    if( ! node_ ) return unclassified_label;

    const std::vector< const TaxonNode* > lineage = taxinter.getRankedLineage( node_ );
    std::string result;
    for( std::vector< const TaxonNode* >::const_iterator it = lineage.begin(); it != lineage.end(); ++it ) {
        if( it != lineage.begin() ) result += lineage_separator;
        result += taxinter.getRank( *it );
        result += rank_name_separator;
        result += taxinter.getName( *it );
    }
    return result;
}



const std::string& ClassificationRecord::getLevel() const {
    if( ! node_ ) return unclassified_label;
    return node_->data->rank;
}



void ClassificationRecord::print( std::ostream& strm, const TaxonomyInterface& taxinter ) const {
    strm << query_identifier_ << tab
         << getLineage( taxinter ) << tab
         << getLevel() << tab
         << formatFixed( confidence_, 4 ) << endline;
}
