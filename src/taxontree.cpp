#include "taxontree.hh"
#include <algorithm>



const std::string& canonicalRankName( const std::string& rankname ) {
	static const std::string superkingdom = "superkingdom";
	if( rankname == "domain" ) return superkingdom;
	return rankname;
}



TaxonTree::TaxonTree( const std::vector< std::string >& ranked_levels ) :
	rank_not_found_( *ranks_.insert( "" ).first ),
	ranked_levels_( ranked_levels ),
	max_depth_( 0 ),
	finalized_( false ) {
	for( std::size_t i = 0; i < ranked_levels_.size(); ++i ) {
		rank2index_[ canonicalRankName( ranked_levels_[i] ) ] = static_cast< small_int >( i );
	}
}



TaxonTree::~TaxonTree() {
	for( iterator node_it = this->begin(); node_it != this->end(); ++node_it ) {
		delete *node_it;
	}
}



// constant in time as apposed to size()
int TaxonTree::indexSize() const {
	return taxid2node_.size();
}



const std::string& TaxonTree::getRankInternal( const std::string& rankname ) const {
	std::set< std::string >::const_iterator rank_it = ranks_.find( canonicalRankName( rankname ) );
	if( rank_it == ranks_.end() ) {
		return rank_not_found_;
	}
	return *rank_it;
}



const std::string& TaxonTree::insertRankInternal( const std::string& rankname ) {
	return *ranks_.insert( canonicalRankName( rankname ) ).first;
}



small_int TaxonTree::getRankIndex( const std::string& rankname ) const {
	std::map< std::string, small_int >::const_iterator it = rank2index_.find( canonicalRankName( rankname ) );
	if( it == rank2index_.end() ) return -1;
	return it->second;
}



void TaxonTree::addToIndex( TaxonID taxid, Node* node ) {
	taxid2node_[ taxid ] = node;
}



void TaxonTree::finalize() {
	std::vector< Node* > preorder;
	preorder.reserve( taxid2node_.size() );

	// depths and left values top-down
	large_unsigned_int lvalue = 0;
	max_depth_ = 0;
	for( iterator node_it = this->begin(); node_it != this->end(); ++node_it ) {
		Node* node = node_it.node;
		Taxon* taxon = node->data;
		if( node->parent ) {
			const Taxon* parent = node->parent->data;
			taxon->root_pathlength = parent->root_pathlength + 1;
			taxon->ranked_depth = parent->ranked_depth + ( taxon->isRanked() ? 1 : 0 );
		} else {
			taxon->root_pathlength = 0;
			taxon->ranked_depth = taxon->isRanked() ? 1 : 0;
		}
		max_depth_ = std::max( max_depth_, taxon->root_pathlength );
		taxon->leftvalue = taxon->rightvalue = lvalue++;
		preorder.push_back( node );

		if( taxon->isRanked() ) {
			name_index_.insert( std::make_pair( std::make_pair( taxon->rank_index, taxon->name ), node ) );
		}
	}

	// right values bottom-up: largest left value in the subtree
	for( std::vector< Node* >::reverse_iterator it = preorder.rbegin(); it != preorder.rend(); ++it ) {
		Node* node = *it;
		if( node->parent ) {
			Taxon* parent = node->parent->data;
			parent->rightvalue = std::max( parent->rightvalue, node->data->rightvalue );
		}
	}

	finalized_ = true;
}
