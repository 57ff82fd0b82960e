#include "taxonomyinterface.hh"
#include "exception.hh"
#include <algorithm>



const TaxonNode* TaxonomyInterface::getNode( const TaxonID taxid ) const {
	std::map< TaxonID, TaxonTree::Node* >::const_iterator it = tax->taxid2node_.find( taxid );
	if( it == tax->taxid2node_.end() ) {
		return NULL;
	}
	return it->second;
}



const TaxonNode* TaxonomyInterface::getNodeChecked( const TaxonID taxid ) const {
	const TaxonNode* node = getNode( taxid );
	if( ! node ) {
		BOOST_THROW_EXCEPTION( TaxonNotFound() << taxid_info( taxid ) );
	}
	return node;
}



const TaxonNode* TaxonomyInterface::getRoot() const {
	return tax->begin().node;
}



bool TaxonomyInterface::isParentOf( const TaxonNode* A, const TaxonNode* B ) const {
	return A->data->leftvalue < B->data->leftvalue && B->data->leftvalue <= A->data->rightvalue;
}



bool TaxonomyInterface::isParentOf( const TaxonID A_taxid, const TaxonID B_taxid ) const {
	return isParentOf( getNodeChecked( A_taxid ), getNodeChecked( B_taxid ) );
}



const TaxonNode* TaxonomyInterface::getLCA( const TaxonNode* A, const TaxonNode* B ) const {
	// walk up from A until its subtree contains B
	const TaxonNode* lca = A;
	while( lca != B && ! isParentOf( lca, B ) ) {
		lca = lca->parent;
	}
	return lca;
}



const TaxonNode* TaxonomyInterface::getLCA( const TaxonID A_taxid, const TaxonID B_taxid ) const {
	return getLCA( getNodeChecked( A_taxid ), getNodeChecked( B_taxid ) );
}



const TaxonNode* TaxonomyInterface::getRankedAncestor( const TaxonNode* node ) const {
	for( Taxonomy::PathUpIterator it = traverseUp( node ); it.valid(); ++it ) {
		if( it->data->isRanked() ) {
			return &*it;
		}
	}
	return NULL;
}



std::vector< const TaxonNode* > TaxonomyInterface::getRankedLineage( const TaxonNode* node ) const {
	std::vector< const TaxonNode* > lineage;
	for( Taxonomy::PathUpIterator it = traverseUp( node ); it.valid(); ++it ) {
		if( it->data->isRanked() ) {
			lineage.push_back( &*it );
		}
	}
	std::reverse( lineage.begin(), lineage.end() );
	return lineage;
}



std::vector< const TaxonNode* > TaxonomyInterface::getRankedSlots( const TaxonNode* node ) const {
	std::vector< const TaxonNode* > slots( tax->ranked_levels_.size(), NULL );
	for( Taxonomy::PathUpIterator it = traverseUp( node ); it.valid(); ++it ) {
		const small_int pos = it->data->rank_index;
		if( pos >= 0 && ! slots[pos] ) {
			slots[pos] = &*it;
		}
	}
	return slots;
}



const TaxonNode* TaxonomyInterface::findRankedNode( const std::string& rank, const std::string& name ) const {
	const small_int pos = tax->getRankIndex( rank );
	if( pos < 0 ) {
		return NULL;
	}
	std::multimap< std::pair< small_int, std::string >, const TaxonNode* >::const_iterator it = tax->name_index_.find( std::make_pair( pos, name ) );
	if( it == tax->name_index_.end() ) {
		return NULL;
	}
	return it->second;
}



std::vector< const TaxonNode* > TaxonomyInterface::findRankedNodes( const std::string& rank, const std::string& name ) const {
	std::vector< const TaxonNode* > nodes;
	const small_int pos = tax->getRankIndex( rank );
	if( pos < 0 ) {
		return nodes;
	}
	typedef std::multimap< std::pair< small_int, std::string >, const TaxonNode* >::const_iterator NameIterator;
	const std::pair< NameIterator, NameIterator > range = tax->name_index_.equal_range( std::make_pair( pos, name ) );
	for( NameIterator it = range.first; it != range.second; ++it ) {
		nodes.push_back( it->second );
	}
	return nodes;
}
