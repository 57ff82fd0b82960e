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

#ifndef taxonomyinterface_hh_
#define taxonomyinterface_hh_

#include <vector>
#include <string>
#include "types.hh"
#include "taxontree.hh"

// read-only queries on a finalized taxonomy, cheap to copy and to share between threads
class TaxonomyInterface {
	public:
		TaxonomyInterface( const Taxonomy* taxtree ) : tax( taxtree ) {}

		TaxonomyInterface( const TaxonomyInterface& taxinter ) : tax( taxinter.tax ) {}

		// NULL if unknown
		const TaxonNode* getNode( const TaxonID taxid ) const;
		// throws TaxonNotFound if unknown
		const TaxonNode* getNodeChecked( const TaxonID taxid ) const;
		const TaxonNode* getRoot() const;
		medium_unsigned_int getMaxDepth() const { return tax->max_depth_; }
		std::size_t size() const { return tax->taxid2node_.size(); }

		const std::string& getRank( const TaxonNode* node ) const { return node->data->rank; }
		const std::string& getName( const TaxonNode* node ) const { return node->data->name; }
		TaxonID getTaxID( const TaxonNode* node ) const { return node->data->taxid; }
		small_unsigned_int getRankedDepth( const TaxonNode* node ) const { return node->data->ranked_depth; }
		const std::vector< std::string >& getRankedLevels() const { return tax->ranked_levels_; }

		// strict ancestor test
		bool isParentOf( const TaxonNode* A, const TaxonNode* B ) const;
		bool isParentOf( const TaxonID A_taxid, const TaxonID B_taxid ) const;

		const TaxonNode* getLCA( const TaxonNode* A, const TaxonNode* B ) const;
		const TaxonNode* getLCA( const TaxonID A_taxid, const TaxonID B_taxid ) const;

		template < typename ContainerT >
		const TaxonNode* getLCA( const ContainerT& nodescontainer ) const {
			if( nodescontainer.empty() ) {
				return NULL;
			}

			typename ContainerT::const_iterator node_it = nodescontainer.begin();
			const TaxonNode* tmplca = *node_it++;
			while( node_it != nodescontainer.end() ) {
				tmplca = getLCA( tmplca, *node_it );
				++node_it;
			}
			return tmplca;
		}

		// the node itself if ranked, otherwise the nearest ranked ancestor; NULL if there is none
		const TaxonNode* getRankedAncestor( const TaxonNode* node ) const;

		// ranked nodes from the top level down to node, node included if ranked
		std::vector< const TaxonNode* > getRankedLineage( const TaxonNode* node ) const;

		// one slot per ranked level, NULL where the lineage has no node at that level
		std::vector< const TaxonNode* > getRankedSlots( const TaxonNode* node ) const;

		// NULL if not found, the first in preorder for homonyms
		const TaxonNode* findRankedNode( const std::string& rank, const std::string& name ) const;

		// all nodes of that rank carrying the name, in preorder
		std::vector< const TaxonNode* > findRankedNodes( const std::string& rank, const std::string& name ) const;

		Taxonomy::PathUpIterator traverseUp( const TaxonNode* node ) const { return Taxonomy::PathUpIterator( node ); }

		bool isLeaf( const TaxonNode* node ) const { return ! node->first_child; }

	private:
		const Taxonomy* const tax;
};

#endif // taxonomyinterface_hh_
