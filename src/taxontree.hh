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

#ifndef taxontree_hh_
#define taxontree_hh_

#include "types.hh"
#include <tree.hh>
#include <iterator>
#include <map>
#include <set>
#include <vector>
#include <string>



class Taxon {
	public:
		Taxon( TaxonID id, const std::string& rankname, const std::string& taxonname, small_int rankpos ) :
			taxid( id ), rank( rankname ), name( taxonname ), rank_index( rankpos ), root_pathlength( 0 ), ranked_depth( 0 ), leftvalue( 0 ), rightvalue( 0 ) {};

		bool isRanked() const { return rank_index >= 0; }

		//default order is pre-order
		bool operator<( const Taxon& t ) const {
			return this->leftvalue < t.leftvalue;
		}

		const TaxonID taxid;
		const std::string& rank; // points into the rank set of the tree
		const std::string name;
		const small_int rank_index; // position in the ranked levels, -1 for unranked nodes
		medium_unsigned_int root_pathlength;
		small_unsigned_int ranked_depth; // number of ranked nodes on the path to the root, including this one
		large_unsigned_int leftvalue; //nested set value
		large_unsigned_int rightvalue; //nested set value
};



typedef tree_node_<Taxon*> TaxonNode;



class TaxonomyInterface;



// immutable after finalize(), safe to share between threads for reading
class TaxonTree : public tree< Taxon* > {
	friend class TaxonomyInterface;
	public:
		explicit TaxonTree( const std::vector< std::string >& ranked_levels );
		~TaxonTree();
		typedef tree_node Node;

		int indexSize() const;
		bool contains( TaxonID taxid ) const { return taxid2node_.count( taxid ); }
		const std::string& insertRankInternal( const std::string& rankname );
		const std::string& getRankInternal( const std::string& rankname ) const;
		small_int getRankIndex( const std::string& rankname ) const;
		const std::vector< std::string >& getRankedLevels() const { return ranked_levels_; }
		void addToIndex( TaxonID taxid, Node* node );

		// nested set values, depths and the name index, must be called once after the last insertion
		void finalize();
		bool isFinalized() const { return finalized_; }
		medium_unsigned_int getMaxDepth() const { return max_depth_; }

		class PathUpIterator { //iterator will stop after the root
		public:
			typedef std::forward_iterator_tag iterator_category;
			typedef Node value_type;
			typedef std::ptrdiff_t difference_type;
			typedef const Node* pointer;
			typedef const Node& reference;

			explicit PathUpIterator( const Node* startnode ) : current( startnode ) {};

			reference operator*() const { return *current; };
			pointer operator->() const { return current; };
			bool operator==( const PathUpIterator& it ) const { return current == it.current; };
			bool operator!=( const PathUpIterator& it ) const { return current != it.current; };
			bool operator==( pointer node ) const { return current == node; };
			bool operator!=( pointer node ) const { return current != node; };
			bool valid() const { return current; }

			PathUpIterator& operator++() {
				current = current->parent;
				return *this;
			};

			PathUpIterator operator++( int ) {
				PathUpIterator tmp( *this );
				operator++();
				return tmp;
			}

		private:
			const Node* current;
		};

	private:
		TaxonTree( const TaxonTree& );
		TaxonTree& operator=( const TaxonTree& );

		std::set< std::string > ranks_;
		const std::string& rank_not_found_;
		std::vector< std::string > ranked_levels_;
		std::map< std::string, small_int > rank2index_;
		std::map< TaxonID, Node* > taxid2node_;
		std::multimap< std::pair< small_int, std::string >, const Node* > name_index_; // ranked nodes only, homonyms in preorder
		medium_unsigned_int max_depth_;
		bool finalized_;
};



typedef TaxonTree Taxonomy;



// NCBI renamed superkingdom to domain, both count as the same level
const std::string& canonicalRankName( const std::string& rankname );

#endif // taxontree_hh_
