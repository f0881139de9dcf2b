/*
taxfilter-tk filters sequence records by their NCBI taxonomic lineage.

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
#include "nodestore.hh"
#include <iterator>
#include <string>
#include <vector>



// Immutable taxonomy. The constructor takes over a filled NodeStore and runs the
// ancestry indexer; it either returns a completely indexed tree or throws
// MalformedTaxonomy.
class TaxonTree {
	public:
		typedef NodeStore::const_iterator const_iterator;

		explicit TaxonTree( NodeStore&& nodes );

		const TaxonNode& getNode( TaxonID taxid ) const { return nodes_.lookupById( taxid ); };
		const TaxonNode& getNode( const std::string& name ) const { return nodes_.lookupByName( name ); };
		const TaxonNode* findNode( TaxonID taxid ) const { return nodes_.findById( taxid ); };
		const TaxonNode* findNode( const std::string& name ) const { return nodes_.findByName( name ); };
		const TaxonNode& getRoot() const { return nodes_.nodes_[ root_pos_ ]; };

		// the root is its own parent
		const TaxonNode& getParent( const TaxonNode& node ) const { return nodes_.nodes_[ node.parent_pos ]; };
		std::vector< const TaxonNode* > getChildren( const TaxonNode& node ) const;
		bool isLeaf( const TaxonNode& node ) const { return children_[ node.pos ].empty(); };

		const std::string* getRankInternal( const std::string& rankname ) const { return nodes_.getRankInternal( rankname ); };

		std::size_t size() const { return nodes_.size(); };
		large_unsigned_int getMaxDepth() const { return max_depth_; };
		const_iterator begin() const { return nodes_.begin(); };
		const_iterator end() const { return nodes_.end(); };

		// walks from a node to the root, both inclusive; the end iterator holds no node
		class PathUpIterator {
		public:
			typedef std::forward_iterator_tag iterator_category;
			typedef const TaxonNode value_type;
			typedef std::ptrdiff_t difference_type;
			typedef const TaxonNode* pointer;
			typedef const TaxonNode& reference;

			PathUpIterator() : tree_( NULL ), current_( NULL ) {};
			PathUpIterator( const TaxonTree* tree, const TaxonNode* startnode ) : tree_( tree ), current_( startnode ) {};

			reference operator*() const {
				return *current_;
			};

			pointer operator->() const {
				return current_;
			};

			bool operator==( const PathUpIterator& it ) const {
				return current_ == it.current_;
			};

			bool operator!=( const PathUpIterator& it ) const {
				return current_ != it.current_;
			};

			PathUpIterator& operator++() {
				if( current_->isRoot() ) current_ = NULL;
				else current_ = &tree_->getParent( *current_ );
				return *this;
			};

			PathUpIterator operator++( int ) {
				PathUpIterator tmp( *this );
				operator++();
				return tmp;
			};

		private:
			const TaxonTree* tree_;
			const TaxonNode* current_;
		};

		// lazy, restartable lineage of a node
		class Lineage {
		public:
			Lineage( const TaxonTree* tree, const TaxonNode* node ) : tree_( tree ), node_( node ) {};
			PathUpIterator begin() const { return PathUpIterator( tree_, node_ ); };
			PathUpIterator end() const { return PathUpIterator( tree_, NULL ); };
			std::size_t size() const { return node_->ancestry.size() + 1; };
		private:
			const TaxonTree* tree_;
			const TaxonNode* node_;
		};

		Lineage getLineage( const TaxonNode& node ) const { return Lineage( this, &node ); };

	private:
		void indexAncestry();

		NodeStore nodes_;
		std::vector< std::vector< std::size_t > > children_; //derived child index, by store position
		std::size_t root_pos_;
		large_unsigned_int max_depth_;
};



typedef TaxonTree Taxonomy;



// "1/131567/2" style persistence of an ancestry path; the root has the empty string
std::string encodeAncestry( const AncestryPath& path );
AncestryPath decodeAncestry( const std::string& encoded );

#endif // taxontree_hh_
