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

#ifndef taxonomyinterface_hh_
#define taxonomyinterface_hh_

#include <set>
#include <string>
#include <vector>
#include "types.hh"
#include "taxontree.hh"



// read-only lineage queries; every lookup of an unknown taxid or name throws TaxonNotFound
class TaxonomyInterface {
	public:
		TaxonomyInterface( const Taxonomy* taxtree );

		TaxonomyInterface( const TaxonomyInterface& taxinter ) : tax( taxinter.tax ), canonical_ranks_( taxinter.canonical_ranks_ ) {}

		const TaxonNode* getNode( const TaxonID taxid ) const;
		const TaxonNode* getNode( const std::string& name ) const;
		const TaxonNode* getRoot() const;
		const TaxonNode* getParent( const TaxonNode* node ) const;

		bool containsId( const TaxonID taxid ) const { return tax->findNode( taxid ); }
		bool containsName( const std::string& name ) const { return tax->findNode( name ); }

		TaxonID getId( const std::string& name ) const;

		const std::string& getName( const TaxonNode* node ) const;
		const std::string& getName( const TaxonID taxid ) const;

		const std::string& getRank( const TaxonNode* node ) const;
		const std::string& getRank( const TaxonID taxid ) const;

		large_unsigned_int getDepth( const TaxonNode* node ) const { return node->root_pathlength; }

		Taxonomy::Lineage getLineage( const TaxonNode* node ) const;
		Taxonomy::Lineage getLineage( const TaxonID taxid ) const;
		Taxonomy::Lineage getLineage( const std::string& name ) const;

		// true if A is an ancestor of B or A equals B
		bool isAncestorOrSelf( const TaxonNode* A, const TaxonNode* B ) const;
		bool isDescendant( const std::string& name, const std::string& ancestor_name ) const;
		bool isDescendant( const TaxonID taxid, const TaxonID ancestor_taxid ) const;

		// lowest common ancestor by longest common prefix of the extended ancestry paths
		const TaxonNode* getLCA( const TaxonNode* A, const TaxonNode* B ) const;
		const TaxonNode* getLCA( const TaxonID A_taxid, const TaxonID B_taxid ) const;
		const TaxonNode* getLCA( const std::string& A_name, const std::string& B_name ) const;

		// number of edges on the path between A and B through their LCA; with only_canonical
		// only nodes at one of the canonical ranks are counted
		large_unsigned_int getDistance( const TaxonNode* A, const TaxonNode* B, bool only_canonical = false ) const;
		large_unsigned_int getDistance( const TaxonID A_taxid, const TaxonID B_taxid, bool only_canonical = false ) const;
		large_unsigned_int getDistance( const std::string& A_name, const std::string& B_name, bool only_canonical = false ) const;

		// pre-order traversal of the subtree below node, node first
		std::vector< const TaxonNode* > getDescendants( const TaxonNode* node ) const;

		bool isLeaf( const TaxonNode* node ) const { return tax->isLeaf( *node ); }
		bool isCanonicalRank( const TaxonNode* node ) const { return canonical_ranks_.count( &node->rank ); }

	private:
		large_unsigned_int getCanonicalDepth( const TaxonNode* node ) const;

		const Taxonomy* const tax;
		std::set< const std::string* > canonical_ranks_; //internal rank strings
};

#endif // taxonomyinterface_hh_
