#include "taxonomyinterface.hh"
#include <algorithm>
#include <stack>
#include "constants.hh"
#include "exception.hh"



TaxonomyInterface::TaxonomyInterface( const Taxonomy* taxtree ) : tax( taxtree ) {
	for( std::vector< std::string >::const_iterator it = canonical_ranks.begin(); it != canonical_ranks.end(); ++it ) {
		const std::string* rank = tax->getRankInternal( *it );
		if( rank ) canonical_ranks_.insert( rank );
	}
}



const TaxonNode* TaxonomyInterface::getNode( const TaxonID taxid ) const {
	return &tax->getNode( taxid );
}



const TaxonNode* TaxonomyInterface::getNode( const std::string& name ) const {
	return &tax->getNode( name );
}



const TaxonNode* TaxonomyInterface::getRoot() const {
	return &tax->getRoot();
}



const TaxonNode* TaxonomyInterface::getParent( const TaxonNode* node ) const {
	return &tax->getParent( *node );
}



TaxonID TaxonomyInterface::getId( const std::string& name ) const {
	return getNode( name )->taxid;
}



const std::string& TaxonomyInterface::getName( const TaxonNode* node ) const {
	return node->name;
}



const std::string& TaxonomyInterface::getName( const TaxonID taxid ) const {
	return getNode( taxid )->name;
}



const std::string& TaxonomyInterface::getRank( const TaxonNode* node ) const {
	return node->rank;
}



const std::string& TaxonomyInterface::getRank( const TaxonID taxid ) const {
	return getNode( taxid )->rank;
}



Taxonomy::Lineage TaxonomyInterface::getLineage( const TaxonNode* node ) const {
	return tax->getLineage( *node );
}



Taxonomy::Lineage TaxonomyInterface::getLineage( const TaxonID taxid ) const {
	return getLineage( getNode( taxid ) );
}



Taxonomy::Lineage TaxonomyInterface::getLineage( const std::string& name ) const {
	return getLineage( getNode( name ) );
}



bool TaxonomyInterface::isAncestorOrSelf( const TaxonNode* A, const TaxonNode* B ) const {
	if( A == B ) return true;
	const AncestryPath& path = B->ancestry;
	return A->root_pathlength < path.size() && path[ A->root_pathlength ] == A->taxid;
}



bool TaxonomyInterface::isDescendant( const std::string& name, const std::string& ancestor_name ) const {
	return isAncestorOrSelf( getNode( ancestor_name ), getNode( name ) );
}



bool TaxonomyInterface::isDescendant( const TaxonID taxid, const TaxonID ancestor_taxid ) const {
	return isAncestorOrSelf( getNode( ancestor_taxid ), getNode( taxid ) );
}



const TaxonNode* TaxonomyInterface::getLCA( const TaxonNode* A, const TaxonNode* B ) const {
	// compare ancestry(A) + [A] with ancestry(B) + [B]
	const AncestryPath& a_path = A->ancestry;
	const AncestryPath& b_path = B->ancestry;
	const std::size_t a_length = a_path.size() + 1;
	const std::size_t b_length = b_path.size() + 1;
	const std::size_t length = std::min( a_length, b_length );

	std::size_t i = 0;
	TaxonID lca_taxid = 0;
	for( ; i < length; ++i ) {
		const TaxonID a_taxid = i < a_path.size() ? a_path[ i ] : A->taxid;
		const TaxonID b_taxid = i < b_path.size() ? b_path[ i ] : B->taxid;
		if( a_taxid != b_taxid ) break;
		lca_taxid = a_taxid;
	}

	if( ! i ) return getRoot(); //both paths start at the root
	return getNode( lca_taxid );
}



const TaxonNode* TaxonomyInterface::getLCA( const TaxonID A_taxid, const TaxonID B_taxid ) const {
	const TaxonNode* A = getNode( A_taxid );
	const TaxonNode* B = getNode( B_taxid );
	return getLCA( A, B );
}



const TaxonNode* TaxonomyInterface::getLCA( const std::string& A_name, const std::string& B_name ) const {
	const TaxonNode* A = getNode( A_name );
	const TaxonNode* B = getNode( B_name );
	return getLCA( A, B );
}



large_unsigned_int TaxonomyInterface::getDistance( const TaxonNode* A, const TaxonNode* B, bool only_canonical ) const {
	if( A == B ) return 0;
	const TaxonNode* lca = getLCA( A, B );
	if( only_canonical ) {
		return getCanonicalDepth( A ) + getCanonicalDepth( B ) - 2 * getCanonicalDepth( lca );
	}
	return A->root_pathlength + B->root_pathlength - 2 * lca->root_pathlength;
}



large_unsigned_int TaxonomyInterface::getDistance( const TaxonID A_taxid, const TaxonID B_taxid, bool only_canonical ) const {
	const TaxonNode* A = getNode( A_taxid );
	const TaxonNode* B = getNode( B_taxid );
	return getDistance( A, B, only_canonical );
}



large_unsigned_int TaxonomyInterface::getDistance( const std::string& A_name, const std::string& B_name, bool only_canonical ) const {
	const TaxonNode* A = getNode( A_name );
	const TaxonNode* B = getNode( B_name );
	return getDistance( A, B, only_canonical );
}



large_unsigned_int TaxonomyInterface::getCanonicalDepth( const TaxonNode* node ) const {
	if( node->isRoot() ) return 0;
	large_unsigned_int depth = isCanonicalRank( node ) ? 1 : 0;
	const AncestryPath& path = node->ancestry;
	for( AncestryPath::const_iterator it = path.begin() + 1; it != path.end(); ++it ) { //skip the root
		if( isCanonicalRank( getNode( *it ) ) ) ++depth;
	}
	return depth;
}



std::vector< const TaxonNode* > TaxonomyInterface::getDescendants( const TaxonNode* node ) const {
	std::vector< const TaxonNode* > subtree;
	std::stack< const TaxonNode* > pending;
	pending.push( node );
	while( ! pending.empty() ) {
		const TaxonNode* current = pending.top();
		pending.pop();
		subtree.push_back( current );
		const std::vector< const TaxonNode* > children = tax->getChildren( *current );
		for( std::vector< const TaxonNode* >::const_reverse_iterator it = children.rbegin(); it != children.rend(); ++it ) {
			pending.push( *it );
		}
	}
	return subtree;
}
