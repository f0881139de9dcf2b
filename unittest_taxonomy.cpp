#define BOOST_TEST_MODULE TaxonomyTests
#include <boost/test/unit_test.hpp>
#include <algorithm>
#include <string>
#include <vector>
#include "src/nodestore.hh"
#include "src/taxontree.hh"
#include "src/taxonomyinterface.hh"
#include "src/descendantfilter.hh"
#include "src/lineageformat.hh"
#include "src/exception.hh"
#include "unittest_fixtures.hh"



namespace {

std::vector< TaxonID > lineageIds( const Taxonomy::Lineage& lineage ) {
	std::vector< TaxonID > ids;
	for( Taxonomy::PathUpIterator it = lineage.begin(); it != lineage.end(); ++it ) ids.push_back( it->taxid );
	return ids;
}

}



BOOST_AUTO_TEST_SUITE( node_store )

BOOST_AUTO_TEST_CASE( lookup_by_id_and_name ) {
	const NodeStore store = buildSmallNodeStore();
	BOOST_CHECK_EQUAL( store.size(), 5u );
	BOOST_CHECK_EQUAL( store.lookupById( 4 ).name, "C" );
	BOOST_CHECK_EQUAL( store.lookupByName( "B" ).taxid, 3u );
	BOOST_CHECK_EQUAL( store.lookupByName( "C" ).rank, "species" );
	BOOST_CHECK( store.findById( 42 ) == NULL );
	BOOST_CHECK( store.findByName( "Z" ) == NULL );
	BOOST_CHECK_THROW( store.lookupById( 42 ), TaxonNotFound );
	BOOST_CHECK_THROW( store.lookupByName( "Z" ), TaxonNotFound );
	BOOST_CHECK( store.lookupById( 1 ).isRoot() );
	BOOST_CHECK( ! store.lookupById( 2 ).isRoot() );
}

BOOST_AUTO_TEST_CASE( duplicate_name_leaves_store_unchanged ) {
	NodeStore store = buildSmallNodeStore();
	BOOST_CHECK_THROW( store.insert( 6, "B", "species", TaxonID( 1 ) ), DuplicateName );
	BOOST_CHECK_EQUAL( store.size(), 5u );
	BOOST_CHECK( ! store.containsId( 6 ) );
	BOOST_CHECK_EQUAL( store.lookupByName( "B" ).taxid, 3u );
}

BOOST_AUTO_TEST_CASE( duplicate_id_leaves_store_unchanged ) {
	NodeStore store = buildSmallNodeStore();
	BOOST_CHECK_THROW( store.insert( 3, "E", "species", TaxonID( 1 ) ), DuplicateId );
	BOOST_CHECK_EQUAL( store.size(), 5u );
	BOOST_CHECK( ! store.containsName( "E" ) );
}

BOOST_AUTO_TEST_CASE( ranks_are_shared ) {
	const NodeStore store = buildSmallNodeStore();
	BOOST_CHECK( &store.lookupByName( "A" ).rank == &store.lookupByName( "D" ).rank );
	BOOST_REQUIRE( store.getRankInternal( "superkingdom" ) != NULL );
	BOOST_CHECK( store.getRankInternal( "genus" ) == NULL );
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE( ancestry_indexer )

BOOST_FIXTURE_TEST_CASE( paths_and_depths, SmallTaxonomyFixture ) {
	const TaxonID c_path[] = { 1, 2, 3 };
	const AncestryPath& path = node( "C" )->ancestry;
	BOOST_CHECK_EQUAL_COLLECTIONS( path.begin(), path.end(), c_path, c_path + 3 );
	BOOST_CHECK_EQUAL( taxinter.getDepth( node( "C" ) ), 3u );
	BOOST_CHECK_EQUAL( taxinter.getDepth( node( "D" ) ), 1u );
	BOOST_CHECK( node( "R" )->ancestry.empty() );
	BOOST_CHECK_EQUAL( tax->getMaxDepth(), 3u );
	BOOST_CHECK( taxinter.getRoot() == node( "R" ) );
	BOOST_CHECK( taxinter.getParent( node( "R" ) ) == node( "R" ) );
	BOOST_CHECK( taxinter.getParent( node( "C" ) ) == node( "B" ) );
}

BOOST_FIXTURE_TEST_CASE( child_index, SmallTaxonomyFixture ) {
	const std::vector< const TaxonNode* > children = tax->getChildren( *node( "R" ) );
	BOOST_REQUIRE_EQUAL( children.size(), 2u );
	BOOST_CHECK( std::find( children.begin(), children.end(), node( "A" ) ) != children.end() );
	BOOST_CHECK( std::find( children.begin(), children.end(), node( "D" ) ) != children.end() );
	BOOST_CHECK( taxinter.isLeaf( node( "C" ) ) );
	BOOST_CHECK( ! taxinter.isLeaf( node( "A" ) ) );
}

BOOST_AUTO_TEST_CASE( dangling_parent_is_malformed ) {
	NodeStore store = buildSmallNodeStore();
	store.insert( 7, "orphan", "species", TaxonID( 99 ) );
	try {
		indexNodeStore( std::move( store ) );
		BOOST_ERROR( "dangling parent accepted" );
	} catch( const MalformedTaxonomy& e ) {
		const TaxonID* taxid = boost::get_error_info< taxid_info >( e );
		BOOST_REQUIRE( taxid );
		BOOST_CHECK_EQUAL( *taxid, 7u );
	}
}

BOOST_AUTO_TEST_CASE( cycle_is_malformed ) {
	NodeStore store;
	store.insert( 1, "R", "no rank", boost::none );
	store.insert( 2, "X", "genus", TaxonID( 3 ) );
	store.insert( 3, "Y", "genus", TaxonID( 2 ) );
	BOOST_CHECK_THROW( indexNodeStore( std::move( store ) ), MalformedTaxonomy );
}

BOOST_AUTO_TEST_CASE( exactly_one_root ) {
	NodeStore no_root;
	no_root.insert( 2, "X", "genus", TaxonID( 3 ) );
	no_root.insert( 3, "Y", "genus", TaxonID( 2 ) );
	BOOST_CHECK_THROW( indexNodeStore( std::move( no_root ) ), MalformedTaxonomy );

	NodeStore two_roots;
	two_roots.insert( 1, "R", "no rank", boost::none );
	two_roots.insert( 2, "S", "no rank", boost::none );
	BOOST_CHECK_THROW( indexNodeStore( std::move( two_roots ) ), MalformedTaxonomy );
}

BOOST_AUTO_TEST_CASE( ancestry_encoding ) {
	AncestryPath path;
	path.push_back( 1 );
	path.push_back( 131567 );
	path.push_back( 2 );
	BOOST_CHECK_EQUAL( encodeAncestry( path ), "1/131567/2" );
	BOOST_CHECK_EQUAL( encodeAncestry( AncestryPath() ), "" );

	const AncestryPath decoded = decodeAncestry( "1/131567/2" );
	BOOST_CHECK_EQUAL_COLLECTIONS( decoded.begin(), decoded.end(), path.begin(), path.end() );
	BOOST_CHECK( decodeAncestry( "" ).empty() );
	BOOST_CHECK_THROW( decodeAncestry( "1/x/2" ), ParsingError );
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE( lineage_queries )

BOOST_FIXTURE_TEST_CASE( lineage_runs_to_root, SmallTaxonomyFixture ) {
	const Taxonomy::Lineage lineage = taxinter.getLineage( "C" );
	const TaxonID expected[] = { 4, 3, 2, 1 };
	const std::vector< TaxonID > ids = lineageIds( lineage );
	BOOST_CHECK_EQUAL_COLLECTIONS( ids.begin(), ids.end(), expected, expected + 4 );
	BOOST_CHECK_EQUAL( lineage.size(), 4u );

	// restartable
	const std::vector< TaxonID > again = lineageIds( lineage );
	BOOST_CHECK_EQUAL_COLLECTIONS( again.begin(), again.end(), expected, expected + 4 );

	BOOST_CHECK_EQUAL( lineageIds( taxinter.getLineage( 1 ) ).size(), 1u );
}

BOOST_FIXTURE_TEST_CASE( lineage_length_matches_depth, SmallTaxonomyFixture ) {
	for( Taxonomy::const_iterator it = tax->begin(); it != tax->end(); ++it ) {
		const std::vector< TaxonID > ids = lineageIds( taxinter.getLineage( &*it ) );
		BOOST_CHECK_EQUAL( ids.size(), taxinter.getDepth( &*it ) + 1 );
		BOOST_CHECK_EQUAL( ids.back(), 1u );
	}
}

BOOST_FIXTURE_TEST_CASE( common_ancestor, SmallTaxonomyFixture ) {
	BOOST_CHECK( taxinter.getLCA( node( "C" ), node( "D" ) ) == node( "R" ) );
	BOOST_CHECK( taxinter.getLCA( node( "B" ), node( "C" ) ) == node( "B" ) );
	BOOST_CHECK( taxinter.getLCA( node( "C" ), node( "B" ) ) == node( "B" ) );
	BOOST_CHECK( taxinter.getLCA( node( "C" ), node( "C" ) ) == node( "C" ) );
	BOOST_CHECK( taxinter.getLCA( 4, 2 ) == node( "A" ) );
	BOOST_CHECK( taxinter.getLCA( "D", "R" ) == node( "R" ) );
}

BOOST_FIXTURE_TEST_CASE( common_ancestor_is_lowest, SmallTaxonomyFixture ) {
	for( Taxonomy::const_iterator a = tax->begin(); a != tax->end(); ++a ) {
		for( Taxonomy::const_iterator b = tax->begin(); b != tax->end(); ++b ) {
			const TaxonNode* lca = taxinter.getLCA( &*a, &*b );
			BOOST_CHECK( taxinter.isAncestorOrSelf( lca, &*a ) );
			BOOST_CHECK( taxinter.isAncestorOrSelf( lca, &*b ) );
			const std::vector< const TaxonNode* > children = tax->getChildren( *lca );
			for( std::vector< const TaxonNode* >::const_iterator child = children.begin(); child != children.end(); ++child ) {
				BOOST_CHECK( ! ( taxinter.isAncestorOrSelf( *child, &*a ) && taxinter.isAncestorOrSelf( *child, &*b ) ) );
			}
		}
	}
}

BOOST_FIXTURE_TEST_CASE( distance, SmallTaxonomyFixture ) {
	BOOST_CHECK_EQUAL( taxinter.getDistance( "C", "D" ), 4u );
	BOOST_CHECK_EQUAL( taxinter.getDistance( "C", "R" ), 3u );
	BOOST_CHECK_EQUAL( taxinter.getDistance( "C", "B" ), 1u );
	BOOST_CHECK_EQUAL( taxinter.getDistance( "A", "D" ), 2u );
	BOOST_CHECK_EQUAL( taxinter.getDistance( 4, 5 ), 4u );

	for( Taxonomy::const_iterator a = tax->begin(); a != tax->end(); ++a ) {
		BOOST_CHECK_EQUAL( taxinter.getDistance( &*a, &*a ), 0u );
		for( Taxonomy::const_iterator b = tax->begin(); b != tax->end(); ++b ) {
			BOOST_CHECK_EQUAL( taxinter.getDistance( &*a, &*b ), taxinter.getDistance( &*b, &*a ) );
		}
	}
}

BOOST_FIXTURE_TEST_CASE( canonical_distance_skips_other_ranks, SmallTaxonomyFixture ) {
	// B has rank "clade" and is not counted
	BOOST_CHECK_EQUAL( taxinter.getDistance( "C", "D", true ), 3u );
	BOOST_CHECK_EQUAL( taxinter.getDistance( "C", "A", true ), 1u );
	BOOST_CHECK_EQUAL( taxinter.getDistance( "C", "C", true ), 0u );
	BOOST_CHECK( taxinter.isCanonicalRank( node( "C" ) ) );
	BOOST_CHECK( ! taxinter.isCanonicalRank( node( "B" ) ) );
}

BOOST_FIXTURE_TEST_CASE( names_and_ids, SmallTaxonomyFixture ) {
	BOOST_CHECK_EQUAL( taxinter.getId( "D" ), 5u );
	BOOST_CHECK_EQUAL( taxinter.getName( 3 ), "B" );
	BOOST_CHECK_EQUAL( taxinter.getRank( 4 ), "species" );
	BOOST_CHECK( taxinter.containsId( 2 ) );
	BOOST_CHECK( ! taxinter.containsName( "Z" ) );
	BOOST_CHECK_THROW( taxinter.getId( "Z" ), TaxonNotFound );
	BOOST_CHECK_THROW( taxinter.getName( 42 ), TaxonNotFound );
	BOOST_CHECK_THROW( taxinter.getDistance( "C", "Z" ), TaxonNotFound );
	BOOST_CHECK_THROW( taxinter.getLCA( 4, 42 ), TaxonNotFound );
}

BOOST_FIXTURE_TEST_CASE( descendant_checks, SmallTaxonomyFixture ) {
	BOOST_CHECK( taxinter.isDescendant( "C", "A" ) );
	BOOST_CHECK( taxinter.isDescendant( "C", "C" ) );
	BOOST_CHECK( ! taxinter.isDescendant( "A", "C" ) );
	BOOST_CHECK( ! taxinter.isDescendant( "C", "D" ) );
	BOOST_CHECK( taxinter.isDescendant( 5, 1 ) );
	BOOST_CHECK_THROW( taxinter.isDescendant( 42, 1 ), TaxonNotFound );
}

BOOST_FIXTURE_TEST_CASE( descendants_in_preorder, SmallTaxonomyFixture ) {
	const std::vector< const TaxonNode* > subtree = taxinter.getDescendants( node( "A" ) );
	BOOST_REQUIRE_EQUAL( subtree.size(), 3u );
	BOOST_CHECK( subtree[ 0 ] == node( "A" ) );
	BOOST_CHECK( subtree[ 1 ] == node( "B" ) );
	BOOST_CHECK( subtree[ 2 ] == node( "C" ) );
	BOOST_CHECK_EQUAL( taxinter.getDescendants( taxinter.getRoot() ).size(), tax->size() );
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE( descendant_filter )

BOOST_FIXTURE_TEST_CASE( subtree_membership, SmallTaxonomyFixture ) {
	const DescendantFilter filter( taxinter, "A" );
	BOOST_CHECK( filter( node( "A" ) ) );
	BOOST_CHECK( filter( node( "B" ) ) );
	BOOST_CHECK( filter( node( "C" ) ) );
	BOOST_CHECK( ! filter( node( "D" ) ) );
	BOOST_CHECK( ! filter( node( "R" ) ) );
	BOOST_CHECK( filter( TaxonID( 4 ) ) );
	BOOST_CHECK_THROW( filter( TaxonID( 42 ) ), TaxonNotFound );
	BOOST_CHECK( filter.getAncestor() == node( "A" ) );
}

BOOST_FIXTURE_TEST_CASE( every_node_is_its_own_descendant, SmallTaxonomyFixture ) {
	for( Taxonomy::const_iterator it = tax->begin(); it != tax->end(); ++it ) {
		const DescendantFilter filter( taxinter, it->taxid );
		BOOST_CHECK( filter( &*it ) );
	}
}

BOOST_FIXTURE_TEST_CASE( root_accepts_everything, SmallTaxonomyFixture ) {
	const DescendantFilter filter( taxinter, TaxonID( 1 ) );
	for( Taxonomy::const_iterator it = tax->begin(); it != tax->end(); ++it ) BOOST_CHECK( filter( &*it ) );
}

BOOST_FIXTURE_TEST_CASE( unknown_ancestor_fails_early, SmallTaxonomyFixture ) {
	BOOST_CHECK_THROW( DescendantFilter( taxinter, "Z" ), TaxonNotFound );
	BOOST_CHECK_THROW( DescendantFilter( taxinter, TaxonID( 42 ) ), TaxonNotFound );
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE( lineage_output )

BOOST_FIXTURE_TEST_CASE( lineage_ids_and_names, SmallTaxonomyFixture ) {
	BOOST_CHECK_EQUAL( formatLineage( taxinter, node( "C" ), false, ";" ), "4;3;2;1" );
	BOOST_CHECK_EQUAL( formatLineage( taxinter, node( "C" ), true, " > " ), "C (4) > B (3) > A (2) > R (1)" );
	BOOST_CHECK_EQUAL( formatLineage( taxinter, node( "R" ), true, ";" ), "R (1)" );
}

BOOST_FIXTURE_TEST_CASE( distance_and_common_ancestor, SmallTaxonomyFixture ) {
	BOOST_CHECK_EQUAL( formatCommonAncestorDistance( taxinter, node( "C" ), node( "D" ), false ), "4\tR" );
	BOOST_CHECK_EQUAL( formatCommonAncestorDistance( taxinter, node( "C" ), node( "D" ), true ), "3\tR" );
	BOOST_CHECK_EQUAL( formatCommonAncestorDistance( taxinter, node( "C" ), node( "B" ), false ), "1\tB" );
	BOOST_CHECK_THROW( taxinter.getNode( "Z" ), TaxonNotFound );
}

BOOST_AUTO_TEST_SUITE_END()
