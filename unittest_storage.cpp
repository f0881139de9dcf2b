#define BOOST_TEST_MODULE TaxonomyDatabaseTests
#include <boost/test/unit_test.hpp>
#include <sstream>
#include <string>
#include <vector>
#include <boost/scoped_ptr.hpp>
#include "src/taxonomydb.hh"
#include "src/taxonomyinterface.hh"
#include "src/ncbidata.hh"
#include "src/exception.hh"
#include "unittest_fixtures.hh"



namespace {

std::vector< TaxonID > lineageIds( const TaxonomyInterface& taxinter, const TaxonID taxid ) {
	std::vector< TaxonID > ids;
	const Taxonomy::Lineage lineage = taxinter.getLineage( taxid );
	for( Taxonomy::PathUpIterator it = lineage.begin(); it != lineage.end(); ++it ) ids.push_back( it->taxid );
	return ids;
}

}



BOOST_FIXTURE_TEST_CASE( save_and_reload, TempDirFixture ) {
	const std::string db_filename = path( "taxonomy.sqlite3" );
	const Taxonomy original( buildSmallNodeStore() );
	saveTaxonomyToSQLite( original, db_filename );
	BOOST_CHECK_EQUAL( countTaxonomyRows( db_filename ), 5u );

	boost::scoped_ptr< Taxonomy > reloaded( loadTaxonomyFromSQLite( db_filename ) );
	BOOST_REQUIRE_EQUAL( reloaded->size(), original.size() );

	const TaxonomyInterface before( &original );
	const TaxonomyInterface after( reloaded.get() );
	for( Taxonomy::const_iterator it = original.begin(); it != original.end(); ++it ) {
		const std::vector< TaxonID > a = lineageIds( before, it->taxid );
		const std::vector< TaxonID > b = lineageIds( after, it->taxid );
		BOOST_CHECK_EQUAL_COLLECTIONS( a.begin(), a.end(), b.begin(), b.end() );
		BOOST_CHECK_EQUAL( after.getName( it->taxid ), it->name );
		BOOST_CHECK_EQUAL( after.getRank( it->taxid ), it->rank );
	}
	BOOST_CHECK( after.getRoot()->taxid == 1 );
	BOOST_CHECK_EQUAL( after.getDistance( "C", "D", true ), 3u );
}

BOOST_FIXTURE_TEST_CASE( save_needs_empty_table, TempDirFixture ) {
	const std::string db_filename = path( "taxonomy.sqlite3" );
	const Taxonomy tax( buildSmallNodeStore() );
	saveTaxonomyToSQLite( tax, db_filename );
	BOOST_CHECK_THROW( saveTaxonomyToSQLite( tax, db_filename ), DatabaseError );
	BOOST_CHECK_EQUAL( countTaxonomyRows( db_filename ), 5u );
}

BOOST_FIXTURE_TEST_CASE( malformed_dump_persists_nothing, TempDirFixture ) {
	const std::string db_filename = path( "taxonomy.sqlite3" );
	std::istringstream nodes( nodesLine( 1, 1, "no rank" ) + nodesLine( 2, 1, "superkingdom" ) + nodesLine( 3, 99, "species" ) );
	std::istringstream names( namesLine( 1, "root" ) + namesLine( 2, "Bacteria" ) + namesLine( 3, "orphan" ) );

	try {
		const Taxonomy tax( parseNCBIDump( nodes, names ) );
		saveTaxonomyToSQLite( tax, db_filename );
		BOOST_ERROR( "malformed dump saved" );
	} catch( const MalformedTaxonomy& ) {
	}
	BOOST_CHECK_EQUAL( countTaxonomyRows( db_filename ), 0u );
}

BOOST_FIXTURE_TEST_CASE( missing_database, TempDirFixture ) {
	BOOST_CHECK_THROW( loadTaxonomyFromSQLite( path( "missing.sqlite3" ) ), FileNotFound );
	BOOST_CHECK_EQUAL( countTaxonomyRows( path( "missing.sqlite3" ) ), 0u );
}
