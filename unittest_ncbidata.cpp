#define BOOST_TEST_MODULE NCBIDumpTests
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <sstream>
#include <string>
#include <boost/scoped_ptr.hpp>
#include "src/ncbidata.hh"
#include "src/taxonomyinterface.hh"
#include "src/exception.hh"
#include "unittest_fixtures.hh"



namespace {

std::string smallNodes() {
	return nodesLine( 1, 1, "no rank" ) + nodesLine( 2, 1, "superkingdom" ) + nodesLine( 3, 2, "clade" ) + nodesLine( 4, 3, "species" ) + nodesLine( 5, 1, "superkingdom" );
}

std::string smallNames() {
	return namesLine( 1, "root" )
		+ namesLine( 1, "all", "", "synonym" )
		+ namesLine( 2, "Bacteria", "Bacteria <bacteria>" )
		+ namesLine( 2, "eubacteria", "", "genbank common name" )
		+ namesLine( 3, "Pseudomonadota" )
		+ namesLine( 4, "Escherichia coli" )
		+ namesLine( 5, "Viruses" );
}

void writeFile( const std::string& filename, const std::string& content ) {
	std::ofstream file( filename.c_str() );
	file << content;
}

}



BOOST_AUTO_TEST_CASE( parse_small_dump ) {
	std::istringstream nodes( smallNodes() );
	std::istringstream names( smallNames() );
	const NodeStore store = parseNCBIDump( nodes, names );

	BOOST_CHECK_EQUAL( store.size(), 5u );
	BOOST_CHECK( store.lookupById( 1 ).isRoot() );
	BOOST_CHECK_EQUAL( store.lookupById( 1 ).name, "root" );
	BOOST_CHECK_EQUAL( store.lookupById( 4 ).name, "Escherichia coli" );
	BOOST_CHECK_EQUAL( store.lookupById( 4 ).rank, "species" );
	BOOST_CHECK_EQUAL( *store.lookupById( 4 ).parent_taxid, 3u );
	BOOST_CHECK_EQUAL( store.lookupById( 2 ).name, "Bacteria <bacteria>" ); // unique name column
	BOOST_CHECK( ! store.containsName( "eubacteria" ) );
	BOOST_CHECK( ! store.containsName( "all" ) );
}

BOOST_AUTO_TEST_CASE( indexed_dump_answers_queries ) {
	std::istringstream nodes( smallNodes() );
	std::istringstream names( smallNames() );
	const Taxonomy tax( parseNCBIDump( nodes, names ) );
	const TaxonomyInterface taxinter( &tax );

	BOOST_CHECK( taxinter.isDescendant( "Escherichia coli", "Bacteria <bacteria>" ) );
	BOOST_CHECK_EQUAL( taxinter.getLCA( "Escherichia coli", "Viruses" )->name, "root" );
	BOOST_CHECK_EQUAL( taxinter.getDistance( "Escherichia coli", "Viruses" ), 4u );
}

BOOST_AUTO_TEST_CASE( dangling_parent ) {
	std::istringstream nodes( smallNodes() + nodesLine( 6, 99, "species" ) );
	std::istringstream names( smallNames() + namesLine( 6, "orphan" ) );
	BOOST_CHECK_THROW( indexNodeStore( parseNCBIDump( nodes, names ) ), MalformedTaxonomy );
}

BOOST_AUTO_TEST_CASE( duplicate_scientific_names ) {
	std::istringstream nodes( smallNodes() + nodesLine( 6, 1, "superkingdom" ) );
	std::istringstream names( smallNames() + namesLine( 6, "Viruses" ) );
	BOOST_CHECK_THROW( parseNCBIDump( nodes, names ), DuplicateName );
}

BOOST_AUTO_TEST_CASE( missing_scientific_name ) {
	std::istringstream nodes( smallNodes() + nodesLine( 6, 1, "superkingdom" ) );
	std::istringstream names( smallNames() + namesLine( 6, "something", "", "synonym" ) );
	BOOST_CHECK_THROW( parseNCBIDump( nodes, names ), ParsingError );
}

BOOST_AUTO_TEST_CASE( bad_taxid ) {
	std::istringstream nodes( smallNodes() + "x\t|\t1\t|\tspecies\t|\n" );
	std::istringstream names( smallNames() );
	try {
		parseNCBIDump( nodes, names );
		BOOST_ERROR( "bad taxid accepted" );
	} catch( const ParsingError& e ) {
		const uint* line = boost::get_error_info< line_info >( e );
		BOOST_REQUIRE( line );
		BOOST_CHECK_EQUAL( *line, 6u );
	}
}

BOOST_FIXTURE_TEST_CASE( load_from_directory_with_prefix, TempDirFixture ) {
	writeFile( path( "test_nodes.dmp" ), smallNodes() );
	writeFile( path( "test_names.dmp" ), smallNames() );

	boost::scoped_ptr< Taxonomy > tax( loadTaxonomyFromDirectory( dir.string(), "test_" ) );
	BOOST_CHECK_EQUAL( tax->size(), 5u );
	BOOST_CHECK_EQUAL( tax->getMaxDepth(), 3u );

	BOOST_CHECK_THROW( loadTaxonomyFromDirectory( dir.string() ), FileNotFound );
}
