#ifndef unittest_fixtures_hh_
#define unittest_fixtures_hh_

#include <sstream>
#include <string>
#include <utility>
#include <boost/filesystem.hpp>
#include <boost/scoped_ptr.hpp>
#include "src/nodestore.hh"
#include "src/taxontree.hh"
#include "src/taxonomyinterface.hh"



// R(1) -> A(2) -> B(3) -> C(4) and R(1) -> D(5), children inserted before their parents
inline NodeStore buildSmallNodeStore() {
	NodeStore store;
	store.insert( 4, "C", "species", TaxonID( 3 ) );
	store.insert( 3, "B", "clade", TaxonID( 2 ) );
	store.insert( 5, "D", "superkingdom", TaxonID( 1 ) );
	store.insert( 2, "A", "superkingdom", TaxonID( 1 ) );
	store.insert( 1, "R", "no rank", boost::none );
	return store;
}



// runs the ancestry indexer and drops the result
inline std::size_t indexNodeStore( NodeStore&& store ) {
	const Taxonomy tax( std::move( store ) );
	return tax.size();
}



struct SmallTaxonomyFixture {
	SmallTaxonomyFixture() : tax( new Taxonomy( buildSmallNodeStore() ) ), taxinter( tax.get() ) {}

	const TaxonNode* node( const std::string& name ) const { return taxinter.getNode( name ); }

	boost::scoped_ptr< Taxonomy > tax;
	TaxonomyInterface taxinter;
};



// NCBI dump lines
inline std::string nodesLine( TaxonID taxid, TaxonID parent_taxid, const std::string& rank ) {
	std::ostringstream line;
	line << taxid << "\t|\t" << parent_taxid << "\t|\t" << rank << "\t|\t\t|\t0\t|\t1\t|\t11\t|\t1\t|\t0\t|\t1\t|\t0\t|\t0\t|\t\t|\n";
	return line.str();
}

inline std::string namesLine( TaxonID taxid, const std::string& name, const std::string& unique_name = "", const std::string& name_class = "scientific name" ) {
	std::ostringstream line;
	line << taxid << "\t|\t" << name << "\t|\t" << unique_name << "\t|\t" << name_class << "\t|\n";
	return line.str();
}



// fresh directory below the system temp folder, removed with the fixture
struct TempDirFixture {
	TempDirFixture() : dir( boost::filesystem::temp_directory_path() / boost::filesystem::unique_path( "taxfilter-test-%%%%-%%%%" ) ) {
		boost::filesystem::create_directories( dir );
	}

	~TempDirFixture() {
		boost::system::error_code ec;
		boost::filesystem::remove_all( dir, ec );
	}

	std::string path( const std::string& filename ) const { return ( dir / filename ).string(); }

	boost::filesystem::path dir;
};

#endif // unittest_fixtures_hh_
