#include "taxonomyloader.hh"
#include <cstdlib>
#include <iostream>
#include <boost/filesystem.hpp>
#include "constants.hh"
#include "exception.hh"
#include "ncbidata.hh"
#include "taxonomydb.hh"



std::string defaultTaxonomyDBFilename() {
	const char* env = std::getenv( ENVVAR_TAXONOMY_DB.c_str() );
	if( env != NULL && *env ) return env;
	return default_taxonomy_db;
}



Taxonomy* loadTaxonomy( const TaxonomySource& source ) {
	if( ! source.taxdir.empty() ) {
		std::cerr << "Loading NCBI taxonomy dump from '" << source.taxdir << "'..." << std::flush;
		Taxonomy* tax = loadTaxonomyFromDirectory( source.taxdir, source.tax_prefix );
		std::cerr << " done (" << tax->size() << " nodes)" << std::endl;
		return tax;
	}

	const std::string db_filename = source.db_filename.empty() ? defaultTaxonomyDBFilename() : source.db_filename;
	if( ! source.db_filename.empty() || boost::filesystem::exists( db_filename ) ) {
		std::cerr << "Loading taxonomy database '" << db_filename << "'..." << std::flush;
		Taxonomy* tax = loadTaxonomyFromSQLite( db_filename );
		std::cerr << " done (" << tax->size() << " nodes)" << std::endl;
		return tax;
	}

	const char* env = std::getenv( ENVVAR_TAXONOMY_NCBI.c_str() );
	if( env != NULL && *env ) {
		std::cerr << "Loading NCBI taxonomy dump from '" << env << "'..." << std::flush;
		Taxonomy* tax = loadTaxonomyFromDirectory( env, source.tax_prefix );
		std::cerr << " done (" << tax->size() << " nodes)" << std::endl;
		return tax;
	}

	BOOST_THROW_EXCEPTION( FileNotFound{} << general_info{ "no taxonomy database or dump folder given, use --db, --taxdir or " + ENVVAR_TAXONOMY_NCBI } << file_info{ db_filename } );
}
