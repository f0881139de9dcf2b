#include <cstdlib>
#include <fstream>
#include <iostream>
#include <unordered_map>
#include <vector>
#include <string>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "utils.hh"
#include "ncbidata.hh"
#include "constants.hh"
#include "exception.hh"



namespace {

struct DumpNode {
    TaxonID taxid;
    TaxonID parent_taxid;
    std::string rank;
};

// the last column of a dump line still carries the "\t|" row terminator
void stripRowTerminator( std::string& field ) {
    if( boost::ends_with( field, "\t|" ) ) field.resize( field.size() - 2 );
}

TaxonID parseTaxonID( const std::string& field, const std::string& filename, const uint line_num ) {
    try {
        return boost::lexical_cast< TaxonID >( field );
    } catch( const boost::bad_lexical_cast& ) {
        BOOST_THROW_EXCEPTION( ParsingError{} << general_info{ "could not parse taxonomic ID '" + field + "'" } << file_info{ filename } << line_info{ line_num } );
    }
}

}



NodeStore parseNCBIDump( std::istream& nodesfile, std::istream& namesfile, const std::string& nodes_name, const std::string& names_name ) {
    std::vector< DumpNode > dumpnodes;
    std::unordered_map< TaxonID, std::string > scientific_names;
    std::string line;

    // process nodes.dmp
    {
        std::vector< std::string > fields;
        uint line_num = 0;
        while( std::getline( nodesfile, line ) ) {
            ++line_num;
            if( line.empty() ) continue;
            fields.clear();
            tokenizeMultiCharDelim( line, fields, ncbi_dump_field_separator, 3 );
            if( fields.size() < 3 ) BOOST_THROW_EXCEPTION( ParsingError{} << general_info{ "too few columns" } << file_info{ nodes_name } << line_info{ line_num } );

            DumpNode node;
            node.taxid = parseTaxonID( fields[ 0 ], nodes_name, line_num );
            node.parent_taxid = parseTaxonID( fields[ 1 ], nodes_name, line_num );
            node.rank = fields[ 2 ];
            stripRowTerminator( node.rank );
            dumpnodes.push_back( node );
        }
        if( nodesfile.bad() ) BOOST_THROW_EXCEPTION( FileError{} << file_info{ nodes_name } );
    }

    // process names.dmp
    {
        std::vector< std::string > fields;
        uint line_num = 0;
        while( std::getline( namesfile, line ) ) {
            ++line_num;
            if( line.empty() ) continue;
            fields.clear();
            tokenizeMultiCharDelim( line, fields, ncbi_dump_field_separator, 3 );
            if( fields.size() < 4 ) BOOST_THROW_EXCEPTION( ParsingError{} << general_info{ "too few columns" } << file_info{ names_name } << line_info{ line_num } );
            stripRowTerminator( fields[ 3 ] );
            if( fields[ 3 ] == "scientific name" ) {
                const TaxonID taxid = parseTaxonID( fields[ 0 ], names_name, line_num );
                scientific_names[ taxid ] = fields[ 2 ].empty() ? fields[ 1 ] : fields[ 2 ]; // unique name if homonyms exist
            }
        }
        if( namesfile.bad() ) BOOST_THROW_EXCEPTION( FileError{} << file_info{ names_name } );
    }

    NodeStore store;
    for( std::vector< DumpNode >::const_iterator it = dumpnodes.begin(); it != dumpnodes.end(); ++it ) {
        std::unordered_map< TaxonID, std::string >::const_iterator name_it = scientific_names.find( it->taxid );
        if( name_it == scientific_names.end() ) {
            BOOST_THROW_EXCEPTION( ParsingError{} << general_info{ "no scientific name for taxon" } << taxid_info{ it->taxid } << file_info{ names_name } );
        }

        boost::optional< TaxonID > parent_taxid;
        if( it->parent_taxid != it->taxid ) parent_taxid = it->parent_taxid;
        store.insert( it->taxid, name_it->second, it->rank, parent_taxid );
    }

    return store;
}



Taxonomy* parseNCBIFlatFiles( const std::string& nodes_filename, const std::string& names_filename ) {
    std::ifstream nodesfile( nodes_filename.c_str() );
    if( ! nodesfile ) BOOST_THROW_EXCEPTION( FileError{} << file_info{ nodes_filename } );
    std::ifstream namesfile( names_filename.c_str() );
    if( ! namesfile ) BOOST_THROW_EXCEPTION( FileError{} << file_info{ names_filename } );

    return new Taxonomy( parseNCBIDump( nodesfile, namesfile, nodes_filename, names_filename ) );
}



Taxonomy* loadTaxonomyFromDirectory( const std::string& ncbi_root_folder, const std::string& prefix ) {
    const boost::filesystem::path root( ncbi_root_folder );
    const std::string nodes_filename = ( root / ( prefix + "nodes.dmp" ) ).string();
    const std::string names_filename = ( root / ( prefix + "names.dmp" ) ).string();

    if( ! boost::filesystem::exists( nodes_filename ) ) BOOST_THROW_EXCEPTION( FileNotFound{} << file_info{ nodes_filename } );
    if( ! boost::filesystem::exists( names_filename ) ) BOOST_THROW_EXCEPTION( FileNotFound{} << file_info{ names_filename } );

    return parseNCBIFlatFiles( nodes_filename, names_filename );
}



Taxonomy* loadTaxonomyFromEnvironment( const std::string& prefix ) {
    const char* env = std::getenv( ENVVAR_TAXONOMY_NCBI.c_str() );
    if( env == NULL ) {
        std::cerr << "Specify the folder containing the NCBI taxonomy dump files as " << ENVVAR_TAXONOMY_NCBI << " environment variable" << std::endl;
        return NULL;
    }
    return loadTaxonomyFromDirectory( env, prefix );
}
