#include "accessconv.hh"
#include <fstream>
#include <list>
#include <vector>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "constants.hh"
#include "exception.hh"
#include "utils.hh"



namespace {

bool hasAnyPrefix( const std::string& str, const std::vector< std::string >& prefixes ) {
    for( std::vector< std::string >::const_iterator it = prefixes.begin(); it != prefixes.end(); ++it ) {
        if( boost::starts_with( str, *it ) ) return true;
    }
    return false;
}

std::string stripVersion( const std::string& acc ) {
    const std::string::size_type pos = acc.rfind( '.' );
    if( pos == std::string::npos ) return acc;
    return acc.substr( 0, pos );
}

}



AccessionClass classifyAccession( const std::string& accession ) {
    if( hasAnyPrefix( accession, curated_accession_prefixes ) ) return AccessionClass::curated;
    if( hasAnyPrefix( accession, predicted_accession_prefixes ) ) return AccessionClass::predicted;
    return AccessionClass::other;
}



std::string extractAccession( const std::string& header ) {
    const std::string id = firstWord( header );
    if( id.find( '|' ) == std::string::npos ) return id;

    std::list< std::string > fields;
    tokenizeSingleCharDelim( id, fields, "|" );  // NCBI scheme

    std::list< std::string >::const_iterator field_it = fields.begin();
    while( field_it != fields.end() ) {
        if( *field_it++ == "ref" ) break;
    }
    if( field_it != fields.end() && ! field_it->empty() ) return *field_it;

    for( std::list< std::string >::const_reverse_iterator it = fields.rbegin(); it != fields.rend(); ++it ) {
        if( ! it->empty() ) return *it;
    }
    return id;
}



std::string extractBracketedName( const std::string& header ) {
    const std::string::size_type stop = header.rfind( ']' );
    if( stop == std::string::npos ) return std::string();
    const std::string::size_type start = header.rfind( '[', stop );
    if( start == std::string::npos ) return std::string();
    return header.substr( start + 1, stop - start - 1 );
}



StrIDConverterFlatfileMemory::StrIDConverterFlatfileMemory( const std::string& flatfile_filename ) : filename_( flatfile_filename ) {
    std::ifstream flatfile( flatfile_filename.c_str() );
    if( ! flatfile ) BOOST_THROW_EXCEPTION( FileError{} << file_info{ flatfile_filename } );
    parse( flatfile );
}



StrIDConverterFlatfileMemory::StrIDConverterFlatfileMemory( std::istream& flatfile, const std::string& name ) : filename_( name ) {
    parse( flatfile );
}



TaxonID StrIDConverterFlatfileMemory::operator[]( const std::string& acc ) const {
    const TaxonID* taxid = find( acc );
    if( ! taxid ) BOOST_THROW_EXCEPTION( TaxonMappingNotFound{} << seqid_info{ acc } << file_info{ filename_ } );
    return *taxid;
}



bool StrIDConverterFlatfileMemory::contains( const std::string& acc ) const {
    return find( acc );
}



const TaxonID* StrIDConverterFlatfileMemory::find( const std::string& acc ) const {
    std::unordered_map< std::string, TaxonID >::const_iterator it = accessidconv_.find( acc );
    if( it == accessidconv_.end() ) it = accessidconv_.find( stripVersion( acc ) );
    if( it == accessidconv_.end() ) return NULL;
    return &it->second;
}



void StrIDConverterFlatfileMemory::parse( std::istream& flatfile ) {
    std::vector< std::string > fields;
    std::string line;
    uint line_num = 0;
    bool ncbi_format = false;

    while( std::getline( flatfile, line ) ) {
        ++line_num;
        if( ignoreLine( line ) ) continue;

        if( line_num == 1 && boost::starts_with( line, "accession" + default_field_separator + "accession.version" ) ) {
            ncbi_format = true;
            continue;
        }

        fields.clear();
        tokenizeSingleCharDelim( line, fields, default_field_separator, ncbi_format ? 3 : 2 );
        const std::size_t taxid_field = ncbi_format ? 2 : 1;
        if( fields.size() <= taxid_field ) BOOST_THROW_EXCEPTION( ParsingError{} << file_info{ filename_ } << line_info{ line_num } );

        try {
            const TaxonID taxid = boost::lexical_cast< TaxonID >( fields[ taxid_field ] );
            accessidconv_[ fields[ 0 ] ] = taxid;
            if( ncbi_format ) accessidconv_[ fields[ 1 ] ] = taxid;
        } catch( const boost::bad_lexical_cast& ) {
            BOOST_THROW_EXCEPTION( ParsingError{} << general_info{ "could not parse taxonomic ID '" + fields[ taxid_field ] + "'" } << file_info{ filename_ } << line_info{ line_num } );
        }
    }
}



StrIDConverter* loadStrIDConverterFromFile( const std::string& filename ) {
    if( ! boost::filesystem::exists( filename ) ) BOOST_THROW_EXCEPTION( FileNotFound{} << file_info{ filename } );
    return new StrIDConverterFlatfileMemory( filename );
}
