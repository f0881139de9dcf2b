#include "classificationreport.hh"
#include <fstream>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "constants.hh"
#include "exception.hh"
#include "utils.hh"



std::string normalizeReadId( const std::string& header ) {
    std::string id = firstWord( header );
    if( boost::ends_with( id, "/1" ) || boost::ends_with( id, "/2" ) ) id.resize( id.size() - 2 );
    return id;
}



ClassificationReport::ClassificationReport( const std::string& filename, const ReportFormat format, const DescendantFilter& filter ) :
    format_( format ),
    filter_( filter ),
    filename_( filename ),
    line_num_( 0 ) {
    if( ! boost::filesystem::exists( filename ) ) BOOST_THROW_EXCEPTION( FileNotFound{} << file_info{ filename } );
    std::ifstream report( filename.c_str() );
    if( ! report ) BOOST_THROW_EXCEPTION( FileError{} << file_info{ filename } );
    parse( report );
}



ClassificationReport::ClassificationReport( std::istream& report, const ReportFormat format, const DescendantFilter& filter, const std::string& name ) :
    format_( format ),
    filter_( filter ),
    filename_( name ),
    line_num_( 0 ) {
    parse( report );
}



const ReadAssignment* ClassificationReport::find( const std::string& read_id ) const {
    std::unordered_map< std::string, ReadAssignment >::const_iterator it = reads_.find( normalizeReadId( read_id ) );
    if( it == reads_.end() ) return NULL;
    return &it->second;
}



void ClassificationReport::parse( std::istream& report ) {
    std::string line;
    std::vector< std::string > fields;
    while( std::getline( report, line ) ) {
        ++line_num_;
        if( line.empty() ) continue;
        fields.clear();
        if( format_ == ReportFormat::kraken2 ) {
            tokenizeSingleCharDelim( line, fields, default_field_separator, 3 );
            addKraken2Entry( fields );
        } else {
            if( boost::starts_with( line, "readID" ) ) continue; // header
            tokenizeSingleCharDelim( line, fields, default_field_separator, 4 );
            addCentrifugeEntry( fields );
        }
        ++stats_.entries;
    }
    if( report.bad() ) BOOST_THROW_EXCEPTION( FileError{} << file_info{ filename_ } << line_info{ line_num_ } );
}



// C|U <tab> read id <tab> taxid or "name (taxid N)" <tab> ...
void ClassificationReport::addKraken2Entry( const std::vector< std::string >& fields ) {
    if( fields.size() < 3 || ( fields[ 0 ] != "C" && fields[ 0 ] != "U" ) ) {
        BOOST_THROW_EXCEPTION( ParsingError{} << general_info{ "not a Kraken2 output line" } << file_info{ filename_ } << line_info{ line_num_ } );
    }

    const bool classified = fields[ 0 ] == "C";
    const TaxonID taxid = classified ? parseTaxonID( fields[ 2 ] ) : 0;
    if( ! classified ) ++stats_.unclassified;
    const bool accepted = classified && accepts( taxid );

    const std::string read_id = normalizeReadId( fields[ 1 ] );
    std::unordered_map< std::string, ReadAssignment >::iterator it = reads_.find( read_id );
    if( it == reads_.end() ) {
        ReadAssignment assignment = { taxid, 0, accepted };
        reads_.insert( std::make_pair( read_id, assignment ) );
    } else if( ! accepted && it->second.accepted ) { // one rejected mate rejects the read
        it->second.taxid = taxid;
        it->second.accepted = false;
    }
}



// read id <tab> seq id <tab> taxid <tab> score <tab> ...
void ClassificationReport::addCentrifugeEntry( const std::vector< std::string >& fields ) {
    if( fields.size() < 4 ) {
        BOOST_THROW_EXCEPTION( ParsingError{} << general_info{ "not a Centrifuge output line" } << file_info{ filename_ } << line_info{ line_num_ } );
    }

    const TaxonID taxid = parseTaxonID( fields[ 2 ] );
    large_unsigned_int score;
    try {
        score = boost::lexical_cast< large_unsigned_int >( fields[ 3 ] );
    } catch( const boost::bad_lexical_cast& ) {
        BOOST_THROW_EXCEPTION( ParsingError{} << general_info{ "could not read score '" + fields[ 3 ] + "'" } << file_info{ filename_ } << line_info{ line_num_ } );
    }
    if( ! taxid ) ++stats_.unclassified;
    const bool accepted = taxid && accepts( taxid );

    const std::string read_id = normalizeReadId( fields[ 0 ] );
    std::unordered_map< std::string, ReadAssignment >::iterator it = reads_.find( read_id );
    if( it == reads_.end() ) {
        ReadAssignment assignment = { taxid, score, accepted };
        reads_.insert( std::make_pair( read_id, assignment ) );
    } else if( score > it->second.score ) {
        ReadAssignment assignment = { taxid, score, accepted };
        it->second = assignment;
    } else if( score == it->second.score && accepted && ! it->second.accepted ) {
        it->second.taxid = taxid;
        it->second.accepted = true;
    }
}



TaxonID ClassificationReport::parseTaxonID( const std::string& field ) const {
    std::string taxid_str = field;
    const std::string::size_type pos = field.rfind( "(taxid " );
    if( pos != std::string::npos ) { // kraken2 --use-names output
        const std::string::size_type start = pos + 7;
        const std::string::size_type stop = field.find( ')', start );
        taxid_str = field.substr( start, stop == std::string::npos ? std::string::npos : stop - start );
    }
    try {
        return boost::lexical_cast< TaxonID >( taxid_str );
    } catch( const boost::bad_lexical_cast& ) {
        BOOST_THROW_EXCEPTION( ParsingError{} << general_info{ "could not parse taxonomic ID '" + field + "'" } << file_info{ filename_ } << line_info{ line_num_ } );
    }
}



bool ClassificationReport::accepts( const TaxonID taxid ) {
    try {
        return filter_.isDescendantOrSelf( taxid );
    } catch( const TaxonNotFound& ) {
        ++stats_.unknown_taxa;
        return false;
    }
}
