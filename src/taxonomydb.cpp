#include "taxonomydb.hh"
#include <unordered_map>
#include <utility>
#include <boost/filesystem.hpp>
#include <sqlite3pp.h>
#include "exception.hh"



namespace {

void checkResult( sqlite3pp::database& db, const int rc, const std::string& db_filename, const std::string& action ) {
    if( rc != SQLITE_OK && rc != SQLITE_DONE ) {
        BOOST_THROW_EXCEPTION( DatabaseError{} << general_info{ action + ": " + db.error_msg() } << file_info{ db_filename } );
    }
}

bool hasTaxonomyTable( sqlite3pp::database& db ) {
    sqlite3pp::query qry( db, "SELECT count(*) FROM sqlite_master WHERE type = 'table' AND name = 'taxonomy'" );
    sqlite3pp::query::iterator row = qry.begin();
    return row != qry.end() && ( *row ).get< long long >( 0 ) > 0;
}

large_unsigned_int countRows( sqlite3pp::database& db ) {
    sqlite3pp::query qry( db, "SELECT count(*) FROM taxonomy" );
    sqlite3pp::query::iterator row = qry.begin();
    if( row == qry.end() ) return 0;
    return static_cast< large_unsigned_int >( ( *row ).get< long long >( 0 ) );
}

}



void saveTaxonomyToSQLite( const Taxonomy& tax, const std::string& db_filename ) {
    try {
        sqlite3pp::database db( db_filename.c_str() );
        sqlite3pp::transaction xct( db ); // rolls back unless committed

        checkResult( db, db.execute( taxonomy_db_schema.c_str() ), db_filename, "creating taxonomy table" );
        if( countRows( db ) ) {
            BOOST_THROW_EXCEPTION( DatabaseError{} << general_info{ "taxonomy table is not empty" } << file_info{ db_filename } );
        }

        sqlite3pp::command cmd( db, "INSERT INTO taxonomy (id, ancestry, name, rank) VALUES (?, ?, ?, ?)" );
        for( Taxonomy::const_iterator it = tax.begin(); it != tax.end(); ++it ) {
            cmd.bind( 1, static_cast< long long >( it->taxid ) );
            if( it->isRoot() ) cmd.bind( 2, sqlite3pp::null_type() );
            else cmd.bind( 2, encodeAncestry( it->ancestry ).c_str(), sqlite3pp::copy );
            cmd.bind( 3, it->name.c_str(), sqlite3pp::copy );
            cmd.bind( 4, it->rank.c_str(), sqlite3pp::copy );
            const int rc = cmd.execute();
            if( rc != SQLITE_DONE && rc != SQLITE_OK ) {
                BOOST_THROW_EXCEPTION( DatabaseError{} << general_info{ "inserting taxon: " + std::string( db.error_msg() ) } << taxid_info{ it->taxid } << file_info{ db_filename } );
            }
            cmd.reset();
        }

        checkResult( db, xct.commit(), db_filename, "committing taxonomy" );
    } catch( const sqlite3pp::database_error& e ) {
        BOOST_THROW_EXCEPTION( DatabaseError{} << general_info{ e.what() } << file_info{ db_filename } );
    }
}



Taxonomy* loadTaxonomyFromSQLite( const std::string& db_filename ) {
    if( ! boost::filesystem::exists( db_filename ) ) BOOST_THROW_EXCEPTION( FileNotFound{} << file_info{ db_filename } );

    NodeStore store;
    std::unordered_map< TaxonID, std::string > stored_ancestry;

    try {
        sqlite3pp::database db( db_filename.c_str(), SQLITE_OPEN_READONLY );
        if( ! hasTaxonomyTable( db ) ) {
            BOOST_THROW_EXCEPTION( DatabaseError{} << general_info{ "no taxonomy table" } << file_info{ db_filename } );
        }

        sqlite3pp::query qry( db, "SELECT id, ancestry, name, rank FROM taxonomy ORDER BY id" );
        for( sqlite3pp::query::iterator row = qry.begin(); row != qry.end(); ++row ) {
            const TaxonID taxid = static_cast< TaxonID >( ( *row ).get< long long >( 0 ) );
            const std::string ancestry = ( *row ).column_type( 1 ) == SQLITE_NULL ? std::string() : ( *row ).get< const char* >( 1 );
            const std::string name = ( *row ).get< const char* >( 2 );
            const std::string rank = ( *row ).column_type( 3 ) == SQLITE_NULL ? std::string() : ( *row ).get< const char* >( 3 );

            const AncestryPath path = decodeAncestry( ancestry );
            boost::optional< TaxonID > parent_taxid;
            if( ! path.empty() ) parent_taxid = path.back();

            store.insert( taxid, name, rank, parent_taxid );
            stored_ancestry[ taxid ] = ancestry;
        }
    } catch( const sqlite3pp::database_error& e ) {
        BOOST_THROW_EXCEPTION( DatabaseError{} << general_info{ e.what() } << file_info{ db_filename } );
    }

    Taxonomy* tax = new Taxonomy( std::move( store ) );
    for( Taxonomy::const_iterator it = tax->begin(); it != tax->end(); ++it ) {
        if( encodeAncestry( it->ancestry ) != stored_ancestry[ it->taxid ] ) {
            const TaxonID taxid = it->taxid;
            delete tax;
            BOOST_THROW_EXCEPTION( MalformedTaxonomy{} << general_info{ "stored ancestry differs from recomputed path" } << taxid_info{ taxid } << file_info{ db_filename } );
        }
    }
    return tax;
}



large_unsigned_int countTaxonomyRows( const std::string& db_filename ) {
    if( ! boost::filesystem::exists( db_filename ) ) return 0;
    try {
        sqlite3pp::database db( db_filename.c_str(), SQLITE_OPEN_READONLY );
        if( ! hasTaxonomyTable( db ) ) return 0;
        return countRows( db );
    } catch( const sqlite3pp::database_error& e ) {
        BOOST_THROW_EXCEPTION( DatabaseError{} << general_info{ e.what() } << file_info{ db_filename } );
    }
}
