/*
taxfilter-tk filters sequence records by their NCBI taxonomic lineage.

Copyright (C) 2010 Johannes Dröge

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program.  If not, see <http://www.gnu.org/licenses/>.

*/

#include <iostream>
#include <string>
#include <vector>
#include <boost/lexical_cast.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/scoped_ptr.hpp>
#include "src/taxonomyinterface.hh"
#include "src/taxonomyloader.hh"
#include "src/taxonomydb.hh"
#include "src/ncbidata.hh"
#include "src/lineageformat.hh"
#include "src/constants.hh"
#include "src/exception.hh"



using namespace std;
namespace po = boost::program_options;



int main( int argc, char** argv ) {
	TaxonomySource source;
	string command;

	po::options_description desc( "Allowed options" );
	desc.add_options()
	( "help,h", "show help message" )
	( "version,V", "show version" )
	( "db,d", po::value< string >( &source.db_filename ), ( "SQLite taxonomy database (default: $" + ENVVAR_TAXONOMY_DB + " or " + default_taxonomy_db + ")" ).c_str() )
	( "taxdir", po::value< string >( &source.taxdir ), "read the taxonomy from NCBI dump files in this folder instead of the database" )
	( "command", po::value< string >( &command ), "one of to_sqlite, get_id, get_name, get_lineage, common_ancestor_distance" )
	( "args", po::value< vector< string > >(), "command arguments" );

	po::positional_options_description pos;
	pos.add( "command", 1 ).add( "args", -1 );

	po::options_description visible( "Allowed options" );
	visible.add_options()
	( "help,h", "show help message" )
	( "version,V", "show version" )
	( "db,d", po::value< string >(), "SQLite taxonomy database" )
	( "taxdir", po::value< string >(), "read the taxonomy from NCBI dump files in this folder" );

	try {
		po::parsed_options parsed = po::command_line_parser( argc, argv ).options( desc ).positional( pos ).allow_unregistered().run();
		po::variables_map vm;
		po::store( parsed, vm );
		po::notify( vm );

		if( vm.count( "version" ) ) {
			cout << "taxonomy-util " << program_version << endl;
			return EXIT_SUCCESS;
		}

		if( vm.count( "help" ) || command.empty() ) {
			cout << "Usage: taxonomy-util [options] COMMAND [command options] ARGS" << endl << endl
			     << "  to_sqlite [--tax_prefix P] TAXDIR" << endl
			     << "  get_id NAME" << endl
			     << "  get_name ID" << endl
			     << "  get_lineage [--show_names] [--delimiter D] NAME" << endl
			     << "  common_ancestor_distance [--only_canonical] NAME1 NAME2" << endl << endl
			     << visible << endl;
			return command.empty() && ! vm.count( "help" ) ? EXIT_FAILURE : EXIT_SUCCESS;
		}

		// everything after the command goes to the command's own parser
		vector< string > cmd_args = po::collect_unrecognized( parsed.options, po::include_positional );
		cmd_args.erase( cmd_args.begin() );

		if( command == "to_sqlite" ) {
			string taxdir;
			po::options_description cmd_desc( "to_sqlite options" );
			cmd_desc.add_options()
			( "tax_prefix,t", po::value< string >( &source.tax_prefix )->default_value( "" ), "string to prepend to names of nodes.dmp and names.dmp" )
			( "taxdir", po::value< string >( &taxdir )->required(), "folder containing the NCBI taxonomy nodes.dmp and names.dmp files" );
			po::positional_options_description cmd_pos;
			cmd_pos.add( "taxdir", 1 );
			po::variables_map cmd_vm;
			po::store( po::command_line_parser( cmd_args ).options( cmd_desc ).positional( cmd_pos ).run(), cmd_vm );
			po::notify( cmd_vm );

			const string db_filename = source.db_filename.empty() ? defaultTaxonomyDBFilename() : source.db_filename;

			cerr << "Loading NCBI taxonomy dump from '" << taxdir << "'..." << flush;
			boost::scoped_ptr< Taxonomy > tax( loadTaxonomyFromDirectory( taxdir, source.tax_prefix ) );
			cerr << " done (" << tax->size() << " nodes)" << endl;

			cerr << "Saving taxonomy to '" << db_filename << "'..." << flush;
			saveTaxonomyToSQLite( *tax, db_filename );
			cerr << " done" << endl;
			return EXIT_SUCCESS;
		}

		if( command == "get_id" || command == "get_name" ) {
			string arg;
			po::options_description cmd_desc( command + " options" );
			cmd_desc.add_options()
			( "arg", po::value< string >( &arg )->required(), "taxon name or ID" );
			po::positional_options_description cmd_pos;
			cmd_pos.add( "arg", 1 );
			po::variables_map cmd_vm;
			po::store( po::command_line_parser( cmd_args ).options( cmd_desc ).positional( cmd_pos ).run(), cmd_vm );
			po::notify( cmd_vm );

			boost::scoped_ptr< Taxonomy > tax( loadTaxonomy( source ) );
			TaxonomyInterface interface( tax.get() );

			if( command == "get_id" ) cout << interface.getId( arg ) << endl;
			else cout << interface.getName( boost::lexical_cast< TaxonID >( arg ) ) << endl;
			return EXIT_SUCCESS;
		}

		if( command == "get_lineage" ) {
			string name, delimiter;
			po::options_description cmd_desc( "get_lineage options" );
			cmd_desc.add_options()
			( "show_names,S", "show taxon names, not just IDs" )
			( "delimiter,D", po::value< string >( &delimiter )->default_value( default_lineage_delimiter ), "delimiter for lineage string" )
			( "name", po::value< string >( &name )->required(), "name of taxon" );
			po::positional_options_description cmd_pos;
			cmd_pos.add( "name", 1 );
			po::variables_map cmd_vm;
			po::store( po::command_line_parser( cmd_args ).options( cmd_desc ).positional( cmd_pos ).run(), cmd_vm );
			po::notify( cmd_vm );
			const bool show_names = cmd_vm.count( "show_names" );

			boost::scoped_ptr< Taxonomy > tax( loadTaxonomy( source ) );
			TaxonomyInterface interface( tax.get() );

			cout << formatLineage( interface, interface.getNode( name ), show_names, delimiter ) << endl;
			return EXIT_SUCCESS;
		}

		if( command == "common_ancestor_distance" ) {
			vector< string > names;
			po::options_description cmd_desc( "common_ancestor_distance options" );
			cmd_desc.add_options()
			( "only_canonical", "only consider canonical taxonomic ranks" )
			( "names", po::value< vector< string > >( &names )->required(), "names of the two taxa" );
			po::positional_options_description cmd_pos;
			cmd_pos.add( "names", 2 );
			po::variables_map cmd_vm;
			po::store( po::command_line_parser( cmd_args ).options( cmd_desc ).positional( cmd_pos ).run(), cmd_vm );
			po::notify( cmd_vm );
			if( names.size() != 2 ) {
				cerr << "common_ancestor_distance needs exactly two taxon names" << endl;
				return EXIT_FAILURE;
			}

			boost::scoped_ptr< Taxonomy > tax( loadTaxonomy( source ) );
			TaxonomyInterface interface( tax.get() );

			const TaxonNode* A = interface.getNode( names[ 0 ] );
			const TaxonNode* B = interface.getNode( names[ 1 ] );
			const bool only_canonical = cmd_vm.count( "only_canonical" );
			cout << formatCommonAncestorDistance( interface, A, B, only_canonical ) << endl;
			return EXIT_SUCCESS;
		}

		cerr << "Unknown command '" << command << "'" << endl;
		cerr << visible << endl;
		return EXIT_FAILURE;

	} catch( po::error& e ) {
		cerr << "Bad command line: " << e.what() << endl;
		return EXIT_FAILURE;
	} catch( boost::bad_lexical_cast& ) {
		cerr << "Could not parse taxonomic ID" << endl;
		return EXIT_FAILURE;
	} catch( Exception& e ) {
		cerr << "An unrecoverable error occurred: " << e.what() << endl;
		cerr << endl << "Here is some debugging information to locate the problem:" << endl << boost::diagnostic_information( e ) << endl;
		return EXIT_FAILURE;
	} catch( std::exception& e ) {
		cerr << "An unrecoverable error occurred: " << e.what() << endl;
		return EXIT_FAILURE;
	}
}
