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
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/scoped_ptr.hpp>
#include "src/taxonomyinterface.hh"
#include "src/taxonomyloader.hh"
#include "src/descendantfilter.hh"
#include "src/accessconv.hh"
#include "src/recordfilter.hh"
#include "src/seqfile.hh"
#include "src/constants.hh"
#include "src/exception.hh"



using namespace std;



int main( int argc, char** argv ) {
	TaxonomySource source;
	string input_filename, ancestor_name, output_filename, accession_map_filename;
	FastaFilterOptions options;

	namespace po = boost::program_options;
	po::options_description visible( "Allowed options" );
	visible.add_options()
	( "help,h", "show help message" )
	( "version,V", "show version" )
	( "db,d", po::value< string >( &source.db_filename ), "SQLite taxonomy database" )
	( "taxdir", po::value< string >( &source.taxdir ), "folder containing the NCBI taxonomy nodes.dmp and names.dmp files" )
	( "tax_prefix,t", po::value< string >( &source.tax_prefix )->default_value( "" ), "string to prepend to names of nodes.dmp and names.dmp" )
	( "accession_map,a", po::value< string >( &accession_map_filename ), "accession to taxonomic ID mapping (two columns or NCBI accession2taxid)" )
	( "exclude_curated", po::bool_switch( &options.exclude_curated ), "drop curated RefSeq records (NC_, NG_, NM_, NP_, NR_)" )
	( "exclude_predicted", po::bool_switch( &options.exclude_predicted ), "drop predicted RefSeq records (XM_, XP_, XR_)" );

	po::options_description hidden;
	hidden.add_options()
	( "input", po::value< string >( &input_filename ), "FASTA file with RefSeq sequences" )
	( "ancestor", po::value< string >( &ancestor_name ), "name of ancestor to use as ancestor filter" )
	( "output", po::value< string >( &output_filename ), "output FASTA file (stdout if omitted)" );

	po::options_description desc;
	desc.add( visible ).add( hidden );

	po::positional_options_description pos;
	pos.add( "input", 1 ).add( "ancestor", 1 ).add( "output", 1 );

	try {
		po::variables_map vm;
		po::store( po::command_line_parser( argc, argv ).options( desc ).positional( pos ).run(), vm );
		po::notify( vm );

		if( vm.count( "version" ) ) {
			cout << "taxonomy-filter-refseq " << program_version << endl;
			return EXIT_SUCCESS;
		}

		if( vm.count( "help" ) || input_filename.empty() || ancestor_name.empty() ) {
			cout << "Usage: taxonomy-filter-refseq [options] INPUT_FASTA ANCESTOR_NAME [OUTPUT_FASTA]" << endl << endl << visible << endl;
			return vm.count( "help" ) ? EXIT_SUCCESS : EXIT_FAILURE;
		}

		// initialize everything before any output is created
		boost::scoped_ptr< Taxonomy > tax( loadTaxonomy( source ) );
		TaxonomyInterface interface( tax.get() );
		DescendantFilter descendants( interface, ancestor_name );

		boost::scoped_ptr< StrIDConverter > seqid2taxid;
		if( ! accession_map_filename.empty() ) {
			cerr << "Loading accession map '" << accession_map_filename << "'..." << flush;
			seqid2taxid.reset( loadStrIDConverterFromFile( accession_map_filename ) );
			cerr << " done" << endl;
		}

		FastaRecordFilter filter( descendants, seqid2taxid.get(), options );
		filterFastaFile( input_filename, output_filename, filter );

		const FilterStats& stats = filter.getStats();
		cerr << "Kept " << stats.accepted << " of " << stats.total << " records below '" << ancestor_name << "' ("
		     << stats.rejected << " outside, " << stats.unresolved << " without taxon, " << stats.excluded << " excluded by accession class)" << endl;
		return EXIT_SUCCESS;

	} catch( po::error& e ) {
		cerr << "Bad command line: " << e.what() << endl;
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
