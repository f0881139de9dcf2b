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
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/scoped_ptr.hpp>
#include "src/taxonomyinterface.hh"
#include "src/taxonomyloader.hh"
#include "src/descendantfilter.hh"
#include "src/classificationreport.hh"
#include "src/recordfilter.hh"
#include "src/seqfile.hh"
#include "src/constants.hh"
#include "src/exception.hh"



using namespace std;



int main( int argc, char** argv ) {
	TaxonomySource source;
	TaxonID ancestor_taxid;
	string report_filename, output_dir;
	vector< string > input_filenames;
	FastqFilterOptions options;

	namespace po = boost::program_options;
	po::options_description visible( "Allowed options" );
	visible.add_options()
	( "help,h", "show help message" )
	( "version,V", "show version" )
	( "db", po::value< string >( &source.db_filename ), "SQLite taxonomy database" )
	( "taxdir,T", po::value< string >( &source.taxdir ), "folder containing the NCBI taxonomy nodes.dmp and names.dmp files" )
	( "tax_prefix,t", po::value< string >( &source.tax_prefix )->default_value( "" ), "string to prepend to names of nodes.dmp and names.dmp" )
	( "ancestor_taxid,A", po::value< TaxonID >( &ancestor_taxid )->required(), "taxonomic ID of the ancestor to filter for" )
	( "tax_report_filename,F", po::value< string >( &report_filename )->required(), "output of Kraken2 or Centrifuge for the input reads" )
	( "kraken2,K", "report is Kraken2 output" )
	( "centrifuge,C", "report is Centrifuge output" )
	( "output_dir,d", po::value< string >( &output_dir ), "folder for the filtered files (default: folder of each input)" )
	( "stdout", "write the filtered reads of a single input to stdout" )
	( "skip_unmapped", "drop reads missing from the report instead of failing" );

	po::options_description hidden;
	hidden.add_options()
	( "input", po::value< vector< string > >( &input_filenames ), "FASTQ files" );

	po::options_description desc;
	desc.add( visible ).add( hidden );

	po::positional_options_description pos;
	pos.add( "input", -1 );

	try {
		po::variables_map vm;
		po::store( po::command_line_parser( argc, argv ).options( desc ).positional( pos ).run(), vm );

		if( vm.count( "version" ) ) {
			cout << "taxonomy-filter-fastq " << program_version << endl;
			return EXIT_SUCCESS;
		}

		if( vm.count( "help" ) ) {
			cout << "Usage: taxonomy-filter-fastq [options] INPUT_FASTQ..." << endl << endl << visible << endl;
			return EXIT_SUCCESS;
		}

		po::notify( vm );

		if( vm.count( "kraken2" ) == vm.count( "centrifuge" ) ) {
			cerr << "Choose exactly one of --kraken2 and --centrifuge" << endl;
			return EXIT_FAILURE;
		}
		const ReportFormat format = vm.count( "centrifuge" ) ? ReportFormat::centrifuge : ReportFormat::kraken2;

		if( input_filenames.empty() ) {
			cerr << "No input FASTQ files given" << endl;
			return EXIT_FAILURE;
		}

		const bool to_stdout = vm.count( "stdout" );
		if( to_stdout && input_filenames.size() > 1 ) {
			cerr << "--stdout needs a single input file" << endl;
			return EXIT_FAILURE;
		}

		if( vm.count( "skip_unmapped" ) ) options.unmapped = UnmappedReadPolicy::skip;

		// initialize everything before any output is created
		boost::scoped_ptr< Taxonomy > tax( loadTaxonomy( source ) );
		TaxonomyInterface interface( tax.get() );
		DescendantFilter descendants( interface, ancestor_taxid );

		cerr << "Loading report '" << report_filename << "'..." << flush;
		ClassificationReport report( report_filename, format, descendants );
		cerr << " done (" << report.size() << ( report.getFormat() == ReportFormat::kraken2 ? " Kraken2" : " Centrifuge" ) << " reads)" << endl;
		if( report.getStats().unknown_taxa ) {
			cerr << report.getStats().unknown_taxa << " report entries name taxa missing from the taxonomy, rejecting them" << endl;
		}

		if( to_stdout ) {
			FastqRecordFilter filter( report, options );
			SeqFileSource input( input_filenames.front() );
			SeqFileSink output( cout, SeqFormat::fastq );
			filterRecords( input, output, filter );
			output.close();
			cerr << filter.getStats().accepted << " records written out of " << filter.getStats().total << " total records" << endl;
			return EXIT_SUCCESS;
		}

		filterFastqFiles( input_filenames, output_dir, report, options );
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
