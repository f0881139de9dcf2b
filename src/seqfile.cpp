#include "seqfile.hh"
#include <iostream>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include "constants.hh"
#include "exception.hh"
#include "outputfiles.hh"



namespace {

std::string toString( const seqan::CharString& str ) {
	return std::string( seqan::begin( str ), seqan::end( str ) );
}

}



SeqFileSource::SeqFileSource( const std::string& filename ) : filename_( filename ) {
	if( ! boost::filesystem::exists( filename ) ) BOOST_THROW_EXCEPTION( FileNotFound{} << file_info{ filename } );
	if( ! seqan::open( file_, filename.c_str() ) ) BOOST_THROW_EXCEPTION( FileError{} << general_info{ "unknown sequence format" } << file_info{ filename } );
}



bool SeqFileSource::readRecord( SequenceRecord& rec ) {
	if( seqan::atEnd( file_ ) ) return false;
	try {
		seqan::readRecord( id_, seq_, qual_, file_ );
	} catch( const seqan::ParseError& e ) {
		BOOST_THROW_EXCEPTION( ParsingError{} << general_info{ e.what() } << file_info{ filename_ } );
	} catch( const seqan::IOError& e ) {
		BOOST_THROW_EXCEPTION( FileError{} << general_info{ e.what() } << file_info{ filename_ } );
	}
	rec.id = toString( id_ );
	rec.seq = toString( seq_ );
	rec.qual = toString( qual_ );
	return true;
}



SeqFileSink::SeqFileSink( const std::string& filename, const SeqFormat format ) : filename_( filename ) {
	boost::iostreams::file_sink sink( filename, std::ios_base::out | std::ios_base::binary );
	if( ! sink.is_open() ) BOOST_THROW_EXCEPTION( FileError{} << general_info{ "could not open output file" } << file_info{ filename } );
	if( boost::algorithm::ends_with( filename, ".gz" ) ) out_.push( boost::iostreams::gzip_compressor() );
	out_.push( sink );
	open( format );
}



SeqFileSink::SeqFileSink( std::ostream& stream, const SeqFormat format ) : filename_( "<stdout>" ) {
	out_.push( stream );
	open( format );
}



void SeqFileSink::open( const SeqFormat format ) {
	std::ostream& stream = out_;
	bool success;
	if( format == SeqFormat::fastq ) success = seqan::open( file_, stream, seqan::Fastq() );
	else success = seqan::open( file_, stream, seqan::Fasta() );
	if( ! success ) BOOST_THROW_EXCEPTION( FileError{} << file_info{ filename_ } );
	file_.options.lineLength = fasta_line_length;
}



void SeqFileSink::writeRecord( const SequenceRecord& rec ) {
	id_ = rec.id;
	seq_ = rec.seq;
	try {
		if( rec.qual.empty() ) {
			seqan::writeRecord( file_, id_, seq_ );
		} else {
			qual_ = rec.qual;
			seqan::writeRecord( file_, id_, seq_, qual_ );
		}
	} catch( const seqan::IOError& e ) {
		BOOST_THROW_EXCEPTION( FileError{} << general_info{ e.what() } << file_info{ filename_ } );
	}
}



void SeqFileSink::close() {
	seqan::close( file_ );
	out_.flush();
	if( ! out_ ) BOOST_THROW_EXCEPTION( FileError{} << general_info{ "could not write records" } << file_info{ filename_ } );
	try {
		out_.reset(); // writes the gzip trailer
	} catch( const std::ios_base::failure& e ) {
		BOOST_THROW_EXCEPTION( FileError{} << general_info{ e.what() } << file_info{ filename_ } );
	}
}



std::vector< FilterStats > filterFastqFiles( const std::vector< std::string >& input_filenames, const std::string& outdir, const ClassificationReport& report, const FastqFilterOptions& options ) {
	if( ! outdir.empty() && ! boost::filesystem::exists( outdir ) ) {
		boost::system::error_code ec;
		boost::filesystem::create_directories( outdir, ec );
		if( ec ) BOOST_THROW_EXCEPTION( FileError{} << general_info{ ec.message() } << file_info{ outdir } );
	}

	OutputFileGuard outputs;
	std::vector< std::string > output_filenames, tmp_filenames;
	for( std::vector< std::string >::const_iterator it = input_filenames.begin(); it != input_filenames.end(); ++it ) {
		if( ! boost::filesystem::exists( *it ) ) BOOST_THROW_EXCEPTION( FileNotFound{} << file_info{ *it } );
		output_filenames.push_back( filteredOutputPath( *it, outdir ) );
		tmp_filenames.push_back( outputs.add( output_filenames.back() ) );
	}

	std::vector< FilterStats > all_stats;
	for( std::size_t i = 0; i < input_filenames.size(); ++i ) {
		std::cerr << "Processing '" << input_filenames[ i ] << "' -> '" << output_filenames[ i ] << "'" << std::endl;

		FastqRecordFilter filter( report, options );
		SeqFileSource input( input_filenames[ i ] );
		SeqFileSink output( tmp_filenames[ i ], SeqFormat::fastq );
		filterRecords( input, output, filter );
		output.close();

		const FilterStats& stats = filter.getStats();
		std::cerr << stats.accepted << " records written out of " << stats.total << " total records";
		if( stats.unmapped ) std::cerr << " (" << stats.unmapped << " not in report)";
		std::cerr << std::endl;
		all_stats.push_back( stats );
	}

	outputs.commit();
	return all_stats;
}



void filterFastaFile( const std::string& input_filename, const std::string& output_filename, FastaRecordFilter& filter ) {
	SeqFileSource input( input_filename );
	if( output_filename.empty() ) {
		SeqFileSink output( std::cout, SeqFormat::fasta );
		filterRecords( input, output, filter );
		output.close();
		return;
	}

	OutputFileGuard outputs;
	{
		SeqFileSink output( outputs.add( output_filename ), SeqFormat::fasta );
		filterRecords( input, output, filter );
		output.close();
	}
	outputs.commit();
}
