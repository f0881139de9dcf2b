#define BOOST_TEST_MODULE SeqFileTests
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>
#include "src/classificationreport.hh"
#include "src/descendantfilter.hh"
#include "src/recordfilter.hh"
#include "src/seqfile.hh"
#include "src/exception.hh"
#include "unittest_fixtures.hh"



namespace {

void writeFile( const std::string& filename, const std::string& content ) {
	std::ofstream file( filename.c_str(), std::ios_base::out | std::ios_base::binary );
	file << content;
}

std::string readFile( const std::string& filename ) {
	std::ifstream file( filename.c_str(), std::ios_base::in | std::ios_base::binary );
	return std::string( std::istreambuf_iterator< char >( file ), std::istreambuf_iterator< char >() );
}

std::vector< std::string > readIds( const std::string& filename ) {
	std::vector< std::string > ids;
	SeqFileSource source( filename );
	SequenceRecord rec;
	while( source.readRecord( rec ) ) ids.push_back( rec.id );
	return ids;
}

std::size_t countFiles( const boost::filesystem::path& dir ) {
	return std::distance( boost::filesystem::directory_iterator( dir ), boost::filesystem::directory_iterator() );
}

std::string fastq( const std::string& read_id ) {
	return "@" + read_id + "\nACGT\n+\nIIII\n";
}

SequenceRecord makeRecord( const std::string& id, const std::string& seq, const std::string& qual = "" ) {
	SequenceRecord rec;
	rec.id = id;
	rec.seq = seq;
	rec.qual = qual;
	return rec;
}



// small taxonomy, reads filtered for A(2), r1..r5 in the Kraken2 report
struct ReadFilesFixture : public SmallTaxonomyFixture, public TempDirFixture {
	ReadFilesFixture() : filter( taxinter, "A" ), kraken2_output(
			"C\tr1\t3\t4\t3:4\n"
			"C\tr2\t5\t4\t5:4\n"
			"C\tr3\t4\t4\t4:4\n"
			"C\tr4\t2\t4\t2:4\n"
			"U\tr5\t0\t4\t0:4\n" ),
		report( kraken2_output, ReportFormat::kraken2, filter ) {}

	const DescendantFilter filter;
	std::istringstream kraken2_output;
	const ClassificationReport report;
};

}



BOOST_AUTO_TEST_SUITE( sequence_files )

BOOST_FIXTURE_TEST_CASE( fasta_is_wrapped_at_80_columns, TempDirFixture ) {
	const std::string filename = path( "long.fa" );
	{
		SeqFileSink sink( filename, SeqFormat::fasta );
		sink.writeRecord( makeRecord( "NC_1 long one", std::string( 200, 'A' ) ) );
		sink.close();
	}
	BOOST_CHECK_EQUAL( readFile( filename ), ">NC_1 long one\n" + std::string( 80, 'A' ) + "\n" + std::string( 80, 'A' ) + "\n" + std::string( 40, 'A' ) + "\n" );
}

BOOST_FIXTURE_TEST_CASE( output_format_does_not_depend_on_file_name, TempDirFixture ) {
	const std::string fasta_filename = path( "filtered_out" );
	const std::string fastq_filename = path( "reads.tmp-1234.filtered.txt" );
	{
		SeqFileSink fasta_sink( fasta_filename, SeqFormat::fasta );
		fasta_sink.writeRecord( makeRecord( "r1", "ACGT" ) );
		fasta_sink.close();

		SeqFileSink fastq_sink( fastq_filename, SeqFormat::fastq );
		fastq_sink.writeRecord( makeRecord( "r1", "ACGT", "IIII" ) );
		fastq_sink.close();
	}
	BOOST_CHECK_EQUAL( readFile( fasta_filename ), ">r1\nACGT\n" );
	BOOST_CHECK_EQUAL( readFile( fastq_filename ), fastq( "r1" ) );
}

BOOST_FIXTURE_TEST_CASE( gzip_output_reads_back, TempDirFixture ) {
	const std::string filename = path( "reads.fq.gz" );
	{
		SeqFileSink sink( filename, SeqFormat::fastq );
		sink.writeRecord( makeRecord( "r1 first", "ACGT", "IIII" ) );
		sink.writeRecord( makeRecord( "r2", "GG", "II" ) );
		sink.close();
	}
	const std::string content = readFile( filename );
	BOOST_REQUIRE( content.size() > 2 );
	BOOST_CHECK_EQUAL( static_cast< unsigned char >( content[ 0 ] ), 0x1f );
	BOOST_CHECK_EQUAL( static_cast< unsigned char >( content[ 1 ] ), 0x8b );

	SeqFileSource source( filename );
	SequenceRecord rec;
	BOOST_REQUIRE( source.readRecord( rec ) );
	BOOST_CHECK_EQUAL( rec.id, "r1 first" );
	BOOST_CHECK_EQUAL( rec.seq, "ACGT" );
	BOOST_CHECK_EQUAL( rec.qual, "IIII" );
	BOOST_REQUIRE( source.readRecord( rec ) );
	BOOST_CHECK_EQUAL( rec.id, "r2" );
	BOOST_CHECK( ! source.readRecord( rec ) );
}

BOOST_AUTO_TEST_CASE( missing_input ) {
	BOOST_CHECK_THROW( SeqFileSource( "/nonexistent/reads.fq" ), FileNotFound );
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE( fastq_file_filter )

BOOST_FIXTURE_TEST_CASE( each_input_goes_to_its_own_output, ReadFilesFixture ) {
	writeFile( path( "a.fq" ), fastq( "r1" ) + fastq( "r2" ) + fastq( "r3" ) );
	writeFile( path( "b.fq" ), fastq( "r4/1" ) + fastq( "r5" ) );
	std::vector< std::string > inputs;
	inputs.push_back( path( "a.fq" ) );
	inputs.push_back( path( "b.fq" ) );

	const std::vector< FilterStats > stats = filterFastqFiles( inputs, path( "out" ), report );

	BOOST_REQUIRE_EQUAL( stats.size(), 2u );
	BOOST_CHECK_EQUAL( stats[ 0 ].total, 3u );
	BOOST_CHECK_EQUAL( stats[ 0 ].accepted, 2u );
	BOOST_CHECK_EQUAL( stats[ 1 ].accepted, 1u );
	BOOST_CHECK_EQUAL( stats[ 1 ].rejected, 1u );

	BOOST_CHECK_EQUAL( countFiles( dir / "out" ), 2u );
	const std::vector< std::string > a_ids = readIds( path( "out/a.filtered.fq" ) );
	const std::vector< std::string > b_ids = readIds( path( "out/b.filtered.fq" ) );
	const char* a_expected[] = { "r1", "r3" };
	const char* b_expected[] = { "r4/1" };
	BOOST_CHECK_EQUAL_COLLECTIONS( a_ids.begin(), a_ids.end(), a_expected, a_expected + 2 );
	BOOST_CHECK_EQUAL_COLLECTIONS( b_ids.begin(), b_ids.end(), b_expected, b_expected + 1 );
}

BOOST_FIXTURE_TEST_CASE( output_beside_input_without_outdir, ReadFilesFixture ) {
	writeFile( path( "reads.fastq" ), fastq( "r4" ) + fastq( "r2" ) );
	std::vector< std::string > inputs( 1, path( "reads.fastq" ) );

	filterFastqFiles( inputs, "", report );

	BOOST_CHECK_EQUAL( readFile( path( "reads.filtered.fastq" ) ), fastq( "r4" ) );
	BOOST_CHECK_EQUAL( countFiles( dir ), 2u );
}

BOOST_FIXTURE_TEST_CASE( unmapped_read_leaves_no_outputs, ReadFilesFixture ) {
	writeFile( path( "a.fq" ), fastq( "r1" ) + fastq( "r3" ) );
	writeFile( path( "b.fq" ), fastq( "r4" ) + fastq( "r9" ) );
	std::vector< std::string > inputs;
	inputs.push_back( path( "a.fq" ) );
	inputs.push_back( path( "b.fq" ) );

	BOOST_CHECK_THROW( filterFastqFiles( inputs, path( "out" ), report ), UnmappedRead );
	BOOST_CHECK( boost::filesystem::is_directory( dir / "out" ) );
	BOOST_CHECK_EQUAL( countFiles( dir / "out" ), 0u );
}

BOOST_FIXTURE_TEST_CASE( unmapped_read_skipped_on_request, ReadFilesFixture ) {
	writeFile( path( "b.fq" ), fastq( "r9" ) + fastq( "r4" ) );
	std::vector< std::string > inputs( 1, path( "b.fq" ) );
	FastqFilterOptions options;
	options.unmapped = UnmappedReadPolicy::skip;

	const std::vector< FilterStats > stats = filterFastqFiles( inputs, path( "out" ), report, options );

	BOOST_REQUIRE_EQUAL( stats.size(), 1u );
	BOOST_CHECK_EQUAL( stats[ 0 ].unmapped, 1u );
	BOOST_CHECK_EQUAL( readFile( path( "out/b.filtered.fq" ) ), fastq( "r4" ) );
}

BOOST_FIXTURE_TEST_CASE( same_file_name_in_two_folders_is_refused, ReadFilesFixture ) {
	boost::filesystem::create_directories( dir / "runA" );
	boost::filesystem::create_directories( dir / "runB" );
	writeFile( path( "runA/reads.fq" ), fastq( "r1" ) );
	writeFile( path( "runB/reads.fq" ), fastq( "r3" ) );
	std::vector< std::string > inputs;
	inputs.push_back( path( "runA/reads.fq" ) );
	inputs.push_back( path( "runB/reads.fq" ) );

	BOOST_CHECK_THROW( filterFastqFiles( inputs, path( "out" ), report ), FileError );
	BOOST_CHECK_EQUAL( countFiles( dir / "out" ), 0u );
}

BOOST_FIXTURE_TEST_CASE( missing_input_before_any_output, ReadFilesFixture ) {
	writeFile( path( "a.fq" ), fastq( "r1" ) );
	std::vector< std::string > inputs;
	inputs.push_back( path( "a.fq" ) );
	inputs.push_back( path( "nothere.fq" ) );

	BOOST_CHECK_THROW( filterFastqFiles( inputs, path( "out" ), report ), FileNotFound );
	BOOST_CHECK_EQUAL( countFiles( dir / "out" ), 0u );
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE( fasta_file_filter )

BOOST_FIXTURE_TEST_CASE( refseq_records_by_species_name, ReadFilesFixture ) {
	writeFile( path( "refseq.fa" ),
		">NC_1.1 gene [C]\nACGT\n"
		">NC_2.1 gene [D]\nACGT\n"
		">XM_3.1 gene [B]\nACGT\n"
		">NC_4.1 gene without species\nACGT\n" );
	FastaFilterOptions options;
	options.exclude_predicted = true;
	FastaRecordFilter fasta_filter( filter, NULL, options );

	filterFastaFile( path( "refseq.fa" ), path( "filtered_out" ), fasta_filter );

	BOOST_CHECK_EQUAL( readFile( path( "filtered_out" ) ), ">NC_1.1 gene [C]\nACGT\n" );
	BOOST_CHECK_EQUAL( fasta_filter.getStats().total, 4u );
	BOOST_CHECK_EQUAL( fasta_filter.getStats().rejected, 1u );
	BOOST_CHECK_EQUAL( fasta_filter.getStats().excluded, 1u );
	BOOST_CHECK_EQUAL( fasta_filter.getStats().unresolved, 1u );
	BOOST_CHECK_EQUAL( countFiles( dir ), 2u );
}

BOOST_AUTO_TEST_SUITE_END()
