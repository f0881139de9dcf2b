#define BOOST_TEST_MODULE FilterTests
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <boost/algorithm/string/predicate.hpp>
#include "src/accessconv.hh"
#include "src/classificationreport.hh"
#include "src/descendantfilter.hh"
#include "src/recordfilter.hh"
#include "src/outputfiles.hh"
#include "src/exception.hh"
#include "unittest_fixtures.hh"



namespace {

SequenceRecord makeRecord( const std::string& id, const std::string& seq = "ACGT", const std::string& qual = "" ) {
	SequenceRecord rec;
	rec.id = id;
	rec.seq = seq;
	rec.qual = qual;
	return rec;
}

// in-memory record source and sink with the interface filterRecords expects
class VectorSource {
	public:
		explicit VectorSource( const std::vector< SequenceRecord >& records ) : records_( records ), pos_( 0 ) {}
		bool readRecord( SequenceRecord& rec ) {
			if( pos_ == records_.size() ) return false;
			rec = records_[ pos_++ ];
			return true;
		}
	private:
		const std::vector< SequenceRecord >& records_;
		std::size_t pos_;
};

struct VectorSink {
	void writeRecord( const SequenceRecord& rec ) { records.push_back( rec ); }
	std::vector< SequenceRecord > records;
};

std::vector< std::string > ids( const std::vector< SequenceRecord >& records ) {
	std::vector< std::string > result;
	for( std::vector< SequenceRecord >::const_iterator it = records.begin(); it != records.end(); ++it ) result.push_back( it->id );
	return result;
}

}



BOOST_AUTO_TEST_SUITE( accession_resolver )

BOOST_AUTO_TEST_CASE( accession_classes ) {
	BOOST_CHECK( classifyAccession( "NC_000913.3" ) == AccessionClass::curated );
	BOOST_CHECK( classifyAccession( "NP_414542.1" ) == AccessionClass::curated );
	BOOST_CHECK( classifyAccession( "XM_024446111.1" ) == AccessionClass::predicted );
	BOOST_CHECK( classifyAccession( "XR_001" ) == AccessionClass::predicted );
	BOOST_CHECK( classifyAccession( "WP_000001.1" ) == AccessionClass::other );
	BOOST_CHECK( classifyAccession( "AC_000001" ) == AccessionClass::other );
}

BOOST_AUTO_TEST_CASE( accession_from_header ) {
	BOOST_CHECK_EQUAL( extractAccession( "NC_000913.3 Escherichia coli str. K-12 [Escherichia coli]" ), "NC_000913.3" );
	BOOST_CHECK_EQUAL( extractAccession( "gi|49175990|ref|NC_000913.2| Escherichia coli" ), "NC_000913.2" );
	BOOST_CHECK_EQUAL( extractAccession( "gnl|db|ABC123" ), "ABC123" );
	BOOST_CHECK_EQUAL( extractAccession( "plain" ), "plain" );
}

BOOST_AUTO_TEST_CASE( bracketed_species_name ) {
	BOOST_CHECK_EQUAL( extractBracketedName( "NP_1.1 protein X [strain 1] [Escherichia coli]" ), "Escherichia coli" );
	BOOST_CHECK_EQUAL( extractBracketedName( "NP_1.1 protein X" ), "" );
	BOOST_CHECK_EQUAL( extractBracketedName( "NP_1.1 [unterminated" ), "" );
}

BOOST_AUTO_TEST_CASE( two_column_mapping ) {
	std::istringstream flatfile( "# accession\ttaxid\nNC_000913.3\t511145\nXM_1\t9606\n" );
	const StrIDConverterFlatfileMemory seqid2taxid( flatfile );
	BOOST_CHECK_EQUAL( seqid2taxid.size(), 2u );
	BOOST_CHECK_EQUAL( seqid2taxid[ "NC_000913.3" ], 511145u );
	BOOST_CHECK_EQUAL( seqid2taxid[ "XM_1.2" ], 9606u ); // version stripped
	BOOST_CHECK( ! seqid2taxid.contains( "NC_000914.1" ) );
	BOOST_CHECK_THROW( seqid2taxid[ "NC_000914.1" ], TaxonMappingNotFound );
}

BOOST_AUTO_TEST_CASE( ncbi_accession2taxid_mapping ) {
	std::istringstream flatfile( "accession\taccession.version\ttaxid\tgi\nNC_000913\tNC_000913.3\t511145\t556503834\n" );
	const StrIDConverterFlatfileMemory seqid2taxid( flatfile );
	BOOST_CHECK_EQUAL( seqid2taxid[ "NC_000913.3" ], 511145u );
	BOOST_CHECK_EQUAL( seqid2taxid[ "NC_000913" ], 511145u );
	BOOST_CHECK_EQUAL( seqid2taxid[ "NC_000913.4" ], 511145u );
}

BOOST_AUTO_TEST_CASE( bad_mapping_line ) {
	std::istringstream bad_taxid( "NC_1\tabc\n" );
	BOOST_CHECK_THROW( StrIDConverterFlatfileMemory( bad_taxid, "bad" ), ParsingError );
	BOOST_CHECK_THROW( loadStrIDConverterFromFile( "/nonexistent/accession.map" ), FileNotFound );
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE( classification_report )

BOOST_AUTO_TEST_CASE( read_id_normalization ) {
	BOOST_CHECK_EQUAL( normalizeReadId( "read1/1" ), "read1" );
	BOOST_CHECK_EQUAL( normalizeReadId( "read1/2 length=100" ), "read1" );
	BOOST_CHECK_EQUAL( normalizeReadId( "read1 1:N:0" ), "read1" );
	BOOST_CHECK_EQUAL( normalizeReadId( "read/3" ), "read/3" );
}

BOOST_FIXTURE_TEST_CASE( kraken2_pairs_need_all_entries_accepted, SmallTaxonomyFixture ) {
	const DescendantFilter filter( taxinter, "A" );
	std::istringstream report(
		"C\tr1\t4\t150\t4:116\n"
		"C\tr1\t3\t150\t3:116\n"
		"C\tr2\t4\t150\t4:116\n"
		"C\tr2\t5\t150\t5:116\n"
		"U\tr3\t0\t150\t0:116\n"
		"C\tr4\tC (taxid 4)\t150\t4:116\n"
		"C\tr5\t5\t150\t5:116\n"
		"C\tr6\t77\t150\t77:116\n" );
	const ClassificationReport reads( report, ReportFormat::kraken2, filter );

	BOOST_CHECK_EQUAL( reads.size(), 6u );
	BOOST_REQUIRE( reads.find( "r1" ) );
	BOOST_CHECK( reads.find( "r1" )->accepted );
	BOOST_CHECK( ! reads.find( "r2" )->accepted );
	BOOST_CHECK_EQUAL( reads.find( "r2" )->taxid, 5u );
	BOOST_CHECK( ! reads.find( "r3" )->accepted );
	BOOST_CHECK_EQUAL( reads.find( "r3" )->taxid, 0u );
	BOOST_CHECK( reads.find( "r4" )->accepted );
	BOOST_CHECK( ! reads.find( "r5" )->accepted );
	BOOST_CHECK( ! reads.find( "r6" )->accepted );
	BOOST_CHECK( reads.find( "r7" ) == NULL );
	BOOST_CHECK( reads.find( "r1/1" ) );

	BOOST_CHECK_EQUAL( reads.getStats().entries, 8u );
	BOOST_CHECK_EQUAL( reads.getStats().unclassified, 1u );
	BOOST_CHECK_EQUAL( reads.getStats().unknown_taxa, 1u );
}

BOOST_FIXTURE_TEST_CASE( centrifuge_best_score_wins, SmallTaxonomyFixture ) {
	const DescendantFilter filter( taxinter, "A" );
	std::istringstream report(
		"readID\tseqID\ttaxID\tscore\t2ndBestScore\thitLength\tqueryLength\tnumMatches\n"
		"r1\tNC_1\t5\t100\t0\t80\t150\t2\n"
		"r1\tNC_2\t4\t300\t0\t80\t150\t2\n"
		"r2\tNC_1\t4\t300\t0\t80\t150\t2\n"
		"r2\tNC_2\t5\t500\t0\t80\t150\t2\n"
		"r3\tNC_1\t5\t200\t0\t80\t150\t2\n"
		"r3\tNC_2\t3\t200\t0\t80\t150\t2\n"
		"r4\tunclassified\t0\t0\t0\t0\t150\t1\n" );
	const ClassificationReport reads( report, ReportFormat::centrifuge, filter );

	BOOST_CHECK_EQUAL( reads.size(), 4u );
	BOOST_CHECK( reads.find( "r1" )->accepted );
	BOOST_CHECK_EQUAL( reads.find( "r1" )->score, 300u );
	BOOST_CHECK( ! reads.find( "r2" )->accepted );
	BOOST_CHECK( reads.find( "r3" )->accepted ); // tie with one accepted entry
	BOOST_CHECK( ! reads.find( "r4" )->accepted );
	BOOST_CHECK_EQUAL( reads.getStats().unknown_taxa, 0u );
}

BOOST_FIXTURE_TEST_CASE( malformed_report_lines, SmallTaxonomyFixture ) {
	const DescendantFilter filter( taxinter, "A" );
	std::istringstream kraken( "X\tr1\t4\n" );
	BOOST_CHECK_THROW( ClassificationReport( kraken, ReportFormat::kraken2, filter ), ParsingError );

	std::istringstream taxid( "C\tr1\tfour\n" );
	BOOST_CHECK_THROW( ClassificationReport( taxid, ReportFormat::kraken2, filter ), ParsingError );

	std::istringstream centrifuge( "r1\tNC_1\t4\n" );
	BOOST_CHECK_THROW( ClassificationReport( centrifuge, ReportFormat::centrifuge, filter ), ParsingError );

	std::istringstream score( "r1\tNC_1\t4\thigh\n" );
	BOOST_CHECK_THROW( ClassificationReport( score, ReportFormat::centrifuge, filter ), ParsingError );

	BOOST_CHECK_THROW( ClassificationReport( "/nonexistent/report.tsv", ReportFormat::kraken2, filter ), FileNotFound );
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE( record_filters )

BOOST_FIXTURE_TEST_CASE( fasta_keeps_descendants_in_order, SmallTaxonomyFixture ) {
	const DescendantFilter filter( taxinter, "A" );
	std::vector< SequenceRecord > records;
	records.push_back( makeRecord( "NC_1.1 recA [A]" ) );
	records.push_back( makeRecord( "NC_2.1 recB [B]" ) );
	records.push_back( makeRecord( "NC_3.1 recC [C]" ) );
	records.push_back( makeRecord( "NC_4.1 recD [D]" ) );

	FastaRecordFilter fasta_filter( filter, NULL );
	VectorSource source( records );
	VectorSink sink;
	BOOST_CHECK_EQUAL( filterRecords( source, sink, fasta_filter ), 3u );

	const std::vector< std::string > kept = ids( sink.records );
	const std::string expected[] = { "NC_1.1 recA [A]", "NC_2.1 recB [B]", "NC_3.1 recC [C]" };
	BOOST_CHECK_EQUAL_COLLECTIONS( kept.begin(), kept.end(), expected, expected + 3 );
	BOOST_CHECK_EQUAL( sink.records[ 0 ].seq, "ACGT" );
	BOOST_CHECK_EQUAL( fasta_filter.getStats().total, 4u );
	BOOST_CHECK_EQUAL( fasta_filter.getStats().rejected, 1u );
}

BOOST_FIXTURE_TEST_CASE( fasta_drops_unresolvable_records, SmallTaxonomyFixture ) {
	const DescendantFilter filter( taxinter, "A" );
	FastaRecordFilter fasta_filter( filter, NULL );
	BOOST_CHECK( ! fasta_filter( makeRecord( "NC_1.1 no species name" ) ) );
	BOOST_CHECK( ! fasta_filter( makeRecord( "NC_1.1 unknown [Z]" ) ) );
	BOOST_CHECK_EQUAL( fasta_filter.getStats().unresolved, 2u );
}

BOOST_FIXTURE_TEST_CASE( fasta_accession_classes, SmallTaxonomyFixture ) {
	const DescendantFilter filter( taxinter, "A" );
	FastaFilterOptions options;
	options.exclude_predicted = true;
	FastaRecordFilter no_predicted( filter, NULL, options );
	BOOST_CHECK( no_predicted( makeRecord( "NC_1.1 [C]" ) ) );
	BOOST_CHECK( ! no_predicted( makeRecord( "XM_1.1 [C]" ) ) );
	BOOST_CHECK( no_predicted( makeRecord( "WP_1.1 [C]" ) ) );
	BOOST_CHECK_EQUAL( no_predicted.getStats().excluded, 1u );

	options.exclude_predicted = false;
	options.exclude_curated = true;
	FastaRecordFilter no_curated( filter, NULL, options );
	BOOST_CHECK( ! no_curated( makeRecord( "NC_1.1 [C]" ) ) );
	BOOST_CHECK( no_curated( makeRecord( "XM_1.1 [C]" ) ) );
	BOOST_CHECK( no_curated( makeRecord( "WP_1.1 [C]" ) ) );
}

BOOST_FIXTURE_TEST_CASE( fasta_with_accession_map, SmallTaxonomyFixture ) {
	const DescendantFilter filter( taxinter, "A" );
	std::istringstream flatfile( "NC_1\t4\nNC_2\t5\nNC_3\t99\n" );
	const StrIDConverterFlatfileMemory seqid2taxid( flatfile );
	FastaRecordFilter fasta_filter( filter, &seqid2taxid );

	BOOST_CHECK( fasta_filter( makeRecord( "NC_1.1 the bracket is ignored [D]" ) ) );
	BOOST_CHECK( ! fasta_filter( makeRecord( "NC_2.1 [C]" ) ) );
	BOOST_CHECK( ! fasta_filter( makeRecord( "NC_3.1 unknown taxon" ) ) );
	BOOST_CHECK( ! fasta_filter( makeRecord( "NC_4.1 not in map" ) ) );
	BOOST_CHECK_EQUAL( fasta_filter.getStats().unresolved, 2u );
}

BOOST_FIXTURE_TEST_CASE( fastq_follows_report, SmallTaxonomyFixture ) {
	const DescendantFilter filter( taxinter, "A" );
	std::istringstream report( "C\tr1\t4\nC\tr2\t5\nC\tr3\t3\n" );
	const ClassificationReport reads( report, ReportFormat::kraken2, filter );

	std::vector< SequenceRecord > records;
	records.push_back( makeRecord( "r1/1", "ACGT", "IIII" ) );
	records.push_back( makeRecord( "r2/1", "ACGT", "IIII" ) );
	records.push_back( makeRecord( "r3/1 extra", "ACGT", "IIII" ) );

	FastqRecordFilter fastq_filter( reads );
	VectorSource source( records );
	VectorSink sink;
	filterRecords( source, sink, fastq_filter );

	BOOST_REQUIRE_EQUAL( sink.records.size(), 2u );
	BOOST_CHECK_EQUAL( sink.records[ 0 ].id, "r1/1" );
	BOOST_CHECK_EQUAL( sink.records[ 1 ].id, "r3/1 extra" );
	BOOST_CHECK_EQUAL( sink.records[ 1 ].qual, "IIII" );
}

BOOST_FIXTURE_TEST_CASE( fastq_unmapped_reads, SmallTaxonomyFixture ) {
	const DescendantFilter filter( taxinter, "A" );
	std::istringstream report( "C\tr1\t4\n" );
	const ClassificationReport reads( report, ReportFormat::kraken2, filter );

	FastqRecordFilter strict( reads );
	try {
		strict( makeRecord( "r9", "A", "I" ) );
		BOOST_ERROR( "unmapped read accepted" );
	} catch( const UnmappedRead& e ) {
		const std::string* read_id = boost::get_error_info< seqid_info >( e );
		BOOST_REQUIRE( read_id );
		BOOST_CHECK_EQUAL( *read_id, "r9" );
	}

	FastqFilterOptions options;
	options.unmapped = UnmappedReadPolicy::skip;
	FastqRecordFilter lenient( reads, options );
	BOOST_CHECK( ! lenient( makeRecord( "r9", "A", "I" ) ) );
	BOOST_CHECK( lenient( makeRecord( "r1", "A", "I" ) ) );
	BOOST_CHECK_EQUAL( lenient.getStats().unmapped, 1u );
	BOOST_CHECK_EQUAL( lenient.getStats().accepted, 1u );
}

BOOST_AUTO_TEST_SUITE_END()



BOOST_AUTO_TEST_SUITE( output_files )

BOOST_AUTO_TEST_CASE( filtered_output_names ) {
	BOOST_CHECK_EQUAL( filteredOutputPath( "/data/reads_1.fq.gz" ), "/data/reads_1.filtered.fq.gz" );
	BOOST_CHECK_EQUAL( filteredOutputPath( "/data/reads_1.fq.gz", "/out" ), "/out/reads_1.filtered.fq.gz" );
	BOOST_CHECK_EQUAL( filteredOutputPath( "/data/reads", "/out" ), "/out/reads.filtered" );
}

BOOST_FIXTURE_TEST_CASE( uncommitted_outputs_are_removed, TempDirFixture ) {
	std::string tmp_filename;
	{
		OutputFileGuard outputs;
		tmp_filename = outputs.add( path( "reads.filtered.fq" ) );
		BOOST_CHECK( boost::algorithm::ends_with( tmp_filename, ".fq" ) );
		std::ofstream tmp_file( tmp_filename.c_str() );
		tmp_file << "@r1\nA\n+\nI\n";
		tmp_file.close();
		BOOST_CHECK( boost::filesystem::exists( tmp_filename ) );
	}
	BOOST_CHECK( ! boost::filesystem::exists( tmp_filename ) );
	BOOST_CHECK( ! boost::filesystem::exists( path( "reads.filtered.fq" ) ) );
}

BOOST_FIXTURE_TEST_CASE( committed_outputs_are_renamed, TempDirFixture ) {
	std::string tmp_filename;
	{
		OutputFileGuard outputs;
		tmp_filename = outputs.add( path( "reads.filtered.fq" ) );
		std::ofstream tmp_file( tmp_filename.c_str() );
		tmp_file << "@r1\nA\n+\nI\n";
		tmp_file.close();
		outputs.commit();
	}
	BOOST_CHECK( ! boost::filesystem::exists( tmp_filename ) );
	BOOST_CHECK( boost::filesystem::exists( path( "reads.filtered.fq" ) ) );
}

BOOST_FIXTURE_TEST_CASE( same_output_for_two_inputs_is_refused, TempDirFixture ) {
	const std::string outdir = dir.string();
	BOOST_CHECK_EQUAL( filteredOutputPath( "/runA/reads.fq", outdir ), filteredOutputPath( "/runB/reads.fq", outdir ) );

	OutputFileGuard outputs;
	outputs.add( filteredOutputPath( "/runA/reads.fq", outdir ) );
	BOOST_CHECK_THROW( outputs.add( filteredOutputPath( "/runB/reads.fq", outdir ) ), FileError );
	BOOST_CHECK_THROW( outputs.add( ( dir / "sub" / ".." / "reads.filtered.fq" ).string() ), FileError );
	BOOST_CHECK_EQUAL( outputs.size(), 1u );
	outputs.add( filteredOutputPath( "/runA/reads_2.fq", outdir ) );
	BOOST_CHECK_EQUAL( outputs.size(), 2u );
}

BOOST_FIXTURE_TEST_CASE( failed_commit_leaves_no_outputs, TempDirFixture ) {
	std::string tmp_filename;
	{
		OutputFileGuard outputs;
		tmp_filename = outputs.add( path( "a.filtered.fq" ) );
		std::ofstream tmp_file( tmp_filename.c_str() );
		tmp_file << "@r1\nA\n+\nI\n";
		tmp_file.close();
		outputs.add( path( "missing/b.filtered.fq" ) ); // temporary file never written
		BOOST_CHECK_THROW( outputs.commit(), FileError );
	}
	BOOST_CHECK( ! boost::filesystem::exists( path( "a.filtered.fq" ) ) );
	BOOST_CHECK( ! boost::filesystem::exists( tmp_filename ) );
	BOOST_CHECK( boost::filesystem::is_empty( dir ) );
}

BOOST_AUTO_TEST_SUITE_END()
