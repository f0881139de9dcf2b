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

#ifndef recordfilter_hh_
#define recordfilter_hh_

#include <string>
#include "types.hh"
#include "accessconv.hh"
#include "classificationreport.hh"
#include "descendantfilter.hh"



// one FASTA or FASTQ record, id is the full header line without '>' or '@'
struct SequenceRecord {
	std::string id;
	std::string seq;
	std::string qual; // empty for FASTA
};



struct FilterStats {
	FilterStats() : total( 0 ), accepted( 0 ), excluded( 0 ), unresolved( 0 ), unmapped( 0 ), rejected( 0 ) {}
	large_unsigned_int total;
	large_unsigned_int accepted;
	large_unsigned_int excluded; // dropped by accession class
	large_unsigned_int unresolved; // no taxon found for the record
	large_unsigned_int unmapped; // read not in the classification report
	large_unsigned_int rejected; // taxon outside the ancestor's subtree
};



// abstract base class
class RecordFilter {
	public:
		virtual ~RecordFilter() {};
		virtual bool operator()( const SequenceRecord& rec ) = 0;
		const FilterStats& getStats() const { return stats_; };
	protected:
		FilterStats stats_;
};



struct FastaFilterOptions {
	FastaFilterOptions() : exclude_curated( false ), exclude_predicted( false ) {}
	bool exclude_curated;
	bool exclude_predicted;
};



// Keeps RefSeq records whose taxon lies below the ancestor. The taxon comes from the
// accession mapping if one is given, else from the species name in brackets. Records
// that cannot be resolved are dropped, never an error.
class FastaRecordFilter : public RecordFilter {
	public:
		FastaRecordFilter( const DescendantFilter& filter, const StrIDConverter* seqid2taxid, const FastaFilterOptions& options = FastaFilterOptions() ) :
			filter_( filter ),
			seqid2taxid_( seqid2taxid ),
			options_( options ) {};

		bool operator()( const SequenceRecord& rec );

	private:
		const TaxonNode* resolve( const std::string& header, const std::string& accession ) const;

		const DescendantFilter& filter_;
		const StrIDConverter* seqid2taxid_; // may be NULL
		const FastaFilterOptions options_;
};



enum class UnmappedReadPolicy {
	strict, // throw UnmappedRead
	skip // warn, count and drop
};

struct FastqFilterOptions {
	FastqFilterOptions() : unmapped( UnmappedReadPolicy::strict ) {}
	UnmappedReadPolicy unmapped;
};



// keeps reads the classification report assigned to the ancestor's subtree
class FastqRecordFilter : public RecordFilter {
	public:
		FastqRecordFilter( const ClassificationReport& report, const FastqFilterOptions& options = FastqFilterOptions() ) :
			report_( report ),
			options_( options ) {};

		bool operator()( const SequenceRecord& rec );

	private:
		const ClassificationReport& report_;
		const FastqFilterOptions options_;
};



// Streams all records from source to sink in order, keeping those the filter accepts.
// SourceT needs bool readRecord( SequenceRecord& ), SinkT needs void writeRecord( const SequenceRecord& ).
template< typename SourceT, typename SinkT >
large_unsigned_int filterRecords( SourceT& source, SinkT& sink, RecordFilter& filter ) {
	SequenceRecord rec;
	large_unsigned_int written = 0;
	while( source.readRecord( rec ) ) {
		if( filter( rec ) ) {
			sink.writeRecord( rec );
			++written;
		}
	}
	return written;
}

#endif // recordfilter_hh_
