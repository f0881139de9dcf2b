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

#ifndef seqfile_hh_
#define seqfile_hh_

#include <ostream>
#include <string>
#include <vector>
#include <boost/iostreams/filtering_stream.hpp>
#include <seqan/seq_io.h>
#include "types.hh"
#include "classificationreport.hh"
#include "recordfilter.hh"



enum class SeqFormat {
	fasta,
	fastq
};



// FASTA or FASTQ records from a (possibly gzipped) file, format detected by SeqAn
class SeqFileSource {
	public:
		explicit SeqFileSource( const std::string& filename );

		// false at the end of the file, throws ParsingError on malformed records
		bool readRecord( SequenceRecord& rec );

	private:
		seqan::SeqFileIn file_;
		const std::string filename_;
		seqan::CharString id_, seq_, qual_;
};



// Writes records in the given format whatever the file is called. File output is
// gzip compressed if the name ends in ".gz". FASTA sequences are wrapped at fasta_line_length.
class SeqFileSink {
	public:
		SeqFileSink( const std::string& filename, const SeqFormat format );
		SeqFileSink( std::ostream& stream, const SeqFormat format );

		void writeRecord( const SequenceRecord& rec );

		// flushes everything to the file or stream, throws FileError
		void close();

	private:
		SeqFileSink( const SeqFileSink& );
		SeqFileSink& operator=( const SeqFileSink& );

		void open( const SeqFormat format );

		boost::iostreams::filtering_ostream out_; // must outlive file_
		seqan::SeqFileOut file_;
		const std::string filename_;
		seqan::CharString id_, seq_, qual_;
};



// Filters each FASTQ input into filteredOutputPath( input, outdir ), creating outdir if
// needed. All outputs are registered before the first read is looked at and are only
// moved into place after the last input is done, so an error leaves none of them.
// Returns the statistics per input.
std::vector< FilterStats > filterFastqFiles( const std::vector< std::string >& input_filenames, const std::string& outdir, const ClassificationReport& report, const FastqFilterOptions& options = FastqFilterOptions() );

// FASTA input to output_filename, or to stdout if it is empty
void filterFastaFile( const std::string& input_filename, const std::string& output_filename, FastaRecordFilter& filter );

#endif // seqfile_hh_
