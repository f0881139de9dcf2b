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

#ifndef outputfiles_hh_
#define outputfiles_hh_

#include <string>
#include <utility>
#include <vector>
#include <boost/filesystem/path.hpp>



// "<outdir>/<stem>.filtered.<ext>" for an input "<dir>/<stem>.<ext>", where the extension
// starts at the first dot of the file name ("reads_1.fq.gz" -> "reads_1.filtered.fq.gz");
// an empty outdir means the input's directory
std::string filteredOutputPath( const std::string& input_filename, const std::string& outdir = "" );



// unique sibling of a file that keeps its extensions, so formats can still be told from the name
std::string temporaryOutputPath( const std::string& final_filename );



// Output files are written under temporary names and only moved into place by
// commit(). Files not committed are removed on destruction.
class OutputFileGuard {
	public:
		OutputFileGuard() : committed_( false ) {};
		~OutputFileGuard();

		// registers a final path and returns the temporary path to write to,
		// throws FileError if the path is already registered
		std::string add( const std::string& final_filename );

		// renames all temporary files, throws FileError; on failure none of the
		// final files are left in place
		void commit();

		std::size_t size() const { return files_.size(); };

	private:
		OutputFileGuard( const OutputFileGuard& );
		OutputFileGuard& operator=( const OutputFileGuard& );

		std::vector< std::pair< boost::filesystem::path, boost::filesystem::path > > files_; // temporary, final
		bool committed_;
};

#endif // outputfiles_hh_
