#include "outputfiles.hh"
#include <iostream>
#include <boost/filesystem.hpp>
#include "exception.hh"



namespace {

// splits "reads_1.fq.gz" into "reads_1" and ".fq.gz"
std::pair< std::string, std::string > splitExtensions( const std::string& filename ) {
	const std::string::size_type pos = filename.find( '.', 1 ); // keep leading dot of hidden files
	if( pos == std::string::npos ) return std::make_pair( filename, std::string() );
	return std::make_pair( filename.substr( 0, pos ), filename.substr( pos ) );
}

}



std::string filteredOutputPath( const std::string& input_filename, const std::string& outdir ) {
	const boost::filesystem::path input( input_filename );
	const std::pair< std::string, std::string > parts = splitExtensions( input.filename().string() );
	const boost::filesystem::path dir = outdir.empty() ? input.parent_path() : boost::filesystem::path( outdir );
	return ( dir / ( parts.first + ".filtered" + parts.second ) ).string();
}



std::string temporaryOutputPath( const std::string& final_filename ) {
	const boost::filesystem::path final_path( final_filename );
	const std::pair< std::string, std::string > parts = splitExtensions( final_path.filename().string() );
	const boost::filesystem::path tmpname = boost::filesystem::unique_path( parts.first + ".tmp-%%%%%%%%" + parts.second );
	return ( final_path.parent_path() / tmpname ).string();
}



OutputFileGuard::~OutputFileGuard() {
	if( committed_ ) return;
	for( std::vector< std::pair< boost::filesystem::path, boost::filesystem::path > >::const_iterator it = files_.begin(); it != files_.end(); ++it ) {
		boost::system::error_code ec;
		boost::filesystem::remove( it->first, ec );
		if( ec ) std::cerr << "Could not remove temporary file '" << it->first.string() << "': " << ec.message() << std::endl;
	}
}



std::string OutputFileGuard::add( const std::string& final_filename ) {
	const boost::filesystem::path final_path = boost::filesystem::absolute( final_filename ).lexically_normal();
	for( std::vector< std::pair< boost::filesystem::path, boost::filesystem::path > >::const_iterator it = files_.begin(); it != files_.end(); ++it ) {
		if( boost::filesystem::absolute( it->second ).lexically_normal() == final_path ) {
			BOOST_THROW_EXCEPTION( FileError{} << general_info{ "two outputs would be written to the same file" } << file_info{ final_filename } );
		}
	}

	const std::string tmp_filename = temporaryOutputPath( final_filename );
	files_.push_back( std::make_pair( boost::filesystem::path( tmp_filename ), boost::filesystem::path( final_filename ) ) );
	return tmp_filename;
}



void OutputFileGuard::commit() {
	for( std::size_t i = 0; i < files_.size(); ++i ) {
		boost::system::error_code ec;
		boost::filesystem::rename( files_[ i ].first, files_[ i ].second, ec );
		if( ec ) {
			// move the files renamed so far back, the destructor removes them
			for( std::size_t j = 0; j < i; ++j ) {
				boost::system::error_code undo_ec;
				boost::filesystem::rename( files_[ j ].second, files_[ j ].first, undo_ec );
				if( undo_ec ) std::cerr << "Could not take back output file '" << files_[ j ].second.string() << "': " << undo_ec.message() << std::endl;
			}
			BOOST_THROW_EXCEPTION( FileError{} << general_info{ ec.message() } << file_info{ files_[ i ].second.string() } );
		}
	}
	committed_ = true;
}
