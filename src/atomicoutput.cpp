#include "atomicoutput.hh"
#include "exception.hh"
#include <boost/filesystem/operations.hpp>



AtomicOutputFile::AtomicOutputFile( const std::string& filename ) : filename_( filename ), committed_( false ) {
	namespace fs = boost::filesystem;
	const fs::path target( filename );
	fs::path dir = target.parent_path();
	if( dir.empty() ) dir = ".";
	boost::system::error_code ec;
	const fs::file_status status = fs::status( dir, ec );
	if( ec && status.type() != fs::file_not_found ) BOOST_THROW_EXCEPTION( FileError() << file_info( dir.string() ) << general_info( ec.message() ) );
	if( ! fs::is_directory( status ) ) BOOST_THROW_EXCEPTION( FileNotFound() << file_info( dir.string() ) << general_info( "output directory does not exist" ) );
	const fs::path tmpname = fs::unique_path( "." + target.filename().string() + ".%%%%-%%%%-%%%%.tmp", ec );
	if( ec ) BOOST_THROW_EXCEPTION( FileError() << file_info( filename ) << general_info( ec.message() ) );
	tmppath_ = dir / tmpname;
	handle_.open( tmppath_.string().c_str() );
	if( ! handle_ ) BOOST_THROW_EXCEPTION( FileError() << file_info( tmppath_.string() ) );
}



AtomicOutputFile::~AtomicOutputFile() {
	if( committed_ ) return;
	if( handle_.is_open() ) handle_.close();
	boost::system::error_code ec;
	boost::filesystem::remove( tmppath_, ec ); // nothing left to report from a destructor
}



void AtomicOutputFile::commit() {
	handle_.flush();
	if( ! handle_ ) BOOST_THROW_EXCEPTION( FileError() << file_info( tmppath_.string() ) << general_info( "write failed" ) );
	handle_.close();
	boost::system::error_code ec;
	boost::filesystem::rename( tmppath_, filename_, ec );
	if( ec ) BOOST_THROW_EXCEPTION( FileError() << file_info( filename_ ) << general_info( ec.message() ) );
	committed_ = true;
}
