#include "externaltool.hh"
#include "cancellation.hh"
#include "exception.hh"
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/thread/thread.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>



namespace {

const int exec_failure_status = 127;

}



std::string ExternalCommand::str() const {
	std::string cmd = program_;
	for( std::vector< std::string >::const_iterator it = args_.begin(); it != args_.end(); ++it ) {
		cmd += ' ';
		if( it->find_first_of( " \t'\"" ) != std::string::npos ) cmd += '\'' + *it + '\'';
		else cmd += *it;
	}
	return cmd;
}



void ExternalCommand::run( const std::string& stdout_filename, std::ostream* logsink ) const {
	if( logsink ) *logsink << "running: " << str() << std::endl;

	// argv must outlive the fork, the child only execs or exits
	std::vector< const char* > argv;
	argv.push_back( program_.c_str() );
	for( std::vector< std::string >::const_iterator it = args_.begin(); it != args_.end(); ++it ) argv.push_back( it->c_str() );
	argv.push_back( NULL );

	int outfd = -1;
	if( ! stdout_filename.empty() ) {
		outfd = open( stdout_filename.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644 );
		if( outfd < 0 ) BOOST_THROW_EXCEPTION( FileError() << file_info( stdout_filename ) << general_info( std::strerror( errno ) ) );
	}

	std::cerr.flush();
	std::cout.flush();
	const pid_t pid = fork();
	if( pid < 0 ) {
		const int err = errno;
		if( outfd >= 0 ) close( outfd );
		BOOST_THROW_EXCEPTION( ExternalToolError() << command_info( str() ) << general_info( std::string( "fork failed: " ) + std::strerror( err ) ) );
	}

	if( pid == 0 ) {
		if( outfd >= 0 ) {
			if( dup2( outfd, STDOUT_FILENO ) < 0 ) _exit( exec_failure_status );
			close( outfd );
		}
		execvp( program_.c_str(), const_cast< char* const* >( &argv[0] ) );
		_exit( exec_failure_status );
	}

	if( outfd >= 0 ) close( outfd );

	int status = 0;
	while( true ) {
		const pid_t ret = waitpid( pid, &status, WNOHANG );
		if( ret == pid ) break;
		if( ret < 0 ) {
			const int err = errno;
			if( err == EINTR ) continue;
			BOOST_THROW_EXCEPTION( ExternalToolError() << command_info( str() ) << general_info( std::string( "waitpid failed: " ) + std::strerror( err ) ) );
		}
		if( cancellation::requested() ) {
			kill( pid, SIGTERM );
			while( waitpid( pid, &status, 0 ) < 0 && errno == EINTR ) {}
			BOOST_THROW_EXCEPTION( CancellationError() << command_info( str() ) );
		}
		boost::this_thread::sleep( boost::posix_time::milliseconds( 50 ) );
	}

	if( WIFSIGNALED( status ) ) {
		BOOST_THROW_EXCEPTION( ExternalToolError() << command_info( str() ) << exit_status_info( 128 + WTERMSIG( status ) ) << general_info( "terminated by signal" ) );
	}
	const int exit_status = WIFEXITED( status ) ? WEXITSTATUS( status ) : -1;
	if( exit_status == exec_failure_status ) {
		BOOST_THROW_EXCEPTION( ExternalToolError() << command_info( str() ) << exit_status_info( exit_status ) << general_info( "could not execute " + program_ ) );
	}
	if( exit_status != 0 ) BOOST_THROW_EXCEPTION( ExternalToolError() << command_info( str() ) << exit_status_info( exit_status ) );
	if( logsink ) *logsink << "finished: " << program_ << std::endl;
}



bool findExecutable( const std::string& program ) {
	if( program.find( '/' ) != std::string::npos ) return access( program.c_str(), X_OK ) == 0;
	const char* path = std::getenv( "PATH" );
	if( ! path ) return false;
	std::vector< std::string > dirs;
	const std::string pathstr( path );
	boost::algorithm::split( dirs, pathstr, boost::algorithm::is_any_of( ":" ) );
	for( std::vector< std::string >::const_iterator it = dirs.begin(); it != dirs.end(); ++it ) {
		if( it->empty() ) continue;
		const boost::filesystem::path candidate = boost::filesystem::path( *it ) / program;
		if( access( candidate.c_str(), X_OK ) == 0 ) return true;
	}
	return false;
}
