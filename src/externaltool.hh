/*
hymet assigns taxonomic lineages to metagenomic contigs based on sequence alignment.

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

#ifndef externaltool_hh_
#define externaltool_hh_

#include <ostream>
#include <string>
#include <vector>



// a program with arguments, run synchronously in a child process
class ExternalCommand {
	public:
		explicit ExternalCommand( const std::string& program ) : program_( program ) {}

		ExternalCommand& arg( const std::string& argument ) {
			args_.push_back( argument );
			return *this;
		}

		template< typename Iterator >
		ExternalCommand& args( Iterator begin, Iterator end ) {
			args_.insert( args_.end(), begin, end );
			return *this;
		}

		const std::string& program() const { return program_; }
		const std::vector< std::string >& arguments() const { return args_; }

		// shell-like rendering for messages
		std::string str() const;

		// standard output goes to stdout_filename if not empty, otherwise it is inherited; throws
		// ExternalToolError for a failed launch, a non-zero exit or a signal, CancellationError if
		// cancellation was requested while the child ran (the child receives SIGTERM)
		void run( const std::string& stdout_filename = std::string(), std::ostream* logsink = NULL ) const;

	private:
		std::string program_;
		std::vector< std::string > args_;
};



// true if the program can be found in PATH or is an executable path
bool findExecutable( const std::string& program );

#endif // externaltool_hh_
