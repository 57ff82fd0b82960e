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

#ifndef fileparser_hh_
#define fileparser_hh_

#include <fstream>
#include <iostream>
#include <string>
#include "exception.hh"
#include "types.hh"
#include "utils.hh"


// line-based reader which hands each non-comment line to the factory; lines the factory
// rejects with a ParsingError are skipped and counted
template< typename FactoryType >
class FileParser {
public:
    typedef typename FactoryType::value_type RecordType;

    FileParser( const std::string& filename, FactoryType& factory, std::ostream* logsink = NULL ) : filename_( filename ),
                                                                                                  filehandle_( filename.c_str() ),
                                                                                                  handle_( filehandle_ ),
                                                                                                  factory_( factory ),
                                                                                                  logsink_( logsink ) {
        if( ! filehandle_ ) BOOST_THROW_EXCEPTION( FileNotFound {} << file_info {filename} );
        feed();
    }

    FileParser( std::istream& strm, FactoryType& factory, std::ostream* logsink = NULL ) : handle_( strm ),
                                                                                         factory_( factory ),
                                                                                         logsink_( logsink ) {
        feed();
    }

    // NULL at the end of input
    RecordType* next() {
        while( ! eof_ ) {
            try {
                RecordType* ret = factory_.create( line_ );
                feed();
                return ret;
            }
            catch ( ParsingError &e ) {
                ++skipped_;
                if( logsink_ ) {
                    const std::string* info = boost::get_error_info< general_info >( e );
                    *logsink_ << "skipping malformed line " << line_num_;
                    if( ! filename_.empty() ) *logsink_ << " in " << filename_;
                    if( info ) *logsink_ << ": " << *info;
                    *logsink_ << endline;
                }
                feed();
            }
        }
        return NULL;
    }

    // start over, only possible when reading from a named file
    bool rewind() {
        if( filename_.empty() ) return false;
        filehandle_.clear();
        filehandle_.seekg( 0, std::ios::beg );
        if( ! filehandle_ ) BOOST_THROW_EXCEPTION( FileError {} << file_info {filename_} << general_info {"cannot rewind"} );
        line_num_ = 0;
        skipped_ = 0;
        eof_ = false;
        feed();
        return true;
    }

    inline void destroy( const RecordType* rec ) const { factory_.destroy( rec ); }
    inline bool eof() const { return eof_; }
    inline very_large_unsigned_int numSkipped() const { return skipped_; }
    inline very_large_unsigned_int lineNumber() const { return line_num_; }

private:
    void feed() {
        while( std::getline( handle_, line_ ) ) {
            ++line_num_;
            if( ! ignoreLine( line_ ) ) return;
        }
        eof_ = true;
    }

    const std::string filename_;
    std::ifstream filehandle_;
    std::istream& handle_;
    std::string line_;
    FactoryType& factory_;
    std::ostream* logsink_;

    very_large_unsigned_int line_num_ = 0;
    very_large_unsigned_int skipped_ = 0;
    bool eof_ = false;
};

#endif  // fileparser_hh_
