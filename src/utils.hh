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

#ifndef utils_hh_
#define utils_hh_

#include "constants.hh"
#include "types.hh"
#include <boost/algorithm/string/trim.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <iostream>
#include <string>



inline bool ignoreLine( const std::string& line ) {
	return line.empty() || line[0] == default_comment_symbol;
}



// splits at any of the delimiters; at most fieldnum splits are done (0 means no limit), the
// remainder goes into the last token
template < class ContainerT >
void tokenizeSingleCharDelim(const std::string& str, ContainerT& tokens, const std::string& delimiters = " ", int fieldnum = 0, const bool trimempty = false) {
	std::string::size_type pos, lastpos = 0;
	while( true ) {
		if( fieldnum == 1 ) break;
		pos = str.find_first_of( delimiters, lastpos );
		if( pos == std::string::npos ) break;
		if( pos != lastpos || !trimempty ) {
			tokens.push_back( typename ContainerT::value_type( str.data() + lastpos, pos - lastpos ) );
			if( fieldnum ) --fieldnum;
		}
		lastpos = pos + 1;
	}
	if( lastpos < str.size() || !trimempty ) {
		tokens.push_back( typename ContainerT::value_type( str.data() + lastpos, str.size() - lastpos ) ); //append rest
	}
}



template < class ContainerT >
void tokenizeMultiCharDelim(const std::string& str, ContainerT& tokens, const std::string& delimiter = " ", int fieldnum = 0, const bool trimempty = false) {
	const std::string::size_type delimsize( delimiter.size() );
	std::string::size_type pos, lastpos = 0;
	while( true ) {
		if( fieldnum == 1 ) break;
		pos = str.find( delimiter, lastpos );
		if( pos == std::string::npos ) break;
		if( pos != lastpos || !trimempty ) {
			tokens.push_back( typename ContainerT::value_type( str.data() + lastpos, pos - lastpos ) );
			if( fieldnum ) --fieldnum;
		}
		lastpos = pos + delimsize;
	}
	if( lastpos < str.size() || !trimempty ) {
		tokens.push_back( typename ContainerT::value_type( str.data() + lastpos, str.size() - lastpos ) );
	}
}



// "NC_000913.3" -> "NC_000913"
inline std::string stripVersion( const std::string& id ) {
	const std::string::size_type pos = id.find( version_separator );
	if( pos == std::string::npos ) return id;
	return id.substr( 0, pos );
}



// "GCF_000005845.2_ASM584v2_genomic.fna.gz" -> "GCF_000005845.2"
inline std::string accessionFromFilename( const std::string& name ) {
	const std::string::size_type first = name.find( '_' );
	if( first == std::string::npos ) return name;
	const std::string::size_type second = name.find( '_', first + 1 );
	if( second == std::string::npos ) return name;
	return name.substr( 0, second );
}



inline std::string trimmed( const std::string& str ) {
	return boost::algorithm::trim_copy( str );
}



inline std::string formatFixed( double value, unsigned int decimals ) {
	return boost::str( boost::format( "%." + boost::lexical_cast< std::string >( decimals ) + "f" ) % value );
}



// degraded mode is recoverable, the run continues with reduced quality
inline void warnDegradedMode( const std::string& message, std::ostream& logsink ) {
	std::cerr << "warning (degraded mode): " << message << std::endl;
	logsink << "warning (degraded mode): " << message << std::endl;
}

#endif // utils_hh_
