#include "identifierlist.hh"
#include "atomicoutput.hh"
#include "constants.hh"
#include "exception.hh"
#include "utils.hh"
#include <fstream>



void readIdentifiers( const std::string& filename, std::vector< std::string >& ids ) {
	std::ifstream handle( filename.c_str() );
	if( ! handle ) BOOST_THROW_EXCEPTION( FileNotFound() << file_info( filename ) );

	std::string line;
	bool fasta = false;
	bool first = true;
	while( std::getline( handle, line ) ) {
		const std::string entry = trimmed( line );
		if( entry.empty() ) continue;
		if( first ) {
			fasta = entry[0] == '>';
			first = false;
		}
		if( fasta ) {
			if( entry[0] != '>' ) continue;
			const std::string::size_type end = entry.find_first_of( " \t", 1 );
			const std::string id = entry.substr( 1, end == std::string::npos ? std::string::npos : end - 1 );
			if( ! id.empty() ) ids.push_back( id );
		} else if( entry[0] != default_comment_symbol ) {
			ids.push_back( entry );
		}
	}
}



large_unsigned_int countFastaRecords( const std::string& filename ) {
	std::ifstream handle( filename.c_str() );
	if( ! handle ) BOOST_THROW_EXCEPTION( FileNotFound() << file_info( filename ) );
	large_unsigned_int count = 0;
	std::string line;
	while( std::getline( handle, line ) ) {
		if( ! line.empty() && line[0] == '>' ) ++count;
	}
	return count;
}



void writeIdentifiers( const std::string& filename, const std::vector< std::string >& ids ) {
	AtomicOutputFile output( filename );
	for( std::vector< std::string >::const_iterator it = ids.begin(); it != ids.end(); ++it ) output.stream() << *it << endline;
	output.commit();
}
