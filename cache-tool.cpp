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

#include <boost/program_options/cmdline.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/filesystem/exception.hpp>
#include <boost/format.hpp>
#include <iostream>
#include <fstream>
#include "src/cancellation.hh"
#include "src/constants.hh"
#include "src/exception.hh"
#include "src/identifierlist.hh"
#include "src/referencecache.hh"

using namespace std;



int main( int argc, char** argv ) {

	string command, cache_dir, candidates_filename, downloader_command, assembly_cache_dir, minimap2, index_split, log_filename;
	double max_age_days, max_size_gb;
	bool force_refresh;

	namespace po = boost::program_options;
	po::options_description visible_options ( "Allowed options" );
	visible_options.add_options()
	( "help,h", "show help message" )
	( "citation", "show citation info" )
	( "advanced-options", "show advanced program options" )
	( "command", po::value< string >( &command ), "list, prune or fetch" )
	( "cache-dir,c", po::value< string >( &cache_dir ), "reference cache directory" )
	( "max-age-days", po::value< double >( &max_age_days )->default_value( 0. ), "prune: remove entries older than this, 0 disables" )
	( "max-size-gb", po::value< double >( &max_size_gb )->default_value( 0. ), "prune: remove oldest entries until the cache is at most this large, 0 disables" )
	( "dry-run,n", "prune: only report what would be removed" )
	( "candidates,i", po::value< string >( &candidates_filename ), "fetch: candidate list, one per line" )
	( "downloader,d", po::value< string >( &downloader_command ), "fetch: command downloading the reference genomes" )
	( "logfile,l", po::value< string >( &log_filename )->default_value( "/dev/null" ), "specify name of file for logging (appending lines)" );

	po::options_description hidden_options( "Hidden options" );
	hidden_options.add_options()
	( "assembly-cache-dir", po::value< string >( &assembly_cache_dir ), "directory of downloaded assemblies passed to the downloader" )
	( "minimap2", po::value< string >( &minimap2 )->default_value( "minimap2" ), "minimap2 executable" )
	( "index-split", po::value< string >( &index_split )->default_value( "2g" ), "minimap2 index batch size" )
	( "force-refresh", po::value< bool >( &force_refresh )->default_value( false ), "fetch: download even if the entry is cached" );

	po::positional_options_description positional;
	positional.add( "command", 1 );

	po::options_description all_options;
	all_options.add( visible_options ).add( hidden_options );

	po::variables_map vm;
	try {
		po::store( po::command_line_parser( argc, argv ).options( all_options ).positional( positional ).run(), vm );
		po::notify( vm );
	} catch( po::error& e ) {
		cerr << e.what() << endl << visible_options << endl;
		return EXIT_FAILURE;
	}

	if( vm.count( "help" ) ) {
		cout << "Usage: hymet-cache (list|prune|fetch) [options]" << endl << visible_options << endl;
		return EXIT_SUCCESS;
	}

	if( vm.count( "citation" ) ) {
		cout << citation_note << endl;
		return EXIT_SUCCESS;
	}

	if( vm.count( "advanced-options" ) ) {
		cout << hidden_options << endl;
		return EXIT_SUCCESS;
	}

	if( cache_dir.empty() || ( command != "list" && command != "prune" && command != "fetch" ) ) {
		cout << "Usage: hymet-cache (list|prune|fetch) --cache-dir DIR [options]" << endl;
		cout << visible_options << endl;
		return EXIT_FAILURE;
	}

	std::ofstream logsink( log_filename.c_str(), std::ios_base::app );
	cancellation::installSignalHandlers();

	try {
		ReferenceCache cache( cache_dir, logsink );

		if( command == "list" ) {
			const std::vector< CacheEntryInfo > entries = cache.list();
			very_large_unsigned_int total = 0;
			for( std::vector< CacheEntryInfo >::const_iterator it = entries.begin(); it != entries.end(); ++it ) {
				cout << it->entry.cache_key << tab << it->entry.status << tab << ( it->entry.hasIndex() ? "indexed" : "no-index" ) << tab
				     << boost::format( "%.1f MB" ) % ( it->size_bytes / 1e6 ) << tab << boost::format( "%.1f days" ) % it->age_days << endline;
				total += it->size_bytes;
			}
			std::cerr << entries.size() << " entries, " << boost::format( "%.2f GB" ) % ( total / 1e9 ) << std::endl;
			return EXIT_SUCCESS;
		}

		if( command == "prune" ) {
			if( max_age_days < 0. || max_size_gb < 0. ) BOOST_THROW_EXCEPTION( ConfigurationError() << general_info( "negative pruning limit" ) );
			const bool dry_run = vm.count( "dry-run" );
			const very_large_unsigned_int max_bytes = static_cast< very_large_unsigned_int >( max_size_gb * 1e9 );
			const std::vector< std::string > removed = cache.prune( max_age_days, max_bytes, dry_run );
			for( std::vector< std::string >::const_iterator it = removed.begin(); it != removed.end(); ++it ) cout << *it << endline;
			std::cerr << removed.size() << ( dry_run ? " entries would be removed" : " entries removed" ) << std::endl;
			return EXIT_SUCCESS;
		}

		// fetch
		if( candidates_filename.empty() || downloader_command.empty() ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "candidates" ) << general_info( "fetch needs a candidate list and a downloader" ) );
		std::vector< std::string > candidates;
		readIdentifiers( candidates_filename, candidates );
		ExternalCommandDownloader downloader( downloader_command, assembly_cache_dir, logsink );
		ReferenceCacheEntry entry = cache.resolve( candidates, downloader, force_refresh );
		Minimap2Indexer indexer( minimap2, index_split, logsink );
		cache.ensureIndex( entry, indexer );
		cout << entry.directory.string() << endline;
		return EXIT_SUCCESS;

	} catch( CancellationError& ) {
		cerr << "Interrupted" << endl;
		return EXIT_FAILURE;
	} catch( Exception& e ) {
		cerr << "An unrecoverable error occurred: " << e.what() << endl;
		cerr << endl << "Here is some debugging information to locate the problem:" << endl << boost::diagnostic_information( e ) << endl;
		return EXIT_FAILURE;
	} catch( boost::filesystem::filesystem_error& e ) {
		cerr << "An unrecoverable error occurred: " << e.what() << endl;
		return EXIT_FAILURE;
	}
}
