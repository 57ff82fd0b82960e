#include <iostream>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <sstream>
#include <boost/filesystem.hpp>
#include <boost/ptr_container/ptr_vector.hpp>
#include <boost/thread.hpp>
#include "src/constants.hh"
#include "src/exception.hh"
#include "src/externaltool.hh"
#include "src/referencecache.hh"
#include "src/unittest.hh"



using namespace std;
namespace fs = boost::filesystem;



namespace {

// writes a tiny reference set and counts its invocations
class CountingDownloader : public ReferenceDownloader {
	public:
		CountingDownloader( bool produce_fasta = true ) : calls_( 0 ), produce_fasta_( produce_fasta ) {}

		void download( const fs::path& genomes_file, const fs::path& workdir, const fs::path& fasta, const fs::path& taxonomy_file ) {
			{
				boost::lock_guard< boost::mutex > lock( mutex_ );
				++calls_;
			}
			boost::this_thread::sleep( boost::posix_time::milliseconds( 100 ) );
			std::ifstream genomes( genomes_file.c_str() );
			std::ofstream fasta_handle( fasta.c_str() );
			std::ofstream taxonomy_handle( taxonomy_file.c_str() );
			taxonomy_handle << "GCF\tTaxID\tIdentifiers" << endline;
			std::string genome;
			while( std::getline( genomes, genome ) ) {
				if( produce_fasta_ ) fasta_handle << '>' << genome << endline << "ACGT" << endline;
				taxonomy_handle << genome << tab << 1 << tab << genome << endline;
			}
		}

		uint calls() const {
			boost::lock_guard< boost::mutex > lock( mutex_ );
			return calls_;
		}

	private:
		mutable boost::mutex mutex_;
		uint calls_;
		const bool produce_fasta_;
};



class FailingDownloader : public ReferenceDownloader {
	public:
		void download( const fs::path&, const fs::path&, const fs::path&, const fs::path& ) {
			BOOST_THROW_EXCEPTION( ExternalToolError() << command_info( "download" ) << exit_status_info( 1 ) );
		}
};



class CountingIndexer : public ReferenceIndexer {
	public:
		CountingIndexer() : calls( 0 ) {}

		void buildIndex( const fs::path& fasta, const fs::path& index ) {
			++calls;
			std::ofstream handle( index.c_str() );
			handle << "index of " << fasta.string() << endline;
		}

		uint calls;
};



struct ResolveTask {
	ResolveTask( ReferenceCache& c, ReferenceDownloader& d, const std::vector< std::string >& cand ) : cache( c ), downloader( d ), candidates( cand ), ready( false ) {}

	void operator()() {
		try {
			const ReferenceCacheEntry entry = cache.resolve( candidates, downloader );
			ready = entry.status == CacheStatus::Ready;
		} catch( Exception& e ) {
			std::cerr << boost::diagnostic_information( e ) << std::endl;
		}
	}

	ReferenceCache& cache;
	ReferenceDownloader& downloader;
	const std::vector< std::string > candidates;
	bool ready;
};



// build directories and links not yet renamed into place
std::size_t countTemporaries( const fs::path& root ) {
	std::size_t n = 0;
	for( fs::directory_iterator it( root ), end; it != end; ++it ) {
		const std::string name = it->path().filename().string();
		if( name.find( cachefiles::building_infix ) != std::string::npos || name.find( cachefiles::link_infix ) != std::string::npos ) ++n;
	}
	return n;
}



std::size_t countVersions( const fs::path& root ) {
	std::size_t n = 0;
	for( fs::directory_iterator it( root ), end; it != end; ++it ) {
		const std::string name = it->path().filename().string();
		if( name[0] == '.' && name.find( cachefiles::version_infix ) != std::string::npos ) ++n;
	}
	return n;
}

}



int main( int argc, char** argv ) {
	bool alltests = true;
	std::ostringstream log;

	std::vector< std::string > candidates;
	candidates.push_back( "GCF_000006945.2_ASM694v2_genomic.fna.gz" );
	candidates.push_back( "GCF_000005845.2_ASM584v2_genomic.fna.gz" );
	std::vector< std::string > reversed( candidates.rbegin(), candidates.rend() );

	{ // cache keys
		alltests = unittest_assert( ReferenceCache::cacheKey( candidates ) == ReferenceCache::cacheKey( reversed ), "KEY_ORDER_INDEPENDENT" ) && alltests;
		alltests = unittest_assert( ReferenceCache::cacheKey( candidates ).size() == 40, "KEY_SHA1_HEX" ) && alltests;
		std::vector< std::string > abc;
		abc.push_back( "abc" );
		alltests = unittest_assert( ReferenceCache::cacheKey( abc ) == "a9993e364706816aba3e25717850c26c9cd0d89d", "KEY_SHA1_VALUE" ) && alltests;
		std::vector< std::string > other( candidates );
		other.push_back( "GCF_000009045.1_ASM904v1_genomic.fna.gz" );
		alltests = unittest_assert( ReferenceCache::cacheKey( other ) != ReferenceCache::cacheKey( candidates ), "KEY_DIFFERS" ) && alltests;
	}

	{ // concurrent resolves download once
		TestDirectory dir;
		ReferenceCache cache( ( dir.path() / "cache" ).string(), log );
		CountingDownloader downloader;

		alltests = unittest_assert( cache.lookup( ReferenceCache::cacheKey( candidates ) ).status == CacheStatus::Missing, "STATUS_MISSING" ) && alltests;

		boost::ptr_vector< ResolveTask > tasks;
		boost::thread_group threads;
		for( int i = 0; i < 4; ++i ) {
			tasks.push_back( new ResolveTask( cache, downloader, i % 2 ? candidates : reversed ) );
			threads.create_thread( boost::ref( tasks.back() ) );
		}
		threads.join_all();

		bool all_ready = true;
		for( std::size_t i = 0; i < tasks.size(); ++i ) all_ready = all_ready && tasks[i].ready;
		alltests = unittest_assert( all_ready, "CONCURRENT_ALL_READY" ) && alltests;
		alltests = unittest_assert( downloader.calls() == 1, "CONCURRENT_SINGLE_DOWNLOAD" ) && alltests;

		ReferenceCacheEntry entry = cache.resolve( candidates, downloader );
		alltests = unittest_assert( downloader.calls() == 1 && entry.status == CacheStatus::Ready, "CACHE_HIT" ) && alltests;
		alltests = unittest_assert( fs::file_size( entry.fasta_path ) > 0 && fs::file_size( entry.taxonomy_map_path ) > 0, "ENTRY_FILES" ) && alltests;
		alltests = unittest_assert( readFile( ( entry.directory / cachefiles::candidates ).string() ) == "GCF_000005845.2_ASM584v2_genomic.fna.gz\nGCF_000006945.2_ASM694v2_genomic.fna.gz\n", "ENTRY_CANDIDATES_SORTED" ) && alltests;
		alltests = unittest_assert( countTemporaries( cache.root() ) == 0 && countVersions( cache.root() ) == 1, "NO_LEFTOVER_BUILD_DIRECTORIES" ) && alltests;

		// refresh links a new version, the one handed out before stays usable
		const ReferenceCacheEntry previous = entry;
		entry = cache.resolve( candidates, downloader, true );
		alltests = unittest_assert( downloader.calls() == 2 && entry.status == CacheStatus::Ready && entry.directory != previous.directory, "FORCE_REFRESH" ) && alltests;
		alltests = unittest_assert( fs::file_size( previous.fasta_path ) > 0 && fs::exists( previous.directory / cachefiles::ready ), "REFRESH_KEEPS_PREVIOUS_VERSION" ) && alltests;
		alltests = unittest_assert( fs::is_symlink( cache.root() / entry.cache_key ) && cache.lookup( entry.cache_key ).directory == entry.directory, "REFRESH_SWAPS_LINK" ) && alltests;
		alltests = unittest_assert( countTemporaries( cache.root() ) == 0 && countVersions( cache.root() ) == 2, "REFRESH_NO_TEMPORARIES" ) && alltests;

		// index is built once
		CountingIndexer indexer;
		alltests = unittest_assert( ! entry.hasIndex(), "NO_INDEX_YET" ) && alltests;
		cache.ensureIndex( entry, indexer );
		cache.ensureIndex( entry, indexer );
		alltests = unittest_assert( indexer.calls == 1 && entry.hasIndex(), "LAZY_INDEX" ) && alltests;

		const std::vector< CacheEntryInfo > entries = cache.list();
		alltests = unittest_assert( entries.size() == 1 && entries[0].entry.cache_key == entry.cache_key && entries[0].size_bytes > 0, "LIST" ) && alltests;

		// superseded versions go with the next prune, the current one stays
		std::vector< std::string > removed = cache.prune( 0., 0, true );
		alltests = unittest_assert( removed.size() == 1 && fs::exists( previous.directory ), "PRUNE_SUPERSEDED_DRY_RUN" ) && alltests;
		removed = cache.prune( 0., 0, false );
		alltests = unittest_assert( removed.size() == 1 && removed[0] == previous.directory.filename().string() && ! fs::exists( previous.directory ), "PRUNE_SUPERSEDED" ) && alltests;
		alltests = unittest_assert( cache.lookup( entry.cache_key ).status == CacheStatus::Ready && entry.hasIndex() && countVersions( cache.root() ) == 1, "PRUNE_KEEPS_CURRENT_VERSION" ) && alltests;
	}

	{ // failed downloads leave nothing behind
		TestDirectory dir;
		ReferenceCache cache( ( dir.path() / "cache" ).string(), log );
		FailingDownloader failing;
		bool thrown = false;
		try {
			cache.resolve( candidates, failing );
		} catch( ExternalToolError& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "DOWNLOAD_FAILURE" ) && alltests;
		alltests = unittest_assert( cache.lookup( ReferenceCache::cacheKey( candidates ) ).status == CacheStatus::Missing && countTemporaries( cache.root() ) == 0 && countVersions( cache.root() ) == 0, "DOWNLOAD_FAILURE_CLEAN" ) && alltests;

		CountingDownloader empty( false );
		thrown = false;
		try {
			cache.resolve( candidates, empty );
		} catch( ExternalToolError& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown && cache.list().empty(), "EMPTY_REFERENCE_REJECTED" ) && alltests;

		thrown = false;
		try {
			cache.resolve( std::vector< std::string >(), empty );
		} catch( InputError& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "EMPTY_CANDIDATES" ) && alltests;
	}

	{ // pruning
		TestDirectory dir;
		ReferenceCache cache( ( dir.path() / "cache" ).string(), log );
		CountingDownloader downloader;
		std::vector< std::string > first( 1, "GCF_1" );
		std::vector< std::string > second( 1, "GCF_2" );
		std::vector< std::string > third( 1, "GCF_3" );
		const ReferenceCacheEntry old_entry = cache.resolve( first, downloader );
		const ReferenceCacheEntry mid_entry = cache.resolve( second, downloader );
		const ReferenceCacheEntry new_entry = cache.resolve( third, downloader );
		const std::time_t now = std::time( NULL );
		fs::last_write_time( old_entry.directory / cachefiles::ready, now - 10*86400 );
		fs::last_write_time( mid_entry.directory / cachefiles::ready, now - 3*86400 );

		std::vector< std::string > removed = cache.prune( 5., 0, true );
		alltests = unittest_assert( removed.size() == 1 && removed[0] == old_entry.cache_key && cache.list().size() == 3, "PRUNE_DRY_RUN" ) && alltests;

		removed = cache.prune( 5., 0, false );
		alltests = unittest_assert( removed.size() == 1 && cache.lookup( old_entry.cache_key ).status == CacheStatus::Missing && ! fs::exists( old_entry.directory ) && cache.list().size() == 2, "PRUNE_BY_AGE" ) && alltests;

		const very_large_unsigned_int entry_size = cache.list().front().size_bytes;
		removed = cache.prune( 0., entry_size, false );
		alltests = unittest_assert( removed.size() == 1 && removed[0] == mid_entry.cache_key, "PRUNE_BY_SIZE_OLDEST_FIRST" ) && alltests;
		alltests = unittest_assert( cache.lookup( new_entry.cache_key ).status == CacheStatus::Ready, "PRUNE_KEEPS_NEWEST" ) && alltests;
	}

	{ // external commands
		TestDirectory dir;
		alltests = unittest_assert( findExecutable( "sh" ) && ! findExecutable( "no-such-program-hymet" ), "FIND_EXECUTABLE" ) && alltests;

		ExternalCommand echo( "sh" );
		echo.arg( "-c" ).arg( "echo hello" );
		echo.run( dir.file( "out.txt" ), &log );
		alltests = unittest_assert( readFile( dir.file( "out.txt" ) ) == "hello\n", "COMMAND_STDOUT" ) && alltests;
		alltests = unittest_assert( echo.str() == "sh -c 'echo hello'", "COMMAND_STRING" ) && alltests;

		ExternalCommand failing( "sh" );
		failing.arg( "-c" ).arg( "exit 3" );
		int status = 0;
		try {
			failing.run();
		} catch( ExternalToolError& e ) {
			const int* info = boost::get_error_info< exit_status_info >( e );
			if( info ) status = *info;
		}
		alltests = unittest_assert( status == 3, "COMMAND_EXIT_STATUS" ) && alltests;

		bool thrown = false;
		try {
			ExternalCommand( "no-such-program-hymet" ).run();
		} catch( ExternalToolError& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "COMMAND_NOT_FOUND" ) && alltests;
	}

	if( alltests ) {
		cout << std::endl << "All tests ran through!" << endl;
	} else {
		cerr << std::endl << "At least one test failed!" << endl;
	}

	return alltests ? EXIT_SUCCESS : EXIT_FAILURE;
}
