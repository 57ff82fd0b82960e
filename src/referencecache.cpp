#include "referencecache.hh"
#include "cancellation.hh"
#include "constants.hh"
#include "exception.hh"
#include "externaltool.hh"
#include <algorithm>
#include <ctime>
#include <fstream>
#include <iostream>
#include <map>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/format.hpp>
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/uuid/detail/sha1.hpp>

namespace fs = boost::filesystem;



namespace {

// file locks are held per process, threads of one process are serialized by a mutex per lock file
boost::mutex& keyMutex( const std::string& lockfile ) {
	static boost::mutex registry_mutex;
	static std::map< std::string, boost::shared_ptr< boost::mutex > > registry;
	boost::lock_guard< boost::mutex > lock( registry_mutex );
	boost::shared_ptr< boost::mutex >& mutex = registry[ lockfile ];
	if( ! mutex ) mutex.reset( new boost::mutex );
	return *mutex;
}



std::string touchLockFile( const fs::path& lockfile ) {
	std::ofstream handle( lockfile.c_str(), std::ios::app );
	if( ! handle ) BOOST_THROW_EXCEPTION( FileError() << file_info( lockfile.string() ) << general_info( "cannot create lock file" ) );
	return lockfile.string();
}



// exclusive access to one cache key, within and across processes; the lock file is only opened
// while holding the mutex as closing any descriptor of it drops the lock of the whole process
class KeyLock {
	public:
		KeyLock( const fs::path& lockfile, bool wait = true ) :
			thread_lock_( keyMutex( lockfile.string() ), boost::defer_lock ),
			owns_( false )
		{
			if( wait ) thread_lock_.lock();
			else if( ! thread_lock_.try_lock() ) return;

			file_lock_.reset( new boost::interprocess::file_lock( touchLockFile( lockfile ).c_str() ) );
			if( wait ) file_lock_->lock();
			else if( ! file_lock_->try_lock() ) {
				file_lock_.reset();
				thread_lock_.unlock();
				return;
			}
			owns_ = true;
		}

		~KeyLock() {
			if( owns_ ) file_lock_->unlock();
		}

		bool owns() const { return owns_; }

	private:
		boost::unique_lock< boost::mutex > thread_lock_;
		boost::scoped_ptr< boost::interprocess::file_lock > file_lock_;
		bool owns_;
};



bool nonEmptyFile( const fs::path& path ) {
	boost::system::error_code ec;
	return fs::is_regular_file( path, ec ) && fs::file_size( path, ec ) > 0 && ! ec;
}



std::string uniqueSuffix() {
	return fs::unique_path( "%%%%-%%%%-%%%%" ).string();
}



very_large_unsigned_int directorySize( const fs::path& dir ) {
	very_large_unsigned_int size = 0;
	boost::system::error_code ec;
	for( fs::recursive_directory_iterator it( dir, ec ), end; it != end; it.increment( ec ) ) {
		if( ec ) break;
		if( fs::is_regular_file( it->path(), ec ) ) size += fs::file_size( it->path(), ec );
	}
	return size;
}



bool isCacheKey( const std::string& name ) {
	if( name.size() != 40 ) return false;
	return name.find_first_not_of( "0123456789abcdef" ) == std::string::npos;
}



// version directories are named ".<key>.v.<suffix>"
bool isVersionDirectory( const std::string& name, std::string& key ) {
	if( name.size() <= 41 + cachefiles::version_infix.size() || name[0] != '.' ) return false;
	key = name.substr( 1, 40 );
	return isCacheKey( key ) && name.compare( 41, cachefiles::version_infix.size(), cachefiles::version_infix ) == 0;
}



// name of the version directory the key link points to, empty without a link
std::string linkedVersion( const fs::path& link ) {
	boost::system::error_code ec;
	if( ! fs::is_symlink( fs::symlink_status( link, ec ) ) ) return std::string();
	const fs::path target = fs::read_symlink( link, ec );
	if( ec ) return std::string();
	return target.filename().string();
}



bool olderFirst( const CacheEntryInfo& a, const CacheEntryInfo& b ) {
	if( a.last_modified != b.last_modified ) return a.last_modified < b.last_modified;
	return a.entry.cache_key < b.entry.cache_key;
}

}



std::ostream& operator<<( std::ostream& strm, CacheStatus status ) {
	switch( status ) {
		case CacheStatus::Missing: return strm << "missing";
		case CacheStatus::Building: return strm << "building";
		case CacheStatus::Ready: return strm << "ready";
	}
	return strm;
}



bool ReferenceCacheEntry::hasIndex() const {
	return nonEmptyFile( index_path );
}



void ExternalCommandDownloader::download( const fs::path& genomes_file, const fs::path& workdir, const fs::path& fasta, const fs::path& taxonomy_file ) {
	fs::create_directories( workdir );
	ExternalCommand( command_ ).arg( genomes_file.string() ).arg( workdir.string() ).arg( taxonomy_file.string() ).arg( assembly_cache_dir_ ).run( std::string(), &logsink_ );

	const fs::path combined = workdir / "combined_genomes.fasta";
	if( ! fs::exists( combined ) ) BOOST_THROW_EXCEPTION( ExternalToolError() << command_info( command_ ) << file_info( combined.string() ) << general_info( "downloader did not write the combined reference" ) );
	fs::rename( combined, fasta );
	fs::remove_all( workdir );
}



void Minimap2Indexer::buildIndex( const fs::path& fasta, const fs::path& index ) {
	ExternalCommand( program_ ).arg( "-I" + split_size_ ).arg( "-d" ).arg( index.string() ).arg( fasta.string() ).run( std::string(), &logsink_ );
}



ReferenceCache::ReferenceCache( const std::string& root, std::ostream& logsink ) : root_( root ), logsink_( logsink ) {
	if( root_.empty() ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "cache-dir" ) << general_info( "empty cache directory" ) );
	fs::create_directories( root_ );
}



std::string ReferenceCache::cacheKey( const std::vector< std::string >& candidates ) {
	std::vector< std::string > sorted( candidates );
	std::sort( sorted.begin(), sorted.end() );
	sorted.erase( std::unique( sorted.begin(), sorted.end() ), sorted.end() );
	const std::string joined = boost::algorithm::join( sorted, "\n" );

	boost::uuids::detail::sha1 hash;
	hash.process_bytes( joined.data(), joined.size() );
	boost::uuids::detail::sha1::digest_type digest;
	hash.get_digest( digest );

	std::string key;
	for( int i = 0; i < 5; ++i ) key += boost::str( boost::format( "%08x" ) % digest[i] );
	return key;
}



ReferenceCacheEntry ReferenceCache::lookup( const std::string& cache_key ) const {
	ReferenceCacheEntry entry;
	entry.cache_key = cache_key;
	const std::string version = linkedVersion( root_ / cache_key );
	entry.directory = version.empty() ? root_ / cache_key : root_ / version;
	entry.fasta_path = entry.directory / cachefiles::fasta;
	entry.taxonomy_map_path = entry.directory / cachefiles::taxonomy;
	entry.index_path = entry.directory / cachefiles::index;

	if( ! version.empty() && fs::exists( entry.directory / cachefiles::ready ) ) {
		entry.status = CacheStatus::Ready;
		return entry;
	}

	entry.status = CacheStatus::Missing;
	const std::string building_prefix = "." + cache_key + cachefiles::building_infix;
	boost::system::error_code ec;
	for( fs::directory_iterator it( root_, ec ), end; it != end; it.increment( ec ) ) {
		if( ec ) break;
		if( boost::algorithm::starts_with( it->path().filename().string(), building_prefix ) ) {
			entry.status = CacheStatus::Building;
			break;
		}
	}
	return entry;
}



ReferenceCacheEntry ReferenceCache::resolve( const std::vector< std::string >& candidates, ReferenceDownloader& downloader, bool force_refresh ) {
	if( candidates.empty() ) BOOST_THROW_EXCEPTION( InputError() << general_info( "empty candidate list" ) );
	const std::string key = cacheKey( candidates );

	KeyLock lock( root_ / ( key + cachefiles::lock_suffix ) );
	ReferenceCacheEntry entry = lookup( key );
	if( entry.status == CacheStatus::Ready && ! force_refresh ) {
		logsink_ << "cache hit: " << key << std::endl;
		return entry;
	}

	std::cerr << "downloading reference set " << key << " (" << candidates.size() << " genomes)" << std::endl;
	build( entry, candidates, downloader );
	return lookup( key );
}



void ReferenceCache::build( const ReferenceCacheEntry& target, const std::vector< std::string >& candidates, ReferenceDownloader& downloader ) {
	const std::string suffix = uniqueSuffix();
	const fs::path builddir = root_ / ( "." + target.cache_key + cachefiles::building_infix + suffix );
	const fs::path versiondir = root_ / ( "." + target.cache_key + cachefiles::version_infix + suffix );
	fs::create_directory( builddir );

	try {
		cancellation::checkpoint();

		std::vector< std::string > sorted( candidates );
		std::sort( sorted.begin(), sorted.end() );
		sorted.erase( std::unique( sorted.begin(), sorted.end() ), sorted.end() );
		const fs::path genomes_file = builddir / cachefiles::candidates;
		{
			std::ofstream handle( genomes_file.c_str() );
			for( std::vector< std::string >::const_iterator it = sorted.begin(); it != sorted.end(); ++it ) handle << *it << endline;
			if( ! handle ) BOOST_THROW_EXCEPTION( FileError() << file_info( genomes_file.string() ) );
		}

		const fs::path fasta = builddir / cachefiles::fasta;
		const fs::path taxonomy = builddir / cachefiles::taxonomy;
		downloader.download( genomes_file, builddir / "download", fasta, taxonomy );
		cancellation::checkpoint();

		if( ! nonEmptyFile( fasta ) ) BOOST_THROW_EXCEPTION( ExternalToolError() << file_info( fasta.string() ) << general_info( "downloader produced no reference sequences" ) );
		if( ! nonEmptyFile( taxonomy ) ) BOOST_THROW_EXCEPTION( ExternalToolError() << file_info( taxonomy.string() ) << general_info( "downloader produced no taxonomy map" ) );

		{
			const fs::path ready = builddir / cachefiles::ready;
			std::ofstream handle( ready.c_str() );
			handle << target.cache_key << endline << sorted.size() << endline;
			if( ! handle ) BOOST_THROW_EXCEPTION( FileError() << file_info( ready.string() ) );
		}

		// the key link is replaced by a single rename, an earlier version stays until pruned
		fs::rename( builddir, versiondir );
		const fs::path link = root_ / ( "." + target.cache_key + cachefiles::link_infix + suffix );
		fs::create_symlink( versiondir.filename(), link );
		try {
			fs::rename( link, root_ / target.cache_key );
		} catch( ... ) {
			boost::system::error_code ec;
			fs::remove( link, ec );
			throw;
		}
	} catch( ... ) {
		boost::system::error_code ec;
		fs::remove_all( builddir, ec );
		fs::remove_all( versiondir, ec );
		throw;
	}

	logsink_ << "cache entry ready: " << target.cache_key << " -> " << versiondir.string() << std::endl;
}



void ReferenceCache::ensureIndex( ReferenceCacheEntry& entry, ReferenceIndexer& indexer ) {
	if( entry.status != CacheStatus::Ready ) BOOST_THROW_EXCEPTION( InputError() << file_info( entry.directory.string() ) << general_info( "cache entry is not ready" ) );

	KeyLock lock( root_ / ( entry.cache_key + cachefiles::lock_suffix ) );
	if( entry.hasIndex() ) return;

	const fs::path tmp = entry.directory / ( "." + cachefiles::index + "." + uniqueSuffix() + ".tmp" );
	try {
		indexer.buildIndex( entry.fasta_path, tmp );
		if( ! nonEmptyFile( tmp ) ) BOOST_THROW_EXCEPTION( ExternalToolError() << file_info( tmp.string() ) << general_info( "indexer produced no index" ) );
		fs::rename( tmp, entry.index_path );
	} catch( ... ) {
		boost::system::error_code ec;
		fs::remove( tmp, ec );
		throw;
	}
	logsink_ << "index built: " << entry.index_path.string() << std::endl;
}



std::vector< CacheEntryInfo > ReferenceCache::list() const {
	std::vector< CacheEntryInfo > entries;
	const std::time_t now = std::time( NULL );
	for( fs::directory_iterator it( root_ ), end; it != end; ++it ) {
		const std::string name = it->path().filename().string();
		if( ! fs::is_directory( it->status() ) || ! isCacheKey( name ) ) continue;
		CacheEntryInfo info;
		info.entry = lookup( name );
		info.size_bytes = directorySize( info.entry.directory );
		const fs::path marker = info.entry.status == CacheStatus::Ready ? info.entry.directory / cachefiles::ready : info.entry.directory;
		info.last_modified = fs::last_write_time( marker );
		info.age_days = std::difftime( now, info.last_modified )/86400.;
		entries.push_back( info );
	}
	return entries;
}



std::vector< std::string > ReferenceCache::prune( double max_age_days, very_large_unsigned_int max_size_bytes, bool dry_run ) {
	std::vector< CacheEntryInfo > entries = list();
	std::sort( entries.begin(), entries.end(), olderFirst );

	very_large_unsigned_int total = 0;
	for( std::vector< CacheEntryInfo >::const_iterator it = entries.begin(); it != entries.end(); ++it ) total += it->size_bytes;

	std::vector< std::string > removed;
	std::vector< bool > gone( entries.size(), false );

	// versions replaced by a refresh or never linked
	std::vector< fs::path > versions;
	for( fs::directory_iterator it( root_ ), end; it != end; ++it ) {
		std::string key;
		if( isVersionDirectory( it->path().filename().string(), key ) ) versions.push_back( it->path() );
	}
	std::sort( versions.begin(), versions.end() );
	for( std::vector< fs::path >::const_iterator it = versions.begin(); it != versions.end(); ++it ) {
		const std::string name = it->filename().string();
		std::string key;
		isVersionDirectory( name, key );
		KeyLock lock( root_ / ( key + cachefiles::lock_suffix ), false );
		if( ! lock.owns() || linkedVersion( root_ / key ) == name ) continue;
		if( ! dry_run ) fs::remove_all( *it );
		removed.push_back( name );
		logsink_ << ( dry_run ? "would remove superseded " : "removed superseded " ) << name << std::endl;
	}

	for( int pass = 0; pass < 2; ++pass ) {
		for( std::size_t i = 0; i < entries.size(); ++i ) {
			if( gone[i] ) continue;
			const CacheEntryInfo& info = entries[i];
			if( pass == 0 && ! ( max_age_days > 0. && info.age_days > max_age_days ) ) continue;
			if( pass == 1 && ! ( max_size_bytes > 0 && total > max_size_bytes ) ) break;

			KeyLock lock( root_ / ( info.entry.cache_key + cachefiles::lock_suffix ), false );
			if( ! lock.owns() ) {
				logsink_ << "skipping entry in use: " << info.entry.cache_key << std::endl;
				continue;
			}
			if( ! dry_run ) {
				fs::remove( root_ / info.entry.cache_key );
				fs::remove_all( info.entry.directory );
			}
			gone[i] = true;
			total -= info.size_bytes;
			removed.push_back( info.entry.cache_key );
			logsink_ << ( dry_run ? "would remove " : "removed " ) << info.entry.cache_key << " (" << info.size_bytes << " bytes, " << boost::format( "%.1f" ) % info.age_days << " days)" << std::endl;
		}
	}
	return removed;
}
