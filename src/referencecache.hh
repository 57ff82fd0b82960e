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

#ifndef referencecache_hh_
#define referencecache_hh_

#include <ctime>
#include <ostream>
#include <string>
#include <vector>
#include <boost/filesystem/path.hpp>
#include "types.hh"



enum class CacheStatus { Missing, Building, Ready };

std::ostream& operator<<( std::ostream& strm, CacheStatus status );



struct ReferenceCacheEntry {
	std::string cache_key;
	boost::filesystem::path directory;
	boost::filesystem::path fasta_path;
	boost::filesystem::path taxonomy_map_path;
	boost::filesystem::path index_path; // exists only after ensureIndex()
	CacheStatus status;

	bool hasIndex() const;
};



struct CacheEntryInfo {
	ReferenceCacheEntry entry;
	very_large_unsigned_int size_bytes;
	std::time_t last_modified;
	double age_days;
};



// fills a directory with the reference sequences and their taxonomy map
class ReferenceDownloader {
	public:
		virtual ~ReferenceDownloader() {}

		// genomes_file lists one candidate per line; must create fasta and taxonomy_file
		virtual void download( const boost::filesystem::path& genomes_file, const boost::filesystem::path& workdir, const boost::filesystem::path& fasta, const boost::filesystem::path& taxonomy_file ) = 0;
};



// calls `<command> <genomes_file> <target_dir> <taxonomy_file> <assembly_cache_dir>` and picks
// up <target_dir>/combined_genomes.fasta
class ExternalCommandDownloader : public ReferenceDownloader {
	public:
		ExternalCommandDownloader( const std::string& command, const std::string& assembly_cache_dir, std::ostream& logsink ) : command_( command ), assembly_cache_dir_( assembly_cache_dir ), logsink_( logsink ) {}

		void download( const boost::filesystem::path& genomes_file, const boost::filesystem::path& workdir, const boost::filesystem::path& fasta, const boost::filesystem::path& taxonomy_file );

	private:
		const std::string command_;
		const std::string assembly_cache_dir_;
		std::ostream& logsink_;
};



class ReferenceIndexer {
	public:
		virtual ~ReferenceIndexer() {}
		virtual void buildIndex( const boost::filesystem::path& fasta, const boost::filesystem::path& index ) = 0;
};



// `minimap2 -I<split> -d <index> <fasta>`
class Minimap2Indexer : public ReferenceIndexer {
	public:
		Minimap2Indexer( const std::string& program, const std::string& split_size, std::ostream& logsink ) : program_( program ), split_size_( split_size ), logsink_( logsink ) {}

		void buildIndex( const boost::filesystem::path& fasta, const boost::filesystem::path& index );

	private:
		const std::string program_;
		const std::string split_size_;
		std::ostream& logsink_;
};



// content-addressed store of downloaded reference sets; an entry is keyed by the SHA-1 of the
// sorted candidate list. Each build goes to its own version directory and <root>/<key> is a
// symbolic link to the current one, swapped by a single rename, so readers only ever see
// complete entries and a directory handed out stays in place until it is pruned
class ReferenceCache {
	public:
		ReferenceCache( const std::string& root, std::ostream& logsink );

		static std::string cacheKey( const std::vector< std::string >& candidates );

		// current state of the entry, does not lock; the directory of a Ready entry is its
		// current version
		ReferenceCacheEntry lookup( const std::string& cache_key ) const;

		// returns the Ready entry, downloading it first if missing or if force_refresh is set;
		// concurrent calls for the same key download once; throws ExternalToolError
		ReferenceCacheEntry resolve( const std::vector< std::string >& candidates, ReferenceDownloader& downloader, bool force_refresh = false );

		// builds the alignment index of a Ready entry once
		void ensureIndex( ReferenceCacheEntry& entry, ReferenceIndexer& indexer );

		std::vector< CacheEntryInfo > list() const;

		// removes superseded versions, then entries older than max_age_days (if > 0), then oldest
		// entries until the total is at most max_size_bytes (if > 0); entries in use are skipped;
		// returns the names of removed version directories followed by removed keys
		std::vector< std::string > prune( double max_age_days, very_large_unsigned_int max_size_bytes, bool dry_run );

		const boost::filesystem::path& root() const { return root_; }

	private:
		void build( const ReferenceCacheEntry& target, const std::vector< std::string >& candidates, ReferenceDownloader& downloader );

		const boost::filesystem::path root_;
		std::ostream& logsink_;
};

#endif // referencecache_hh_
