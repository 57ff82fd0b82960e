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

#ifndef pipeline_hh_
#define pipeline_hh_

#include <ostream>
#include <string>
#include <vector>
#include <boost/filesystem/path.hpp>
#include <boost/ptr_container/ptr_vector.hpp>
#include <boost/scoped_ptr.hpp>
#include "types.hh"
#include "candidateselector.hh"
#include "lineageconsensus.hh"
#include "profiling.hh"
#include "referencecache.hh"
#include "taxontree.hh"

class ExternalCommand;


enum class StageOutcome { Skipped, Completed, Failed };

std::ostream& operator<<( std::ostream& strm, StageOutcome outcome );



struct PipelineSettings {
	PipelineSettings() :
		mash( "mash" ),
		minimap2( "minimap2" ),
		screen_pvalue( "0.9" ),
		index_split( "2g" ),
		preset( "asm10" ),
		threads( 1 ),
		max_candidates( default_max_candidates ),
		dedupe( true ),
		retries( 2 ),
		force_refresh( false ),
		renormalize( false ) {}

	std::vector< std::string > inputs; // query FASTA files
	std::string outdir;
	std::vector< std::string > sketches; // one Mash sketch per reference database
	std::string hierarchy;
	std::string taxonomy_map; // overrides the map shipped with the cached reference set
	std::string cache_dir;
	std::string downloader;
	std::string assembly_cache_dir;
	std::vector< std::string > assembly_summaries;
	std::string mash;
	std::string minimap2;
	std::string screen_pvalue;
	std::string index_split;
	std::string preset;
	std::string sample_id;
	std::string logfile;
	uint threads;
	uint max_candidates;
	bool dedupe;
	uint retries; // additional attempts after a failing external tool
	bool force_refresh;
	bool renormalize;
	SelectorParameters selector;
	ConsensusParameters consensus;
	std::vector< std::string > ranks;
};



struct StageReport {
	StageReport( const std::string& n ) : name( n ), outcome( StageOutcome::Skipped ), attempts( 0 ), watch( n ) {}
	std::string name;
	StageOutcome outcome;
	uint attempts;
	StopWatch watch;
};



// screen, select, limit, fetch reference, align, classify and profile; a stage whose outputs
// exist is skipped unless an earlier stage of the same run did work
class Pipeline {
	public:
		Pipeline( const PipelineSettings& settings, std::ostream& logsink );

		// throws on the first failing stage, the reports tell which one it was
		void run();

		const boost::ptr_vector< StageReport >& reports() const { return reports_; }

		boost::filesystem::path screenFile( const std::string& sketch ) const;
		boost::filesystem::path selectedFile() const;
		boost::filesystem::path candidatesFile() const;
		boost::filesystem::path alignmentFile() const;
		boost::filesystem::path classificationFile() const;
		boost::filesystem::path profileFile() const;

	private:
		typedef bool ( Pipeline::*StageFunction )();

		void runStage( const std::string& name, const std::vector< boost::filesystem::path >& outputs, StageFunction stage );

		bool screen();
		bool select();
		bool limit();
		bool fetchReference();
		bool align();
		bool classify();
		bool profile();

		// loaded on first use
		const Taxonomy* taxonomy();

		// runs the command with standard output into a temporary file which replaces target
		void runToFile( const ExternalCommand& cmd, const boost::filesystem::path& target );

		const PipelineSettings settings_;
		std::ostream& logsink_;
		const boost::filesystem::path outdir_;
		boost::ptr_vector< StageReport > reports_;
		bool invalidated_;
		ReferenceCacheEntry reference_;
		boost::scoped_ptr< Taxonomy > tax_;
};

#endif // pipeline_hh_
