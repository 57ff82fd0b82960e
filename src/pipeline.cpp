#include "pipeline.hh"
#include "accessconv.hh"
#include "bioboxes.hh"
#include "cancellation.hh"
#include "candidatelimiter.hh"
#include "classificationpipeline.hh"
#include "exception.hh"
#include "externaltool.hh"
#include "identifierlist.hh"
#include "ncbidata.hh"
#include "profileaggregator.hh"
#include "utils.hh"
#include <boost/filesystem/operations.hpp>
#include <boost/scoped_ptr.hpp>
#include <fstream>
#include <iostream>

namespace fs = boost::filesystem;



namespace {

bool nonEmpty( const fs::path& path ) {
	boost::system::error_code ec;
	return fs::is_regular_file( path, ec ) && fs::file_size( path, ec ) > 0 && ! ec;
}

}



std::ostream& operator<<( std::ostream& strm, StageOutcome outcome ) {
	switch( outcome ) {
		case StageOutcome::Skipped: return strm << "skipped";
		case StageOutcome::Completed: return strm << "completed";
		case StageOutcome::Failed: return strm << "failed";
	}
	return strm;
}



Pipeline::Pipeline( const PipelineSettings& settings, std::ostream& logsink ) :
	settings_( settings ),
	logsink_( logsink ),
	outdir_( settings.outdir ),
	invalidated_( false )
{
	if( settings_.inputs.empty() ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "input" ) << general_info( "no query sequences given" ) );
	if( settings_.sketches.empty() ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "sketch" ) << general_info( "no reference sketch given" ) );
	if( settings_.outdir.empty() ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "outdir" ) << general_info( "no output directory given" ) );
	if( settings_.cache_dir.empty() ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "cache-dir" ) << general_info( "no cache directory given" ) );
	if( settings_.downloader.empty() ) BOOST_THROW_EXCEPTION( ConfigurationError() << option_info( "downloader" ) << general_info( "no downloader command given" ) );
	for( std::vector< std::string >::const_iterator it = settings_.inputs.begin(); it != settings_.inputs.end(); ++it ) {
		if( ! fs::exists( *it ) ) BOOST_THROW_EXCEPTION( FileNotFound() << file_info( *it ) );
	}
	settings_.selector.validate();
	settings_.consensus.validate();
	fs::create_directories( outdir_ );
}



fs::path Pipeline::screenFile( const std::string& sketch ) const {
	return outdir_ / ( "screen_" + fs::path( sketch ).stem().string() + ".tab" );
}

fs::path Pipeline::selectedFile() const { return outdir_ / "selected_genomes.txt"; }
fs::path Pipeline::candidatesFile() const { return outdir_ / "candidates.txt"; }
fs::path Pipeline::alignmentFile() const { return outdir_ / "alignments.paf"; }
fs::path Pipeline::classificationFile() const { return outdir_ / "classified_sequences.tsv"; }

fs::path Pipeline::profileFile() const {
	const std::string sample = settings_.sample_id.empty() ? "sample" : settings_.sample_id;
	return outdir_ / ( "hymet." + sample + ".cami.tsv" );
}



void Pipeline::run() {
	std::vector< fs::path > outputs;

	for( std::vector< std::string >::const_iterator it = settings_.sketches.begin(); it != settings_.sketches.end(); ++it ) outputs.push_back( screenFile( *it ) );
	runStage( "screen", outputs, &Pipeline::screen );

	outputs.assign( 1, selectedFile() );
	runStage( "select", outputs, &Pipeline::select );

	outputs.assign( 1, candidatesFile() );
	runStage( "limit", outputs, &Pipeline::limit );

	// the cached reference set also provides the taxonomy map unless one is given
	outputs.clear();
	if( ! settings_.taxonomy_map.empty() ) outputs.push_back( alignmentFile() );
	runStage( "reference", outputs, &Pipeline::fetchReference );

	outputs.assign( 1, alignmentFile() );
	runStage( "align", outputs, &Pipeline::align );

	outputs.assign( 1, classificationFile() );
	runStage( "classify", outputs, &Pipeline::classify );

	outputs.assign( 1, profileFile() );
	runStage( "profile", outputs, &Pipeline::profile );
}



void Pipeline::runStage( const std::string& name, const std::vector< fs::path >& outputs, StageFunction stage ) {
	cancellation::checkpoint();
	reports_.push_back( new StageReport( name ) );
	StageReport& report = reports_.back();

	if( ! invalidated_ && ! outputs.empty() ) {
		bool complete = true;
		for( std::vector< fs::path >::const_iterator it = outputs.begin(); it != outputs.end(); ++it ) complete = complete && nonEmpty( *it );
		if( complete ) {
			std::cerr << "stage " << name << ": skipped, outputs exist" << std::endl;
			return;
		}
	}

	std::cerr << "stage " << name << "..." << std::endl;
	report.watch.start();
	while( true ) {
		++report.attempts;
		try {
			const bool worked = ( this->*stage )();
			report.watch.stop();
			report.outcome = worked ? StageOutcome::Completed : StageOutcome::Skipped;
			invalidated_ = invalidated_ || worked;
			std::cerr << "stage " << name << ": " << report.outcome << " in " << report.watch.read() << " ms" << std::endl;
			logsink_ << "STAGE\t" << name << tab << report.outcome << tab << report.attempts << tab << report.watch.read() << std::endl;
			return;
		} catch( ExternalToolError& e ) {
			if( report.attempts > settings_.retries ) {
				report.watch.stop();
				report.outcome = StageOutcome::Failed;
				logsink_ << "STAGE\t" << name << tab << report.outcome << tab << report.attempts << tab << report.watch.read() << std::endl;
				throw;
			}
			std::cerr << "stage " << name << ": attempt " << report.attempts << " failed, retrying" << std::endl;
			logsink_ << boost::diagnostic_information( e ) << std::endl;
			cancellation::checkpoint();
		} catch( std::exception& ) {
			report.watch.stop();
			report.outcome = StageOutcome::Failed;
			logsink_ << "STAGE\t" << name << tab << report.outcome << tab << report.attempts << tab << report.watch.read() << std::endl;
			throw;
		}
	}
}



void Pipeline::runToFile( const ExternalCommand& cmd, const fs::path& target ) {
	const fs::path tmp = target.parent_path() / ( "." + target.filename().string() + "." + fs::unique_path( "%%%%-%%%%" ).string() + ".tmp" );
	try {
		cmd.run( tmp.string(), &logsink_ );
		fs::rename( tmp, target );
	} catch( ... ) {
		boost::system::error_code ec;
		fs::remove( tmp, ec );
		throw;
	}
}



bool Pipeline::screen() {
	const std::string threads = boost::lexical_cast< std::string >( settings_.threads );
	for( std::vector< std::string >::const_iterator it = settings_.sketches.begin(); it != settings_.sketches.end(); ++it ) {
		if( ! invalidated_ && nonEmpty( screenFile( *it ) ) ) continue;
		ExternalCommand cmd( settings_.mash );
		cmd.arg( "screen" ).arg( "-p" ).arg( threads ).arg( "-v" ).arg( settings_.screen_pvalue ).arg( *it );
		cmd.args( settings_.inputs.begin(), settings_.inputs.end() );
		runToFile( cmd, screenFile( *it ) );
	}
	return true;
}



bool Pipeline::select() {
	large_unsigned_int num_sequences = 0;
	for( std::vector< std::string >::const_iterator it = settings_.inputs.begin(); it != settings_.inputs.end(); ++it ) num_sequences += countFastaRecords( *it );
	const unsigned int required = settings_.selector.requiredCandidates( num_sequences );
	logsink_ << "input sequences: " << num_sequences << ", required candidates: " << required << std::endl;

	std::vector< std::vector< ScreenHit > > tables( settings_.sketches.size() );
	for( std::size_t i = 0; i < settings_.sketches.size(); ++i ) {
		const large_unsigned_int skipped = parseScreenFile( screenFile( settings_.sketches[i] ).string(), tables[i] );
		if( skipped ) logsink_ << screenFile( settings_.sketches[i] ).string() << ": skipped " << skipped << " malformed rows" << std::endl;
	}

	const CandidateSelector selector( settings_.selector, logsink_ );
	std::vector< SelectionResult > per_table;
	const std::vector< std::string > selected = selector.selectAll( tables, required, &per_table );
	for( std::size_t i = 0; i < per_table.size(); ++i ) {
		std::cerr << settings_.sketches[i] << ": " << per_table[i].genomes.size() << " genomes at threshold " << formatFixed( per_table[i].threshold, 2 ) << ( per_table[i].degraded ? " (fallback)" : "" ) << std::endl;
	}
	writeIdentifiers( selectedFile().string(), selected );
	return true;
}



bool Pipeline::limit() {
	std::vector< std::string > selected;
	readIdentifiers( selectedFile().string(), selected );

	SpeciesMap species;
	for( std::vector< std::string >::const_iterator it = settings_.assembly_summaries.begin(); it != settings_.assembly_summaries.end(); ++it ) {
		if( ! species.loadAssemblySummary( *it ) ) warnDegradedMode( "cannot read assembly summary " + *it + ", deduplicating by accession", logsink_ );
	}

	ScoreTable scores;
	for( std::vector< std::string >::const_iterator it = settings_.sketches.begin(); it != settings_.sketches.end(); ++it ) scores.load( screenFile( *it ).string() );

	const CandidateLimiter limiter( settings_.max_candidates, settings_.dedupe, &species );
	std::vector< std::string > final_list;
	LimitAudit audit;
	limiter.limit( selected, scores, final_list, audit );
	std::cerr << audit << std::endl;
	logsink_ << audit << std::endl;
	writeIdentifiers( candidatesFile().string(), final_list );
	return true;
}



bool Pipeline::fetchReference() {
	std::vector< std::string > candidates;
	readIdentifiers( candidatesFile().string(), candidates );

	ReferenceCache cache( settings_.cache_dir, logsink_ );
	const ReferenceCacheEntry before = cache.lookup( ReferenceCache::cacheKey( candidates ) );
	const bool cached = before.status == CacheStatus::Ready && before.hasIndex() && ! settings_.force_refresh;

	ExternalCommandDownloader downloader( settings_.downloader, settings_.assembly_cache_dir, logsink_ );
	reference_ = cache.resolve( candidates, downloader, settings_.force_refresh );
	Minimap2Indexer indexer( settings_.minimap2, settings_.index_split, logsink_ );
	cache.ensureIndex( reference_, indexer );
	std::cerr << "reference set: " << reference_.directory.string() << std::endl;
	return ! cached;
}



bool Pipeline::align() {
	if( ! reference_.hasIndex() ) BOOST_THROW_EXCEPTION( InputError() << general_info( "no indexed reference set" ) );
	ExternalCommand cmd( settings_.minimap2 );
	cmd.arg( "-x" ).arg( settings_.preset ).arg( "-t" ).arg( boost::lexical_cast< std::string >( settings_.threads ) ).arg( reference_.index_path.string() );
	cmd.args( settings_.inputs.begin(), settings_.inputs.end() );
	runToFile( cmd, alignmentFile() );
	return true;
}



const Taxonomy* Pipeline::taxonomy() {
	if( ! tax_ ) {
		std::cerr << "loading taxonomy...";
		tax_.reset( loadTaxonomy( settings_.hierarchy, settings_.ranks.empty() ? default_ranks : settings_.ranks ) );
		std::cerr << " done (" << tax_->indexSize() << " nodes)" << std::endl;
	}
	return tax_.get();
}



bool Pipeline::classify() {
	const Taxonomy* tax = taxonomy();

	std::string mapfile = settings_.taxonomy_map;
	if( mapfile.empty() ) {
		if( reference_.cache_key.empty() ) BOOST_THROW_EXCEPTION( InputError() << general_info( "no taxonomy map available" ) );
		mapfile = reference_.taxonomy_map_path.string();
	}
	boost::scoped_ptr< StrIDConverter > seqid2taxid;
	try {
		seqid2taxid.reset( loadStrIDConverterFromFile( mapfile ) );
	} catch( FileNotFound& ) {
		warnDegradedMode( "cannot read taxonomy map " + mapfile, logsink_ );
	} catch( ParsingError& e ) {
		warnDegradedMode( "cannot parse taxonomy map " + mapfile + ": " + boost::diagnostic_information( e ), logsink_ );
	}

	std::vector< std::string > query_ids;
	for( std::vector< std::string >::const_iterator it = settings_.inputs.begin(); it != settings_.inputs.end(); ++it ) readIdentifiers( *it, query_ids );

	ClassificationPipeline classifier( tax, seqid2taxid.get(), settings_.consensus, settings_.threads, logsink_ );
	std::vector< ClassificationRecord > results;
	classifier.run( alignmentFile().string(), query_ids, results );
	std::cerr << classifier.stats() << std::endl;
	writeClassification( classificationFile().string(), results, tax );
	return true;
}



bool Pipeline::profile() {
	const Taxonomy* tax = taxonomy();
	const TaxonomyInterface taxinter( tax );
	ProfileAggregator aggregator( tax, settings_.renormalize );

	ClassificationTableParser parser( classificationFile().string() );
	ClassificationRow row;
	while( parser.getNext( row ) ) aggregator.add( resolveLineage( row.lineage, taxinter ) );

	writeProfile( profileFile().string(), aggregator, settings_.sample_id.empty() ? "sample" : settings_.sample_id );
	return true;
}
