#include "classificationpipeline.hh"
#include "atomicoutput.hh"
#include "boundedbuffer.hh"
#include "cancellation.hh"
#include "concurrentoutstream.hh"
#include "exception.hh"
#include "fileparser.hh"
#include "profileaggregator.hh"
#include "utils.hh"
#include <boost/exception_ptr.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/functional/hash.hpp>
#include <boost/ptr_container/ptr_vector.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/thread.hpp>
#include <algorithm>
#include <iostream>



namespace {

const std::size_t batch_size = 512;
const std::size_t batches_per_shard = 8;

struct ShardItem {
	QueryOrdinal ordinal;
	AlignmentRecord record;
};

typedef std::vector< ShardItem > Batch; // empty batch marks the end of the input



class ShardWorker {
public:
	ShardWorker( const Taxonomy* tax, const StrIDConverter* seqid2taxid, const LineageConsensus& consensus, ConcurrentOutStream& log, uint channel ) :
		buffer_( batches_per_shard ),
		taxinter_( tax ),
		seqid2taxid_( seqid2taxid ),
		consensus_( consensus ),
		log_( log ),
		channel_( channel ),
		input_done_( false )
	{}

	void operator()() {
		try {
			consume();
			resolve();
		} catch( ... ) {
			error_ = boost::current_exception(); // rethrown by the pipeline after joining
			drain();
		}
	}

	BoundedBuffer< Batch >& buffer() { return buffer_; }
	const std::vector< ClassificationRecord >& results() const { return results_; }
	const ClassificationStats& stats() const { return stats_; }
	const boost::exception_ptr& error() const { return error_; }

private:
	struct QueryEntry {
		std::string identifier;
		QueryHits hits;
	};

	void consume() {
		const ConsensusParameters& params = consensus_.parameters();
		Batch batch;
		while( true ) {
			buffer_.pop( batch );
			if( batch.empty() ) break;
			for( Batch::const_iterator it = batch.begin(); it != batch.end(); ++it ) {
				QueryEntry& entry = queries_[ it->ordinal ];
				if( entry.identifier.empty() ) entry.identifier = it->record.getQueryIdentifier();
				entry.hits.countRecord();
				const TaxonNode* node = mapReference( it->record.getReferenceIdentifier(), seqid2taxid_, taxinter_, stats_ );
				if( node ) entry.hits.add( node, scoreAlignment( it->record, params ), it->record.getReferenceIdentifier() );
			}
			batch.clear();
		}
		input_done_ = true;
	}

	void resolve() {
		results_.reserve( queries_.size() );
		for( std::map< QueryOrdinal, QueryEntry >::const_iterator it = queries_.begin(); it != queries_.end(); ++it ) {
			if( cancellation::requested() ) break; // stop after the current query
			results_.push_back( ClassificationRecord( it->first, it->second.identifier ) );
			consensus_.resolve( it->second.hits, results_.back(), log_( channel_ ) );
			log_.flush( channel_ );
			if( results_.back().isResolved() ) ++stats_.resolved;
		}
		queries_.clear();
	}

	// keep the producer from blocking on a dead shard
	void drain() {
		if( input_done_ ) return;
		Batch batch;
		do buffer_.pop( batch ); while( ! batch.empty() );
		input_done_ = true;
	}

	BoundedBuffer< Batch > buffer_;
	const TaxonomyInterface taxinter_;
	const StrIDConverter* seqid2taxid_;
	const LineageConsensus& consensus_;
	ConcurrentOutStream& log_;
	const uint channel_;
	bool input_done_;
	std::map< QueryOrdinal, QueryEntry > queries_;
	std::vector< ClassificationRecord > results_;
	ClassificationStats stats_;
	boost::exception_ptr error_;
};

}



ClassificationStats& ClassificationStats::operator+=( const ClassificationStats& other ) {
	records += other.records;
	skipped_lines += other.skipped_lines;
	unmapped_hits += other.unmapped_hits;
	unknown_taxa += other.unknown_taxa;
	queries += other.queries;
	resolved += other.resolved;
	fallback = fallback || other.fallback;
	return *this;
}



std::ostream& operator<<( std::ostream& strm, const ClassificationStats& stats ) {
	strm << "alignment records: " << stats.records << endline
	     << "malformed lines skipped: " << stats.skipped_lines << endline
	     << "hits without taxonomy mapping: " << stats.unmapped_hits << endline
	     << "hits with taxon missing in hierarchy: " << stats.unknown_taxa << endline
	     << "queries: " << stats.queries << endline
	     << "classified: " << stats.resolved;
	if( stats.queries ) strm << " (" << formatFixed( 100.*stats.resolved/stats.queries, 1 ) << "%)";
	if( stats.fallback ) strm << ", first-hit fallback";
	return strm << endline;
}



const TaxonNode* mapReference( const std::string& target, const StrIDConverter* seqid2taxid, const TaxonomyInterface& taxinter, ClassificationStats& stats ) {
	TaxonID taxid;
	if( ! seqid2taxid || ! seqid2taxid->find( target, taxid ) ) {
		++stats.unmapped_hits;
		return NULL;
	}
	const TaxonNode* node = taxinter.getNode( taxid );
	if( ! node ) ++stats.unknown_taxa;
	return node;
}



ClassificationPipeline::ClassificationPipeline( const Taxonomy* tax, const StrIDConverter* seqid2taxid, const ConsensusParameters& params, uint number_threads, std::ostream& logsink ) :
	tax_( tax ),
	seqid2taxid_( seqid2taxid ),
	consensus_( tax, params ),
	number_threads_( number_threads ),
	logsink_( logsink )
{
	params.validate();

	//adjust thread number
	const uint procs = boost::thread::hardware_concurrency();
	if ( ! number_threads_ ) number_threads_ = procs;
	else if ( procs ) number_threads_ = std::min( number_threads_, procs );
	number_threads_ = std::max( number_threads_, 1u );
}



void ClassificationPipeline::run( const std::string& paf_filename, const std::vector< std::string >& query_ids, std::vector< ClassificationRecord >& results ) {
	stats_ = ClassificationStats();
	results.clear();

	OrdinalMap ordinals;
	std::vector< std::string > names;
	for( std::vector< std::string >::const_iterator it = query_ids.begin(); it != query_ids.end(); ++it ) {
		if( ordinals.insert( std::make_pair( *it, names.size() ) ).second ) names.push_back( *it );
	}

	{
		// one log channel per worker plus one for the parser
		ConcurrentOutStream log( logsink_, number_threads_ + 1, 20000 );
		boost::ptr_vector< ShardWorker > workers;
		for( uint i = 0; i < number_threads_; ++i ) workers.push_back( new ShardWorker( tax_, seqid2taxid_, consensus_, log, i ) );

		// start the consumers that wait for data in their buffers
		boost::thread_group t_consumers;
		for( uint i = 0; i < number_threads_; ++i ) t_consumers.create_thread( boost::ref( workers[i] ) );

		// main thread is the producer
		boost::exception_ptr producer_error;
		try {
			AlignmentRecordFactory fac;
			FileParser< AlignmentRecordFactory > parser( paf_filename, fac, &log( number_threads_ ) );
			std::vector< Batch > pending( number_threads_ );
			boost::hash< std::string > hasher;

			AlignmentRecord* rec;
			while( ( rec = parser.next() ) ) {
				const std::string& qid = rec->getQueryIdentifier();
				std::pair< OrdinalMap::iterator, bool > ins = ordinals.insert( std::make_pair( qid, names.size() ) );
				if( ins.second ) names.push_back( qid );

				const std::size_t shard = hasher( qid ) % number_threads_;
				pending[shard].push_back( ShardItem() );
				pending[shard].back().ordinal = ins.first->second;
				pending[shard].back().record = *rec;
				parser.destroy( rec );
				++stats_.records;

				if( pending[shard].size() >= batch_size ) {
					workers[shard].buffer().push( pending[shard] );
					pending[shard].clear();
					log.flush( number_threads_ );
					if( cancellation::requested() ) break;
				}
			}
			stats_.skipped_lines = parser.numSkipped();

			for( uint i = 0; i < number_threads_; ++i ) {
				if( ! pending[i].empty() ) workers[i].buffer().push( pending[i] );
			}
		} catch( ... ) {
			producer_error = boost::current_exception();
		}

		// tell the consumers there is no more data coming
		for( uint i = 0; i < number_threads_; ++i ) workers[i].buffer().push( Batch() );
		t_consumers.join_all();
		log.forceFlush( number_threads_ );

		if( producer_error ) boost::rethrow_exception( producer_error );
		for( uint i = 0; i < number_threads_; ++i ) {
			if( workers[i].error() ) boost::rethrow_exception( workers[i].error() );
		}
		cancellation::checkpoint();

		results.reserve( names.size() );
		for( QueryOrdinal i = 0; i < names.size(); ++i ) {
			results.push_back( ClassificationRecord( i, names[i] ) );
		}
		for( uint i = 0; i < number_threads_; ++i ) {
			const std::vector< ClassificationRecord >& shard_results = workers[i].results();
			for( std::vector< ClassificationRecord >::const_iterator it = shard_results.begin(); it != shard_results.end(); ++it ) {
				results[ it->getOrdinal() ] = *it;
			}
			stats_ += workers[i].stats();
		}
	}

	stats_.queries = names.size();
	if( stats_.resolved == 0 && ! names.empty() ) firstHitFallback( paf_filename, ordinals, results );
}



void ClassificationPipeline::firstHitFallback( const std::string& paf_filename, const OrdinalMap& ordinals, std::vector< ClassificationRecord >& results ) {
	warnDegradedMode( "no query could be resolved, assigning each query the taxon of its first alignment", logsink_ );
	stats_.fallback = true;

	const TaxonomyInterface taxinter( tax_ );
	std::vector< bool > seen( results.size(), false );
	AlignmentRecordFactory fac;
	FileParser< AlignmentRecordFactory > parser( paf_filename, fac );
	ClassificationStats mapping_stats; // already counted in the main pass

	AlignmentRecord* rec;
	while( ( rec = parser.next() ) ) {
		boost::scoped_ptr< AlignmentRecord > holder( rec );
		cancellation::checkpoint();
		OrdinalMap::const_iterator it = ordinals.find( rec->getQueryIdentifier() );
		if( it == ordinals.end() || seen[ it->second ] ) continue;
		seen[ it->second ] = true;

		const TaxonNode* node = mapReference( rec->getReferenceIdentifier(), seqid2taxid_, taxinter, mapping_stats );
		if( ! node ) continue;
		node = taxinter.getRankedAncestor( node );
		if( ! node ) continue;
		results[ it->second ].setAssignment( node, scoreAlignment( *rec, consensus_.parameters() ), true );
		++stats_.resolved;
	}
}



void writeClassification( std::ostream& strm, const std::vector< ClassificationRecord >& results, const Taxonomy* tax ) {
	const TaxonomyInterface taxinter( tax );
	writeClassificationHeader( strm );
	for( std::vector< ClassificationRecord >::const_iterator it = results.begin(); it != results.end(); ++it ) {
		it->print( strm, taxinter );
	}
}



void writeClassification( const std::string& filename, const std::vector< ClassificationRecord >& results, const Taxonomy* tax ) {
	AtomicOutputFile output( filename );
	writeClassification( output.stream(), results, tax );
	output.commit();
}



void writeClassificationAndProfile( const std::string& filename, const std::vector< ClassificationRecord >& results, const Taxonomy* tax,
                                    const std::string& profile_filename, const ProfileAggregator& profile, const std::string& sampleid ) {
	AtomicOutputFile table( filename );
	AtomicOutputFile cami( profile_filename );
	writeClassification( table.stream(), results, tax );
	profile.write( cami.stream(), sampleid );

	table.commit();
	try {
		cami.commit();
	} catch( ... ) {
		boost::system::error_code ec;
		boost::filesystem::remove( filename, ec ); // the original error is the one to report
		throw;
	}
}
