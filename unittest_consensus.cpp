#include <iostream>
#include <cstdlib>
#include <sstream>
#include <boost/filesystem/operations.hpp>
#include <boost/scoped_ptr.hpp>
#include "src/accessconv.hh"
#include "src/classificationpipeline.hh"
#include "src/constants.hh"
#include "src/exception.hh"
#include "src/lineageconsensus.hh"
#include "src/ncbidata.hh"
#include "src/profileaggregator.hh"
#include "src/unittest.hh"



using namespace std;



namespace {

void addRecord( TaxonRecordMap& records, TaxonID taxid, TaxonID parent, const std::string& rank, const std::string& name ) {
	TaxonRecord& record = records[ taxid ];
	record.parent_taxid = parent;
	record.rank = rank;
	record.name = name;
}



// 1 (superkingdom) -> 2 (phylum) -> 3 (genus) -> 4 (species E. coli)
//                           \-> 5 (genus) -> 6 (species S. flexneri)
Taxonomy* smallTaxonomy() {
	TaxonRecordMap records;
	addRecord( records, 1, 1, "superkingdom", "Bacteria" );
	addRecord( records, 2, 1, "phylum", "Pseudomonadota" );
	addRecord( records, 3, 2, "genus", "Escherichia" );
	addRecord( records, 4, 3, "species", "Escherichia coli" );
	addRecord( records, 5, 2, "genus", "Shigella" );
	addRecord( records, 6, 5, "species", "Shigella flexneri" );
	return buildTaxonomy( records );
}



std::string pafLine( const std::string& query, const std::string& target, unsigned int matches, unsigned int block, unsigned int qlen = 100, const std::string& mapq = "255" ) {
	std::ostringstream line;
	line << query << tab << qlen << tab << 0 << tab << block << tab << '+' << tab << target << tab << 5000 << tab << 100 << tab << 100 + block << tab << matches << tab << block << tab << mapq << tab << "tp:A:P" << endline;
	return line.str();
}



std::string classify( const Taxonomy* tax, const StrIDConverter* seqid2taxid, const std::string& paf, const std::vector< std::string >& queries, uint threads, ClassificationStats& stats, std::vector< ClassificationRecord >& results ) {
	std::ostringstream log;
	ClassificationPipeline pipeline( tax, seqid2taxid, ConsensusParameters(), threads, log );
	pipeline.run( paf, queries, results );
	stats = pipeline.stats();

	const TaxonomyInterface taxinter( tax );
	std::ostringstream out;
	writeClassificationHeader( out );
	for( std::vector< ClassificationRecord >::const_iterator it = results.begin(); it != results.end(); ++it ) it->print( out, taxinter );
	return out.str();
}

}



int main( int argc, char** argv ) {
	bool alltests = true;
	std::ostringstream log;

	{ // assignment rules on a small hierarchy
		boost::scoped_ptr< Taxonomy > tax( smallTaxonomy() );
		TaxonomyInterface taxinter( tax.get() );
		const LineageConsensus consensus( tax.get(), ConsensusParameters() );

		{ // close runner-up: lowest common ancestor
			QueryHits hits;
			hits.add( taxinter.getNode( 4 ), 0.95, "NC_000001.1" );
			hits.add( taxinter.getNode( 6 ), 0.94, "NC_000002.1" );
			ClassificationRecord rec( 0, "query" );
			consensus.resolve( hits, rec, log );
			alltests = unittest_assert( rec.isResolved() && taxinter.getTaxID( rec.getNode() ) == 2, "LCA_ASSIGNMENT" ) && alltests;
			alltests = unittest_assert( nearlyEqual( rec.getConfidence(), 0.475 ), "LCA_CONFIDENCE" ) && alltests;
			alltests = unittest_assert( rec.getLevel() == "phylum", "LCA_LEVEL" ) && alltests;
			alltests = unittest_assert( rec.getLineage( taxinter ) == "superkingdom:Bacteria;phylum:Pseudomonadota", "LCA_LINEAGE" ) && alltests;
		}

		{ // distant runner-up: direct assignment
			QueryHits hits;
			hits.add( taxinter.getNode( 4 ), 0.95, "NC_000001.1" );
			hits.add( taxinter.getNode( 6 ), 0.50, "NC_000002.1" );
			ClassificationRecord rec( 0, "query" );
			consensus.resolve( hits, rec, log );
			alltests = unittest_assert( rec.isResolved() && taxinter.getTaxID( rec.getNode() ) == 4, "DIRECT_ASSIGNMENT" ) && alltests;
			alltests = unittest_assert( nearlyEqual( rec.getConfidence(), 0.95 ), "DIRECT_CONFIDENCE" ) && alltests;
			alltests = unittest_assert( rec.getLevel() == "species", "DIRECT_LEVEL" ) && alltests;
		}

		{ // a single taxon is assigned directly
			QueryHits hits;
			hits.add( taxinter.getNode( 6 ), 0.7, "NC_000002.1" );
			ClassificationRecord rec( 0, "query" );
			consensus.resolve( hits, rec, log );
			alltests = unittest_assert( rec.isResolved() && taxinter.getTaxID( rec.getNode() ) == 6 && nearlyEqual( rec.getConfidence(), 0.7 ), "SINGLE_TAXON" ) && alltests;
		}

		{ // no hits
			QueryHits hits;
			ClassificationRecord rec( 0, "query" );
			consensus.resolve( hits, rec, log );
			alltests = unittest_assert( ! rec.isResolved(), "NO_HITS_UNRESOLVED" ) && alltests;
			alltests = unittest_assert( rec.getLineage( taxinter ) == unclassified_label && rec.getLevel() == unclassified_label, "NO_HITS_LABELS" ) && alltests;
			alltests = unittest_assert( rec.getConfidence() == 0., "NO_HITS_CONFIDENCE" ) && alltests;
		}

		{ // more contenders never raise the confidence
			QueryHits hits;
			hits.add( taxinter.getNode( 4 ), 0.9, "NC_000001.1" );
			ClassificationRecord before( 0, "query" );
			consensus.resolve( hits, before, log );
			hits.add( taxinter.getNode( 3 ), 0.88, "NC_000003.1" );
			ClassificationRecord middle( 0, "query" );
			consensus.resolve( hits, middle, log );
			hits.add( taxinter.getNode( 6 ), 0.89, "NC_000002.1" );
			ClassificationRecord after( 0, "query" );
			consensus.resolve( hits, after, log );
			alltests = unittest_assert( middle.getConfidence() <= before.getConfidence() && after.getConfidence() <= middle.getConfidence(), "MONOTONIC_CONFIDENCE" ) && alltests;
			alltests = unittest_assert( taxinter.getTaxID( middle.getNode() ) == 3 && taxinter.getTaxID( after.getNode() ) == 2, "MONOTONIC_LEVELS" ) && alltests;
		}

		{ // best hit per taxon, ties go to the smaller target
			QueryHits hits;
			hits.add( taxinter.getNode( 4 ), 0.5, "NC_000009.1" );
			hits.add( taxinter.getNode( 4 ), 0.8, "NC_000008.1" );
			hits.add( taxinter.getNode( 4 ), 0.8, "NC_000007.1" );
			hits.add( taxinter.getNode( 4 ), 0.6, "NC_000006.1" );
			alltests = unittest_assert( hits.size() == 1, "COLLAPSE_PER_TAXON" ) && alltests;
			const TaxonHit& best = hits.hits().begin()->second;
			alltests = unittest_assert( best.score == 0.8 && best.target == "NC_000007.1", "COLLAPSE_BEST_HIT" ) && alltests;

			hits.add( taxinter.getNode( 6 ), 0.8, "NC_000001.1" );
			const std::vector< TaxonHit > ranked = hits.ranked();
			alltests = unittest_assert( ranked.size() == 2 && taxinter.getTaxID( ranked.front().node ) == 6, "RANK_TIE_BREAK" ) && alltests;
		}

		{ // broken parameters
			ConsensusParameters params;
			params.margin = 1.5;
			bool thrown = false;
			try {
				params.validate();
			} catch( ConfigurationError& ) {
				thrown = true;
			}
			alltests = unittest_assert( thrown, "BAD_MARGIN" ) && alltests;
		}
	}

	{ // alignment scores
		const ConsensusParameters params;
		AlignmentRecord rec;
		rec.parse( pafLine( "q", "t", 90, 100, 200, "60" ) );
		alltests = unittest_assert( nearlyEqual( scoreAlignment( rec, params ), 0.45 ), "SCORE_FULL_MAPQ" ) && alltests;
		rec.parse( pafLine( "q", "t", 90, 100, 200, "0" ) );
		alltests = unittest_assert( nearlyEqual( scoreAlignment( rec, params ), 0.36 ), "SCORE_ZERO_MAPQ" ) && alltests;
		rec.parse( pafLine( "q", "t", 90, 100, 200, "255" ) );
		alltests = unittest_assert( nearlyEqual( scoreAlignment( rec, params ), 0.45 ), "SCORE_MAPQ_UNAVAILABLE" ) && alltests;
		rec.parse( pafLine( "q", "t", 100, 100, 50, "60" ) );
		alltests = unittest_assert( nearlyEqual( scoreAlignment( rec, params ), 1. ), "SCORE_COVERAGE_CAPPED" ) && alltests;
	}

	{ // whole files
		TestDirectory dir;
		boost::scoped_ptr< Taxonomy > tax( parseHierarchyFile( dir.write( "hierarchy.tsv", test_hierarchy ) ) );
		boost::scoped_ptr< StrIDConverter > seqid2taxid( loadStrIDConverterFromFile( dir.write( "taxonomy.tsv", test_taxonomy_map ) ) );
		const TaxonomyInterface taxinter( tax.get() );

		const std::string paf = dir.write( "alignments.paf",
			pafLine( "contig1", "NC_000913.3", 95, 100 ) +
			pafLine( "contig2", "NC_003197.2", 99, 100 ) +
			"contig2\tnot\ta\tnumber\n" +
			pafLine( "contig1", "NC_011740.1", 94, 100 ) +
			pafLine( "contig3", "XX_000001.1", 99, 100 ) +
			pafLine( "contig2", "NC_000964.3", 50, 100 ) +
			pafLine( "contig4", "ENV_000001.1", 99, 100 ) +
			pafLine( "contig6", "NZ_CP070290.1", 80, 100 ) +
			pafLine( "contig1", "NC_000913.3", 60, 100 ) );

		std::vector< std::string > queries;
		queries.push_back( "contig1" );
		queries.push_back( "contig2" );
		queries.push_back( "contig3" );
		queries.push_back( "contig4" );
		queries.push_back( "contig5" );

		ClassificationStats stats;
		std::vector< ClassificationRecord > results;
		const std::string single = classify( tax.get(), seqid2taxid.get(), paf, queries, 1, stats, results );

		alltests = unittest_assert( results.size() == 6, "COMPLETENESS" ) && alltests;
		alltests = unittest_assert( results[4].getQueryIdentifier() == "contig5" && results[5].getQueryIdentifier() == "contig6", "INPUT_ORDER" ) && alltests;
		alltests = unittest_assert( stats.records == 8 && stats.skipped_lines == 1, "RECORD_COUNTS" ) && alltests;
		alltests = unittest_assert( stats.unmapped_hits == 1 && stats.resolved == 3 && ! stats.fallback, "RESOLVE_COUNTS" ) && alltests;

		alltests = unittest_assert( results[0].isResolved() && taxinter.getTaxID( results[0].getNode() ) == 50, "NONCONTIGUOUS_QUERY_LCA" ) && alltests;
		alltests = unittest_assert( nearlyEqual( results[0].getConfidence(), 0.95*6/7. ), "NONCONTIGUOUS_QUERY_CONFIDENCE" ) && alltests;
		alltests = unittest_assert( results[1].isResolved() && taxinter.getTaxID( results[1].getNode() ) == 61 && nearlyEqual( results[1].getConfidence(), 0.99 ), "DIRECT_QUERY" ) && alltests;
		alltests = unittest_assert( ! results[2].isResolved(), "UNMAPPED_QUERY" ) && alltests;
		alltests = unittest_assert( ! results[3].isResolved(), "UNRANKED_QUERY" ) && alltests;
		alltests = unittest_assert( ! results[4].isResolved(), "QUERY_WITHOUT_ALIGNMENTS" ) && alltests;
		alltests = unittest_assert( results[5].isResolved() && taxinter.getTaxID( results[5].getNode() ) == 56, "SPECIES_BELOW_UNRANKED" ) && alltests;

		std::vector< ClassificationRecord > results_parallel;
		const std::string parallel = classify( tax.get(), seqid2taxid.get(), paf, queries, 4, stats, results_parallel );
		alltests = unittest_assert( single == parallel, "DETERMINISTIC_OUTPUT" ) && alltests;

		alltests = unittest_assert( single.compare( 0, classification_header.size(), classification_header ) == 0, "OUTPUT_HEADER" ) && alltests;
		alltests = unittest_assert( single.find( "contig2\t" ) != std::string::npos && single.find( "\tspecies\t0.9900\n" ) != std::string::npos, "OUTPUT_FORMAT" ) && alltests;

		// written atomically
		writeClassification( dir.file( "classified_sequences.tsv" ), results, tax.get() );
		alltests = unittest_assert( readFile( dir.file( "classified_sequences.tsv" ) ) == single, "WRITTEN_OUTPUT" ) && alltests;

		// a profile that cannot be written leaves no classification table behind
		ProfileAggregator profile( tax.get() );
		for( std::vector< ClassificationRecord >::const_iterator it = results.begin(); it != results.end(); ++it ) profile.add( *it );
		bool thrown = false;
		try {
			writeClassificationAndProfile( dir.file( "joint.tsv" ), results, tax.get(), dir.file( "missing/profile.cami.tsv" ), profile, "sample" );
		} catch( FileNotFound& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown && ! boost::filesystem::exists( dir.file( "joint.tsv" ) ), "JOINT_OUTPUT_NOTHING_ON_FAILURE" ) && alltests;

		writeClassificationAndProfile( dir.file( "joint.tsv" ), results, tax.get(), dir.file( "joint.cami.tsv" ), profile, "sample" );
		std::ostringstream cami;
		profile.write( cami, "sample" );
		alltests = unittest_assert( readFile( dir.file( "joint.tsv" ) ) == single && readFile( dir.file( "joint.cami.tsv" ) ) == cami.str(), "JOINT_OUTPUT" ) && alltests;
	}

	{ // a failing parser stops all workers and its error reaches the caller
		TestDirectory dir;
		boost::scoped_ptr< Taxonomy > tax( parseHierarchyFile( dir.write( "hierarchy.tsv", test_hierarchy ) ) );
		std::ostringstream log;
		ClassificationPipeline pipeline( tax.get(), NULL, ConsensusParameters(), 4, log );
		std::vector< ClassificationRecord > results;
		bool thrown = false;
		try {
			pipeline.run( dir.file( "missing.paf" ), std::vector< std::string >( 1, "contig1" ), results );
		} catch( FileNotFound& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown && results.empty(), "PARSER_ERROR_JOINS_WORKERS" ) && alltests;
	}

	{ // first-hit fallback when nothing resolves
		TestDirectory dir;
		boost::scoped_ptr< Taxonomy > tax( parseHierarchyFile( dir.write( "hierarchy.tsv", test_hierarchy ) ) );
		boost::scoped_ptr< StrIDConverter > seqid2taxid( loadStrIDConverterFromFile( dir.write( "taxonomy.tsv", test_taxonomy_map ) ) );
		const TaxonomyInterface taxinter( tax.get() );

		// common ancestor of both hits is the unranked root
		const std::string paf = dir.write( "alignments.paf",
			pafLine( "contig1", "NC_000913.3", 90, 100 ) +
			pafLine( "contig1", "ENV_000001.1", 90, 100 ) );
		std::vector< std::string > queries;
		queries.push_back( "contig1" );
		queries.push_back( "contig2" );

		ClassificationStats stats;
		std::vector< ClassificationRecord > results;
		classify( tax.get(), seqid2taxid.get(), paf, queries, 2, stats, results );
		alltests = unittest_assert( stats.fallback, "FALLBACK_USED" ) && alltests;
		alltests = unittest_assert( results.size() == 2 && results[0].isFallback() && taxinter.getTaxID( results[0].getNode() ) == 51, "FALLBACK_FIRST_HIT" ) && alltests;
		alltests = unittest_assert( nearlyEqual( results[0].getConfidence(), 0.9 ), "FALLBACK_CONFIDENCE" ) && alltests;
		alltests = unittest_assert( ! results[1].isResolved(), "FALLBACK_NO_ALIGNMENT" ) && alltests;

		// without any taxonomy map everything stays unclassified, but every query is reported
		classify( tax.get(), NULL, paf, queries, 2, stats, results );
		alltests = unittest_assert( stats.fallback && results.size() == 2 && ! results[0].isResolved() && ! results[1].isResolved(), "FALLBACK_WITHOUT_MAP" ) && alltests;
	}

	if( alltests ) {
		cout << std::endl << "All tests ran through!" << endl;
	} else {
		cerr << std::endl << "At least one test failed!" << endl;
	}

	return alltests ? EXIT_SUCCESS : EXIT_FAILURE;
}
