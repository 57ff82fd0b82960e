#include <iostream>
#include <cstdlib>
#include <sstream>
#include "src/candidatelimiter.hh"
#include "src/candidateselector.hh"
#include "src/constants.hh"
#include "src/exception.hh"
#include "src/unittest.hh"



using namespace std;



namespace {

std::string screenRow( double score, const std::string& genome ) {
	std::ostringstream row;
	row << score << tab << "900/1000" << tab << 5 << tab << 0 << tab << genome << tab << "[12 seqs] some genome" << endline;
	return row.str();
}



std::vector< ScreenHit > hitsFromScores( const double* scores, std::size_t n, const std::string& prefix = "G" ) {
	std::ostringstream table;
	for( std::size_t i = 0; i < n; ++i ) table << screenRow( scores[i], prefix + static_cast< char >( 'A' + i ) );
	std::istringstream strm( table.str() );
	std::vector< ScreenHit > hits;
	parseScreenTable( strm, hits );
	return hits;
}



std::string summaryRow( const std::string& accession, const std::string& taxid, const std::string& species_taxid, const std::string& organism ) {
	return accession + "\tPRJNA1\tSAMN1\t\trepresentative genome\t" + taxid + tab + species_taxid + tab + organism + "\tstrain=x\n";
}

}



int main( int argc, char** argv ) {
	bool alltests = true;
	std::ostringstream log;

	{ // screen table parsing
		std::istringstream strm(
			"# comment\n" +
			screenRow( 0.91, "GCF_2_genomic.fna.gz" ) +
			screenRow( 0.95, "GCF_1_genomic.fna.gz" ) +
			screenRow( 0.93, "GCF_2_genomic.fna.gz" ) +
			"abc\t1/1000\t1\t0\tGCF_3_genomic.fna.gz\n" +
			"0.99\t1/1000\n" +
			screenRow( 0.95, "GCF_0_genomic.fna.gz" ) );
		std::vector< ScreenHit > hits;
		const large_unsigned_int skipped = parseScreenTable( strm, hits );
		alltests = unittest_assert( skipped == 2, "SCREEN_SKIPPED_ROWS" ) && alltests;
		alltests = unittest_assert( hits.size() == 3, "SCREEN_DEDUPLICATED" ) && alltests;
		alltests = unittest_assert( hits[0].genome_id == "GCF_0_genomic.fna.gz" && hits[1].genome_id == "GCF_1_genomic.fna.gz", "SCREEN_ORDER_TIES" ) && alltests;
		alltests = unittest_assert( hits[2].genome_id == "GCF_2_genomic.fna.gz" && hits[2].score == 0.93, "SCREEN_BEST_SCORE" ) && alltests;
		alltests = unittest_assert( hits[2].raw_metrics.find( "900/1000" ) == 0, "SCREEN_RAW_METRICS" ) && alltests;
	}

	{ // required number of candidates
		const SelectorParameters params;
		alltests = unittest_assert( params.requiredCandidates( 0 ) == 5, "REQUIRED_FLOOR" ) && alltests;
		alltests = unittest_assert( params.requiredCandidates( 1 ) == 5, "REQUIRED_FLOOR_SMALL" ) && alltests;
		alltests = unittest_assert( params.requiredCandidates( 2 ) == 7, "REQUIRED_CEIL" ) && alltests;
		alltests = unittest_assert( params.requiredCandidates( 4 ) == 13, "REQUIRED_EXACT" ) && alltests;
		alltests = unittest_assert( params.maxIterations() == 11, "MAX_ITERATIONS" ) && alltests;
	}

	{ // threshold search
		const CandidateSelector selector( SelectorParameters(), log );
		const double scores[] = { 0.95, 0.93, 0.91, 0.85, 0.80, 0.75 };
		const std::vector< ScreenHit > hits = hitsFromScores( scores, 6 );

		SelectionResult result = selector.select( hits, 3 );
		alltests = unittest_assert( nearlyEqual( result.threshold, 0.90 ) && result.iterations == 1 && result.genomes.size() == 3 && ! result.degraded, "THRESHOLD_FIRST" ) && alltests;

		result = selector.select( hits, 5 );
		alltests = unittest_assert( nearlyEqual( result.threshold, 0.78 ) && result.iterations == 7 && result.genomes.size() == 5, "THRESHOLD_LOWERED" ) && alltests;
		alltests = unittest_assert( result.genomes.front() == "GA" && result.genomes.back() == "GE", "THRESHOLD_SORTED" ) && alltests;

		// strictly greater, without drift at 0.90 - 5*0.02
		const double exact[] = { 0.80 };
		result = selector.select( hitsFromScores( exact, 1 ), 1 );
		alltests = unittest_assert( result.iterations == 7 && nearlyEqual( result.threshold, 0.78 ), "THRESHOLD_STRICT" ) && alltests;

		// never enough: bounded search, then the fallback threshold
		result = selector.select( hits, 10 );
		alltests = unittest_assert( result.degraded && result.iterations == 11, "THRESHOLD_TERMINATES" ) && alltests;
		alltests = unittest_assert( nearlyEqual( result.threshold, default_fallback_threshold ) && result.genomes.size() == 6, "THRESHOLD_FALLBACK" ) && alltests;

		result = selector.select( std::vector< ScreenHit >(), 5 );
		alltests = unittest_assert( result.genomes.empty() && result.degraded, "THRESHOLD_EMPTY_TABLE" ) && alltests;
	}

	{ // union over databases
		const CandidateSelector selector( SelectorParameters(), log );
		std::vector< std::vector< ScreenHit > > tables( 3 );
		const double scores[] = { 0.95, 0.95, 0.95 };
		std::vector< ScreenHit > first = hitsFromScores( scores, 3 ); // GA GB GC
		std::vector< ScreenHit > second = hitsFromScores( scores, 2 ); // GA GB
		second[0].genome_id = "GB";
		second[1].genome_id = "GD";
		tables[0] = first;
		tables[1] = second;

		std::vector< SelectionResult > per_table;
		const std::vector< std::string > merged = selector.selectAll( tables, 1, &per_table );
		alltests = unittest_assert( merged.size() == 4 && merged[0] == "GA" && merged[1] == "GB" && merged[2] == "GC" && merged[3] == "GD", "UNION_SORTED" ) && alltests;
		alltests = unittest_assert( per_table.size() == 3 && per_table[2].genomes.empty(), "UNION_PER_TABLE" ) && alltests;

		std::swap( tables[0], tables[2] );
		alltests = unittest_assert( selector.selectAll( tables, 1 ) == merged, "UNION_ORDER_INDEPENDENT" ) && alltests;

		bool thrown = false;
		try {
			selector.selectAll( std::vector< std::vector< ScreenHit > >( 2 ), 1 );
		} catch( InputError& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "UNION_ALL_EMPTY" ) && alltests;
	}

	{ // selector parameters
		SelectorParameters params;
		params.step = 0.;
		bool thrown = false;
		try {
			CandidateSelector selector( params, log );
		} catch( ConfigurationError& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "BAD_STEP" ) && alltests;
	}

	{ // species deduplication and cap
		TestDirectory dir;
		const std::string screen1 = dir.write( "screen_refseq.tab",
			screenRow( 0.97, "GCF_000005845.2_ASM584v2_genomic.fna.gz" ) +
			screenRow( 0.96, "GCF_000008865.2_ASM886v2_genomic.fna.gz" ) +
			screenRow( 0.93, "GCF_000006945.2_ASM694v2_genomic.fna.gz" ) +
			screenRow( 0.90, "GCF_000009045.1_ASM904v1_genomic.fna.gz" ) );
		const std::string screen2 = dir.write( "screen_gtdb.tab",
			screenRow( 0.98, "GCF_000008865.2_ASM886v2_genomic.fna.gz" ) +
			screenRow( 0.93, "GCF_000022165.1_ASM2216v1_genomic.fna.gz" ) );
		const std::string summary = dir.write( "assembly_summary_refseq.txt",
			"#   See ftp://ftp.ncbi.nlm.nih.gov/genomes/README_assembly_summary.txt\n"
			"# assembly_accession\tbioproject\tbiosample\twgs_master\trefseq_category\ttaxid\tspecies_taxid\torganism_name\tinfraspecific_name\n" +
			summaryRow( "GCF_000005845.2", "511145", "562", "Escherichia coli K-12" ) +
			summaryRow( "GCF_000008865.2", "386585", "562", "Escherichia coli O157:H7" ) +
			summaryRow( "GCF_000006945.2", "99287", "28901", "Salmonella enterica LT2" ) +
			summaryRow( "GCF_000022165.1", "588858", "28901", "Salmonella enterica 14028S" ) +
			summaryRow( "GCF_000009045.1", "224308", "", "Bacillus subtilis 168" ) +
			"broken row\n" );

		SpeciesMap species;
		alltests = unittest_assert( species.loadAssemblySummary( summary ) && species.size() == 5, "SPECIES_MAP" ) && alltests;
		alltests = unittest_assert( ! species.loadAssemblySummary( dir.file( "missing.txt" ) ), "SPECIES_MAP_MISSING" ) && alltests;
		std::string key;
		alltests = unittest_assert( species.find( "GCF_000009045.1_ASM904v1_genomic.fna.gz", key ) && key == "224308", "SPECIES_TAXID_FALLBACK" ) && alltests;

		ScoreTable scores;
		alltests = unittest_assert( scores.load( screen1 ) && scores.load( screen2 ) && ! scores.load( dir.file( "missing.tab" ) ), "SCORE_TABLES" ) && alltests;
		alltests = unittest_assert( scores.readable_tables == 2, "SCORE_TABLES_READABLE" ) && alltests;

		std::vector< std::string > candidates;
		candidates.push_back( "GCF_000009045.1_ASM904v1_genomic.fna.gz" );
		candidates.push_back( "GCF_000005845.2_ASM584v2_genomic.fna.gz" );
		candidates.push_back( "GCF_000022165.1_ASM2216v1_genomic.fna.gz" );
		candidates.push_back( "GCF_000008865.2_ASM886v2_genomic.fna.gz" );
		candidates.push_back( "GCF_000006945.2_ASM694v2_genomic.fna.gz" );
		candidates.push_back( "GCF_000005845.2_ASM584v2_genomic.fna.gz" );
		candidates.push_back( "GCF_999999999.1_unscored_genomic.fna.gz" );

		std::vector< std::string > final_list;
		LimitAudit audit;
		CandidateLimiter( 10, true, &species ).limit( candidates, scores, final_list, audit );
		alltests = unittest_assert( audit.input_count == 6 && audit.post_dedup_count == 4 && audit.post_cap_count == 4, "DEDUP_AUDIT" ) && alltests;
		alltests = unittest_assert( final_list.size() == 4, "DEDUP_SIZE" ) && alltests;
		// O157:H7 wins E. coli with 0.98 from the second table, Salmonella tie goes to the smaller accession
		alltests = unittest_assert( final_list[0] == "GCF_000006945.2_ASM694v2_genomic.fna.gz" && final_list[1] == "GCF_000008865.2_ASM886v2_genomic.fna.gz", "DEDUP_BEST_PER_SPECIES" ) && alltests;
		alltests = unittest_assert( final_list[2] == "GCF_000009045.1_ASM904v1_genomic.fna.gz" && final_list[3] == "GCF_999999999.1_unscored_genomic.fna.gz", "DEDUP_SORTED" ) && alltests;

		CandidateLimiter( 2, true, &species ).limit( candidates, scores, final_list, audit );
		alltests = unittest_assert( audit.post_cap_count == 2 && final_list.size() == 2, "CAP_SIZE" ) && alltests;
		alltests = unittest_assert( final_list[0] == "GCF_000006945.2_ASM694v2_genomic.fna.gz" && final_list[1] == "GCF_000008865.2_ASM886v2_genomic.fna.gz", "CAP_BY_SCORE" ) && alltests;

		CandidateLimiter( 3, false ).limit( candidates, scores, final_list, audit );
		alltests = unittest_assert( audit.post_dedup_count == 6 && final_list.size() == 3, "NO_DEDUP" ) && alltests;
		alltests = unittest_assert( final_list[0] == "GCF_000005845.2_ASM584v2_genomic.fna.gz" && final_list[1] == "GCF_000006945.2_ASM694v2_genomic.fna.gz" && final_list[2] == "GCF_000008865.2_ASM886v2_genomic.fna.gz", "NO_DEDUP_CAP" ) && alltests;

		std::vector< CandidateGenome > genomes;
		CandidateLimiter( 1, true, &species ).getCandidates( candidates, scores, genomes );
		alltests = unittest_assert( genomes.size() == 6 && genomes[0].species_key == "224308" && genomes[5].best_score < -1e300, "CANDIDATE_RECORDS" ) && alltests;
		alltests = unittest_assert( genomes[3].source_db == screen2 && genomes[3].best_score == 0.98, "CANDIDATE_SOURCE" ) && alltests;

		std::ostringstream audit_line;
		audit_line << audit;
		alltests = unittest_assert( audit_line.str().find( "6 input" ) != std::string::npos, "AUDIT_OUTPUT" ) && alltests;

		bool thrown = false;
		try {
			CandidateLimiter( 0, true );
		} catch( ConfigurationError& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "ZERO_CAP" ) && alltests;

		thrown = false;
		try {
			CandidateLimiter( 5, true ).limit( candidates, ScoreTable(), final_list, audit );
		} catch( ConfigurationError& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "NO_SCORE_TABLE" ) && alltests;
	}

	if( alltests ) {
		cout << std::endl << "All tests ran through!" << endl;
	} else {
		cerr << std::endl << "At least one test failed!" << endl;
	}

	return alltests ? EXIT_SUCCESS : EXIT_FAILURE;
}
