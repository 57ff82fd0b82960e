#include <iostream>
#include <cstdlib>
#include <sstream>
#include <boost/filesystem.hpp>
#include "src/cancellation.hh"
#include "src/constants.hh"
#include "src/exception.hh"
#include "src/pipeline.hh"
#include "src/unittest.hh"



using namespace std;
namespace fs = boost::filesystem;



namespace {

const std::string query_fasta =
	">contig1 first\n"
	"ACGTACGTACGT\n"
	">contig2\n"
	"ACGTACGTACGT\n";

const std::string screen_table =
	"0.97\t900/1000\t5\t0\tGCF_000005845.2_ASM584v2_genomic.fna.gz\t[2 seqs] Escherichia coli\n"
	"0.95\t880/1000\t4\t0\tGCF_000006945.2_ASM694v2_genomic.fna.gz\t[1 seqs] Salmonella enterica\n";

const std::string alignments =
	"contig1\t12\t0\t12\t+\tNC_000913.3\t5000\t100\t112\t11\t12\t60\n"
	"contig2\t12\t0\t12\t+\tNC_003197.2\t5000\t100\t112\t12\t12\t60\n";



// executable shell script in the test directory
std::string writeScript( const TestDirectory& dir, const std::string& name, const std::string& body ) {
	const std::string filename = dir.write( name, "#!/bin/sh\n" + body );
	fs::permissions( filename, fs::owner_all | fs::group_read | fs::group_exe | fs::others_read | fs::others_exe );
	return filename;
}



// minimap2 stand-in: builds an index on -d, otherwise fails the first `failures` alignment
// calls and then prints the alignments; every alignment call is counted in `counter`
std::string writeAligner( const TestDirectory& dir, const std::string& name, const std::string& counter, unsigned int failures ) {
	std::ostringstream body;
	body << "if [ \"$2\" = \"-d\" ]; then echo index > \"$3\"; exit 0; fi" << endline
	     << "n=$(cat '" << counter << "' 2>/dev/null || echo 0)" << endline
	     << "echo $((n+1)) > '" << counter << "'" << endline
	     << "if [ \"$n\" -lt " << failures << " ]; then exit 1; fi" << endline
	     << "cat '" << dir.file( "alignments.fixture" ) << "'" << endline;
	return writeScript( dir, name, body.str() );
}



bool sameOutcome( const boost::ptr_vector< StageReport >& reports, StageOutcome outcome ) {
	for( boost::ptr_vector< StageReport >::const_iterator it = reports.begin(); it != reports.end(); ++it ) {
		if( it->outcome != outcome ) return false;
	}
	return ! reports.empty();
}



const StageReport* findReport( const boost::ptr_vector< StageReport >& reports, const std::string& name ) {
	for( boost::ptr_vector< StageReport >::const_iterator it = reports.begin(); it != reports.end(); ++it ) {
		if( it->name == name ) return &*it;
	}
	return NULL;
}

}



int main( int argc, char** argv ) {
	bool alltests = true;

	TestDirectory dir;
	dir.write( "screen.fixture", screen_table );
	dir.write( "alignments.fixture", alignments );
	dir.write( "taxonomy.fixture", test_taxonomy_map );

	const std::string downloads = dir.file( "downloads.count" );
	const std::string align_calls = dir.file( "align.count" );

	PipelineSettings settings;
	settings.inputs.push_back( dir.write( "queries.fasta", query_fasta ) );
	settings.sketches.push_back( dir.file( "refseq.msh" ) );
	settings.hierarchy = dir.write( "hierarchy.tsv", test_hierarchy );
	settings.cache_dir = dir.file( "cache" );
	settings.outdir = dir.file( "run" );
	settings.sample_id = "S1";
	settings.retries = 2;
	settings.mash = writeScript( dir, "mash", "cat '" + dir.file( "screen.fixture" ) + "'\n" );
	settings.downloader = writeScript( dir, "download",
		"echo call >> '" + downloads + "'\n"
		"printf '>NC_000913.3\\nACGT\\n>NC_003197.2\\nACGT\\n' > \"$2/combined_genomes.fasta\"\n"
		"cp '" + dir.file( "taxonomy.fixture" ) + "' \"$3\"\n" );
	settings.minimap2 = writeAligner( dir, "minimap2", align_calls, 1 );

	{ // fresh run, the aligner fails once and succeeds on the retry
		std::ostringstream log;
		Pipeline pipeline( settings, log );
		pipeline.run();
		const boost::ptr_vector< StageReport >& reports = pipeline.reports();

		alltests = unittest_assert( reports.size() == 7 && sameOutcome( reports, StageOutcome::Completed ), "FRESH_RUN_COMPLETED" ) && alltests;
		const StageReport* align = findReport( reports, "align" );
		alltests = unittest_assert( align && align->attempts == 2 && readFile( align_calls ) == "2\n", "RETRY_AFTER_FAILURE" ) && alltests;
		alltests = unittest_assert( log.str().find( "STAGE\talign\tcompleted\t2\t" ) != std::string::npos, "STAGE_LOG_LINE" ) && alltests;
		alltests = unittest_assert( readFile( pipeline.screenFile( settings.sketches[0] ).string() ) == screen_table, "SCREEN_OUTPUT" ) && alltests;
		alltests = unittest_assert( readFile( pipeline.alignmentFile().string() ) == alignments, "ALIGNMENT_OUTPUT" ) && alltests;

		const std::string table = readFile( pipeline.classificationFile().string() );
		alltests = unittest_assert( table.find( "contig1\t" ) != std::string::npos && table.find( "contig2\t" ) != std::string::npos, "CLASSIFICATION_OUTPUT" ) && alltests;
		alltests = unittest_assert( pipeline.profileFile() == fs::path( settings.outdir ) / "hymet.S1.cami.tsv" && readFile( pipeline.profileFile().string() ).find( "@SampleID:S1" ) == 0, "PROFILE_OUTPUT" ) && alltests;
		alltests = unittest_assert( readFile( downloads ) == "call\n", "SINGLE_DOWNLOAD" ) && alltests;
	}

	{ // rerun with all outputs in place
		std::ostringstream log;
		Pipeline pipeline( settings, log );
		pipeline.run();
		const boost::ptr_vector< StageReport >& reports = pipeline.reports();

		alltests = unittest_assert( reports.size() == 7 && sameOutcome( reports, StageOutcome::Skipped ), "RERUN_SKIPPED" ) && alltests;
		alltests = unittest_assert( findReport( reports, "align" )->attempts == 0 && readFile( align_calls ) == "2\n", "RERUN_NO_ALIGNMENT" ) && alltests;
		alltests = unittest_assert( readFile( downloads ) == "call\n", "RERUN_CACHED_REFERENCE" ) && alltests;
	}

	{ // a stage doing work invalidates everything after it
		fs::remove( dir.file( "run/selected_genomes.txt" ) );
		std::ostringstream log;
		Pipeline pipeline( settings, log );
		pipeline.run();
		const boost::ptr_vector< StageReport >& reports = pipeline.reports();

		alltests = unittest_assert( findReport( reports, "screen" )->outcome == StageOutcome::Skipped && findReport( reports, "select" )->outcome == StageOutcome::Completed, "INVALIDATED_FROM_SELECT" ) && alltests;
		alltests = unittest_assert( findReport( reports, "limit" )->outcome == StageOutcome::Completed && findReport( reports, "align" )->outcome == StageOutcome::Completed && findReport( reports, "profile" )->outcome == StageOutcome::Completed, "INVALIDATED_DOWNSTREAM" ) && alltests;
		alltests = unittest_assert( findReport( reports, "reference" )->outcome == StageOutcome::Skipped && readFile( downloads ) == "call\n", "INVALIDATED_REFERENCE_CACHED" ) && alltests;
		alltests = unittest_assert( readFile( align_calls ) == "3\n", "INVALIDATED_ALIGNED_AGAIN" ) && alltests;
	}

	{ // the run fails once the retries are used up
		PipelineSettings broken( settings );
		broken.outdir = dir.file( "broken" );
		broken.retries = 1;
		broken.minimap2 = writeAligner( dir, "minimap2-broken", dir.file( "broken.count" ), 100 );
		std::ostringstream log;
		Pipeline pipeline( broken, log );
		bool thrown = false;
		try {
			pipeline.run();
		} catch( ExternalToolError& ) {
			thrown = true;
		}
		const boost::ptr_vector< StageReport >& reports = pipeline.reports();
		alltests = unittest_assert( thrown && ! reports.empty() && reports.back().name == "align", "RETRIES_EXHAUSTED" ) && alltests;
		alltests = unittest_assert( reports.back().outcome == StageOutcome::Failed && reports.back().attempts == 2 && readFile( dir.file( "broken.count" ) ) == "2\n", "FAILED_AFTER_RETRIES" ) && alltests;
		alltests = unittest_assert( log.str().find( "STAGE\talign\tfailed\t2\t" ) != std::string::npos, "FAILED_LOG_LINE" ) && alltests;

		std::size_t hidden = 0;
		for( fs::directory_iterator it( broken.outdir ), end; it != end; ++it ) {
			if( it->path().filename().string()[0] == '.' ) ++hidden;
		}
		alltests = unittest_assert( ! fs::exists( pipeline.alignmentFile() ) && ! fs::exists( pipeline.classificationFile() ) && hidden == 0, "FAILED_NO_OUTPUT" ) && alltests;
	}

	{ // cancellation stops before the next stage
		PipelineSettings cancelled( settings );
		cancelled.outdir = dir.file( "cancelled" );
		std::ostringstream log;
		Pipeline pipeline( cancelled, log );
		cancellation::request();
		bool thrown = false;
		try {
			pipeline.run();
		} catch( CancellationError& ) {
			thrown = true;
		}
		cancellation::reset();
		alltests = unittest_assert( thrown && pipeline.reports().empty() && ! fs::exists( pipeline.screenFile( cancelled.sketches[0] ) ), "CANCELLED" ) && alltests;
	}

	{ // settings are checked up front
		std::ostringstream log;
		PipelineSettings incomplete( settings );
		incomplete.downloader.clear();
		bool thrown = false;
		try {
			Pipeline pipeline( incomplete, log );
		} catch( ConfigurationError& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "MISSING_DOWNLOADER" ) && alltests;

		PipelineSettings missing( settings );
		missing.inputs.assign( 1, dir.file( "no-such-queries.fasta" ) );
		thrown = false;
		try {
			Pipeline pipeline( missing, log );
		} catch( FileNotFound& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "MISSING_INPUT" ) && alltests;
	}

	if( alltests ) {
		cout << std::endl << "All tests ran through!" << endl;
	} else {
		cerr << std::endl << "At least one test failed!" << endl;
	}

	return alltests ? EXIT_SUCCESS : EXIT_FAILURE;
}
