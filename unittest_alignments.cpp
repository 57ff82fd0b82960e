#include <iostream>
#include <cstdlib>
#include <sstream>
#include "src/alignmentrecord.hh"
#include "src/classificationpipeline.hh"
#include "src/constants.hh"
#include "src/exception.hh"
#include "src/fileparser.hh"
#include "src/unittest.hh"



using namespace std;



namespace {

const std::string paf_file =
	"# minimap2 -x asm10\n"
	"read_1\t200\t0\t100\t+\tNC_000913.3\t5000\t100\t200\t90\t100\t60\ttp:A:P\tcm:i:12\n"
	"\n"
	"read_2\t100\t0\n"
	"read_3\t100\t0\t100\t*\tNC_000913.3\t5000\t0\t100\t90\t100\t60\n"
	"read_4\t100\t0\t100\t+\tNC_000913.3\t5000\t0\t100\t120\t100\t60\n"
	"read_5\t150\t10\t130\t-\tNC_003197.2\t8000\t500\t620\t100\t120\n"
	"read_6\t100\t50\t10\t+\tNC_000913.3\t5000\t0\t100\t90\t100\t60\n"
	"read_7\tabc\t0\t100\t+\tNC_000913.3\t5000\t0\t100\t90\t100\t60\n";



bool parseFails( const std::string& line ) {
	AlignmentRecord rec;
	try {
		rec.parse( line );
	} catch( ParsingError& ) {
		return true;
	}
	return false;
}

}



int main( int argc, char** argv ) {
	bool alltests = true;

	{ // single records
		AlignmentRecord rec;
		rec.parse( "read_1\t200\t0\t100\t+\tNC_000913.3\t5000\t100\t200\t90\t100\t60\ttp:A:P\tcm:i:12" );
		alltests = unittest_assert( rec.getQueryIdentifier() == "read_1" && rec.getReferenceIdentifier() == "NC_000913.3", "RECORD_IDENTIFIERS" ) && alltests;
		alltests = unittest_assert( rec.getQueryLength() == 200 && rec.getQueryStart() == 0 && rec.getQueryStop() == 100, "RECORD_QUERY_COORDINATES" ) && alltests;
		alltests = unittest_assert( rec.getReferenceLength() == 5000 && rec.getReferenceStart() == 100 && rec.getReferenceStop() == 200, "RECORD_REFERENCE_COORDINATES" ) && alltests;
		alltests = unittest_assert( rec.getStrand() == '+' && rec.getMatches() == 90 && rec.getAlignmentLength() == 100, "RECORD_BLOCK" ) && alltests;
		alltests = unittest_assert( rec.hasMappingQuality() && rec.getMappingQuality() == 60, "RECORD_MAPQ" ) && alltests;
		alltests = unittest_assert( nearlyEqual( rec.getIdentity(), 0.9 ) && nearlyEqual( rec.getCoverage(), 0.5 ), "RECORD_IDENTITY_COVERAGE" ) && alltests;

		rec.parse( "read_5\t150\t10\t130\t-\tNC_003197.2\t8000\t500\t620\t100\t120" );
		alltests = unittest_assert( ! rec.hasMappingQuality() && rec.getStrand() == '-', "RECORD_WITHOUT_MAPQ" ) && alltests;

		rec.parse( "read_8\t50\t0\t50\t+\tNC_003197.2\t8000\t500\t580\t70\t80\t255" );
		alltests = unittest_assert( ! rec.hasMappingQuality() && nearlyEqual( rec.getCoverage(), 1. ), "RECORD_MAPQ_255_COVERAGE_CAPPED" ) && alltests;

		alltests = unittest_assert( parseFails( "read_2\t100\t0" ), "REJECT_TOO_FEW_FIELDS" ) && alltests;
		alltests = unittest_assert( parseFails( "read_3\t100\t0\t100\t*\tNC_000913.3\t5000\t0\t100\t90\t100\t60" ), "REJECT_STRAND" ) && alltests;
		alltests = unittest_assert( parseFails( "read_4\t100\t0\t100\t+\tNC_000913.3\t5000\t0\t100\t120\t100\t60" ), "REJECT_MATCHES_ABOVE_BLOCK" ) && alltests;
		alltests = unittest_assert( parseFails( "read_6\t100\t50\t10\t+\tNC_000913.3\t5000\t0\t100\t90\t100\t60" ), "REJECT_REVERSED_QUERY" ) && alltests;
		alltests = unittest_assert( parseFails( "read_7\tabc\t0\t100\t+\tNC_000913.3\t5000\t0\t100\t90\t100\t60" ), "REJECT_NUMBER" ) && alltests;
		alltests = unittest_assert( parseFails( "read_9\t0\t0\t0\t+\tNC_000913.3\t5000\t0\t100\t90\t100\t60" ), "REJECT_ZERO_QUERY_LENGTH" ) && alltests;
		alltests = unittest_assert( parseFails( "read_10\t100\t0\t100\t+\tNC_000913.3\t5000\t0\t100\t0\t0\t60" ), "REJECT_EMPTY_BLOCK" ) && alltests;
		alltests = unittest_assert( parseFails( "read_11\t100\t0\t100\t+\tNC_000913.3\t5000\t0\t100\t90\t100\tx" ), "REJECT_MAPQ" ) && alltests;
		alltests = unittest_assert( parseFails( "\t100\t0\t100\t+\tNC_000913.3\t5000\t0\t100\t90\t100\t60" ), "REJECT_EMPTY_QUERY" ) && alltests;
	}

	{ // whole file, malformed lines are skipped and counted
		TestDirectory dir;
		const std::string filename = dir.write( "alignments.paf", paf_file );
		std::ostringstream log;
		AlignmentRecordFactory fac;
		FileParser< AlignmentRecordFactory > parser( filename, fac, &log );

		std::vector< std::string > queries;
		while( AlignmentRecord* rec = parser.next() ) {
			queries.push_back( rec->getQueryIdentifier() );
			parser.destroy( rec );
		}
		alltests = unittest_assert( queries.size() == 2 && queries[0] == "read_1" && queries[1] == "read_5", "PARSER_VALID_RECORDS" ) && alltests;
		alltests = unittest_assert( parser.numSkipped() == 5 && parser.eof(), "PARSER_SKIPPED" ) && alltests;
		alltests = unittest_assert( log.str().find( "skipping malformed line 4 in " + filename ) != std::string::npos, "PARSER_LOGS_LINE" ) && alltests;

		alltests = unittest_assert( parser.rewind() && ! parser.eof() && parser.numSkipped() == 0, "PARSER_REWIND" ) && alltests;
		AlignmentRecord* first = parser.next();
		alltests = unittest_assert( first && first->getQueryIdentifier() == "read_1", "PARSER_REWIND_FIRST" ) && alltests;
		parser.destroy( first );

		// line and skip counts of large alignment files exceed 32 bits
		alltests = unittest_assert( sizeof( parser.lineNumber() ) >= 8 && sizeof( parser.numSkipped() ) >= 8 && sizeof( ClassificationStats().skipped_lines ) >= 8, "PARSER_COUNTERS_64BIT" ) && alltests;
	}

	{ // streams cannot be rewound, files must exist
		std::istringstream strm( paf_file );
		AlignmentRecordFactory fac;
		FileParser< AlignmentRecordFactory > parser( strm, fac );
		std::size_t n = 0;
		while( AlignmentRecord* rec = parser.next() ) {
			++n;
			parser.destroy( rec );
		}
		alltests = unittest_assert( n == 2 && ! parser.rewind(), "STREAM_PARSER" ) && alltests;

		bool thrown = false;
		try {
			FileParser< AlignmentRecordFactory > missing( "/nonexistent/alignments.paf", fac );
		} catch( FileNotFound& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "PARSER_MISSING_FILE" ) && alltests;
	}

	if( alltests ) {
		cout << std::endl << "All tests ran through!" << endl;
	} else {
		cerr << std::endl << "At least one test failed!" << endl;
	}

	return alltests ? EXIT_SUCCESS : EXIT_FAILURE;
}
