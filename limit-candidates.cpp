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

#include <boost/program_options/cmdline.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <iostream>
#include <fstream>
#include "src/candidatelimiter.hh"
#include "src/constants.hh"
#include "src/exception.hh"
#include "src/identifierlist.hh"
#include "src/utils.hh"

using namespace std;



int main( int argc, char** argv ) {

	vector< string > screen_filenames, summary_filenames;
	string input_filename, output_filename, log_filename;
	unsigned int max_candidates;
	bool dedupe;

	namespace po = boost::program_options;
	po::options_description visible_options ( "Allowed options" );
	visible_options.add_options()
	( "help,h", "show help message" )
	( "citation", "show citation info" )
	( "advanced-options", "show advanced program options" )
	( "input,i", po::value< string >( &input_filename ), "selected genome identifiers, one per line" )
	( "screen,s", po::value< vector< string > >( &screen_filenames )->multitoken(), "mash screen tables providing the candidate scores" )
	( "assembly-summary,a", po::value< vector< string > >( &summary_filenames )->multitoken(), "NCBI assembly_summary files for species deduplication" )
	( "max-candidates,m", po::value< unsigned int >( &max_candidates )->default_value( default_max_candidates ), "keep at most this many candidates" )
	( "output,o", po::value< string >( &output_filename )->default_value( "candidates.txt" ), "final candidate list, one per line" )
	( "logfile,l", po::value< string >( &log_filename )->default_value( "/dev/null" ), "specify name of file for logging (appending lines)" );

	po::options_description hidden_options( "Hidden options" );
	hidden_options.add_options()
	( "dedupe,d", po::value< bool >( &dedupe )->default_value( true ), "keep only the best scoring candidate per species" );

	po::options_description all_options;
	all_options.add( visible_options ).add( hidden_options );

	po::variables_map vm;
	try {
		po::store( po::command_line_parser( argc, argv ).options( all_options ).run(), vm );
		po::notify( vm );
	} catch( po::error& e ) {
		cerr << e.what() << endl << visible_options << endl;
		return EXIT_FAILURE;
	}

	if( vm.count( "help" ) ) {
		cout << visible_options << endl;
		return EXIT_SUCCESS;
	}

	if( vm.count( "citation" ) ) {
		cout << citation_note << endl;
		return EXIT_SUCCESS;
	}

	if( vm.count( "advanced-options" ) ) {
		cout << hidden_options << endl;
		return EXIT_SUCCESS;
	}

	if( input_filename.empty() || screen_filenames.empty() ) {
		cout << "Specify the selected genomes and the screen tables" << endl;
		cout << visible_options << endl;
		return EXIT_FAILURE;
	}

	std::ofstream logsink( log_filename.c_str(), std::ios_base::app );

	try {
		std::vector< std::string > selected;
		readIdentifiers( input_filename, selected );

		SpeciesMap species;
		for( vector< string >::const_iterator it = summary_filenames.begin(); it != summary_filenames.end(); ++it ) {
			if( ! species.loadAssemblySummary( *it ) ) warnDegradedMode( "cannot read assembly summary " + *it + ", deduplicating by accession", logsink );
		}
		if( ! summary_filenames.empty() ) std::cerr << species.size() << " assemblies with species" << std::endl;

		ScoreTable scores;
		for( vector< string >::const_iterator it = screen_filenames.begin(); it != screen_filenames.end(); ++it ) {
			if( ! scores.load( *it ) ) warnDegradedMode( "cannot read screen table " + *it, logsink );
		}

		const CandidateLimiter limiter( max_candidates, dedupe, &species );
		std::vector< std::string > final_list;
		LimitAudit audit;
		limiter.limit( selected, scores, final_list, audit );
		std::cerr << audit << std::endl;
		logsink << audit << std::endl;

		writeIdentifiers( output_filename, final_list );
		return EXIT_SUCCESS;

	} catch( Exception& e ) {
		cerr << "An unrecoverable error occurred: " << e.what() << endl;
		cerr << endl << "Here is some debugging information to locate the problem:" << endl << boost::diagnostic_information( e ) << endl;
		return EXIT_FAILURE;
	}
}
