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
#include "src/candidateselector.hh"
#include "src/constants.hh"
#include "src/exception.hh"
#include "src/identifierlist.hh"
#include "src/utils.hh"

using namespace std;



int main( int argc, char** argv ) {

	vector< string > screen_filenames, query_filenames;
	string output_filename, log_filename;
	large_unsigned_int num_sequences;
	SelectorParameters params;

	namespace po = boost::program_options;
	po::options_description visible_options ( "Allowed options" );
	visible_options.add_options()
	( "help,h", "show help message" )
	( "citation", "show citation info" )
	( "advanced-options", "show advanced program options" )
	( "screen,s", po::value< vector< string > >( &screen_filenames )->multitoken(), "mash screen output, one table per reference database" )
	( "queries,q", po::value< vector< string > >( &query_filenames )->multitoken(), "query FASTA files, their record count sets the number of required candidates" )
	( "num-sequences,n", po::value< large_unsigned_int >( &num_sequences ), "number of query sequences instead of counting them" )
	( "output,o", po::value< string >( &output_filename )->default_value( "selected_genomes.txt" ), "selected genome identifiers, one per line" )
	( "logfile,l", po::value< string >( &log_filename )->default_value( "/dev/null" ), "specify name of file for logging (appending lines)" );

	po::options_description hidden_options( "Hidden options" );
	hidden_options.add_options()
	( "initial-threshold", po::value< double >( &params.initial_threshold )->default_value( default_initial_threshold ), "first identity threshold" )
	( "min-threshold", po::value< double >( &params.min_threshold )->default_value( default_min_threshold ), "lowest identity threshold tried" )
	( "step", po::value< double >( &params.step )->default_value( default_threshold_step ), "threshold decrement" )
	( "fallback-threshold", po::value< double >( &params.fallback_threshold )->default_value( default_fallback_threshold ), "threshold if no step selects enough genomes" )
	( "per-sequence", po::value< double >( &params.per_input_sequence )->default_value( candidates_per_input_sequence ), "required candidates per query sequence" )
	( "min-candidates", po::value< unsigned int >( &params.min_candidates )->default_value( min_candidates_floor ), "required candidates at least" );

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

	if( screen_filenames.empty() ) {
		cout << "Specify at least one screen table" << endl;
		cout << visible_options << endl;
		return EXIT_FAILURE;
	}

	if( ! vm.count( "num-sequences" ) && query_filenames.empty() ) {
		cout << "Specify the query sequences or their number" << endl;
		cout << visible_options << endl;
		return EXIT_FAILURE;
	}

	std::ofstream logsink( log_filename.c_str(), std::ios_base::app );

	try {
		params.validate();

		if( ! vm.count( "num-sequences" ) ) {
			num_sequences = 0;
			for( vector< string >::const_iterator it = query_filenames.begin(); it != query_filenames.end(); ++it ) num_sequences += countFastaRecords( *it );
		}
		const unsigned int required = params.requiredCandidates( num_sequences );
		std::cerr << num_sequences << " query sequences, " << required << " candidates required" << std::endl;

		std::vector< std::vector< ScreenHit > > tables( screen_filenames.size() );
		for( std::size_t i = 0; i < screen_filenames.size(); ++i ) {
			const large_unsigned_int skipped = parseScreenFile( screen_filenames[i], tables[i] );
			if( skipped ) logsink << screen_filenames[i] << ": skipped " << skipped << " malformed rows" << std::endl;
		}

		const CandidateSelector selector( params, logsink );
		std::vector< SelectionResult > per_table;
		const std::vector< std::string > selected = selector.selectAll( tables, required, &per_table );
		for( std::size_t i = 0; i < per_table.size(); ++i ) {
			std::cerr << screen_filenames[i] << ": " << per_table[i].genomes.size() << " genomes at threshold " << formatFixed( per_table[i].threshold, 2 ) << " after " << per_table[i].iterations << " iterations" << ( per_table[i].degraded ? " (fallback)" : "" ) << std::endl;
		}
		std::cerr << selected.size() << " genomes selected" << std::endl;

		writeIdentifiers( output_filename, selected );
		return EXIT_SUCCESS;

	} catch( Exception& e ) {
		cerr << "An unrecoverable error occurred: " << e.what() << endl;
		cerr << endl << "Here is some debugging information to locate the problem:" << endl << boost::diagnostic_information( e ) << endl;
		return EXIT_FAILURE;
	}
}
