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
#include <boost/scoped_ptr.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/filesystem/exception.hpp>
#include <iostream>
#include "src/bioboxes.hh"
#include "src/constants.hh"
#include "src/exception.hh"
#include "src/ncbidata.hh"
#include "src/profileaggregator.hh"

using namespace std;



int main( int argc, char** argv ) {

	vector< string > ranks;
	string input_filename, hierarchy_filename, output_filename, sample_id;
	bool renormalize;

	namespace po = boost::program_options;
	po::options_description visible_options ( "Allowed options" );
	visible_options.add_options()
	( "help,h", "show help message" )
	( "citation", "show citation info" )
	( "advanced-options", "show advanced program options" )
	( "input,i", po::value< string >( &input_filename ), "classification table" )
	( "hierarchy,t", po::value< string >( &hierarchy_filename ), "taxonomy hierarchy TSV (TaxID, Name, Rank, ParentTaxID), else NCBI dump directory in " + ENVVAR_TAXONOMY_NCBI )
	( "output,o", po::value< string >( &output_filename ), "CAMI profile" )
	( "sample-id,s", po::value< string >( &sample_id )->default_value( "sample" ), "sample identifier" );

	po::options_description hidden_options( "Hidden options" );
	hidden_options.add_options()
	( "ranks,r", po::value< vector< string > >( &ranks )->multitoken(), "set ranks of the profile" )
	( "renormalize", po::value< bool >( &renormalize )->default_value( false ), "percentages relative to queries classified at each rank" );

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

	if( ! vm.count( "ranks" ) ) ranks = default_ranks;

	if( input_filename.empty() || output_filename.empty() ) {
		cout << "Specify the classification table and the output file" << endl;
		cout << visible_options << endl;
		return EXIT_FAILURE;
	}

	try {
		boost::scoped_ptr< Taxonomy > tax( loadTaxonomy( hierarchy_filename, ranks ) );
		const TaxonomyInterface taxinter( tax.get() );
		ProfileAggregator aggregator( tax.get(), renormalize );

		large_unsigned_int unresolved = 0;
		ClassificationTableParser parser( input_filename );
		ClassificationRow row;
		while( parser.getNext( row ) ) {
			const TaxonNode* node = resolveLineage( row.lineage, taxinter );
			if( ! node ) ++unresolved;
			aggregator.add( node );
		}
		std::cerr << aggregator.total() << " queries, " << unresolved << " unclassified" << std::endl;

		writeProfile( output_filename, aggregator, sample_id );
		return EXIT_SUCCESS;

	} catch( Exception& e ) {
		cerr << "An unrecoverable error occurred: " << e.what() << endl;
		cerr << endl << "Here is some debugging information to locate the problem:" << endl << boost::diagnostic_information( e ) << endl;
		return EXIT_FAILURE;
	} catch( boost::filesystem::filesystem_error& e ) {
		cerr << "An unrecoverable error occurred: " << e.what() << endl;
		return EXIT_FAILURE;
	}
}
