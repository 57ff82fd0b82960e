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
#include <fstream>
#include "src/accessconv.hh"
#include "src/cancellation.hh"
#include "src/classificationpipeline.hh"
#include "src/constants.hh"
#include "src/exception.hh"
#include "src/identifierlist.hh"
#include "src/ncbidata.hh"
#include "src/profileaggregator.hh"
#include "src/profiling.hh"
#include "src/utils.hh"

using namespace std;



int main( int argc, char** argv ) {

	vector< string > ranks, query_filenames;
	string paf_filename, map_filename, hierarchy_filename, output_filename, profile_filename, log_filename, sample_id;
	uint number_threads;
	ConsensusParameters params;
	bool renormalize;

	namespace po = boost::program_options;
	po::options_description visible_options ( "Allowed options" );
	visible_options.add_options()
	( "help,h", "show help message" )
	( "citation", "show citation info" )
	( "advanced-options", "show advanced program options" )
	( "paf,a", po::value< string >( &paf_filename ), "minimap2 alignments in PAF format" )
	( "taxonomy,g", po::value< string >( &map_filename ), "reference taxonomy map (TSV with columns TaxID and Identifiers)" )
	( "hierarchy,t", po::value< string >( &hierarchy_filename ), "taxonomy hierarchy TSV (TaxID, Name, Rank, ParentTaxID), else NCBI dump directory in " + ENVVAR_TAXONOMY_NCBI )
	( "output,o", po::value< string >( &output_filename )->default_value( "classified_sequences.tsv" ), "classification table" )
	( "processes,p", po::value< uint >( &number_threads )->default_value( 1 ), "number of worker threads, set to 0 for all available cores" )
	( "profile", po::value< string >( &profile_filename ), "also write a CAMI profile to this file" )
	( "queries,q", po::value< vector< string > >( &query_filenames )->multitoken(), "query FASTA files, unaligned queries are reported as unclassified" )
	( "sample-id", po::value< string >( &sample_id )->default_value( "sample" ), "sample identifier in the CAMI profile" )
	( "logfile,l", po::value< string >( &log_filename )->default_value( "/dev/null" ), "specify name of file for logging (appending lines)" );

	po::options_description hidden_options( "Hidden options" );
	hidden_options.add_options()
	( "ranks,r", po::value< vector< string > >( &ranks )->multitoken(), "set node ranks of the lineage" )
	( "margin,m", po::value< float >( &params.margin )->default_value( default_consensus_margin ), "hits within this fraction of the best score join the consensus" )
	( "identity-exponent", po::value< float >( &params.identity_exponent )->default_value( default_identity_exponent ), "exponent of the identity in the hit score" )
	( "coverage-exponent", po::value< float >( &params.coverage_exponent )->default_value( default_coverage_exponent ), "exponent of the query coverage in the hit score" )
	( "mapq-weight", po::value< float >( &params.mapq_weight )->default_value( default_mapq_weight ), "influence of the mapping quality on the hit score" )
	( "mapq-cap", po::value< uint >( &params.mapq_cap )->default_value( default_mapq_cap ), "mapping quality treated as certain" )
	( "renormalize", po::value< bool >( &renormalize )->default_value( false ), "profile percentages relative to queries classified at each rank" );

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

	if( ! vm.count( "paf" ) ) {
		cout << "Specify the alignment file in PAF format" << endl;
		cout << visible_options << endl;
		return EXIT_FAILURE;
	}

	std::ofstream logsink( log_filename.c_str(), std::ios_base::app );
	cancellation::installSignalHandlers();

	try {
		params.validate();

		std::cerr << "loading taxonomy...";
		boost::scoped_ptr< Taxonomy > tax( loadTaxonomy( hierarchy_filename, ranks ) );
		std::cerr << " done (" << tax->indexSize() << " nodes)" << std::endl;

		// without a usable map only the first hit per query can be reported
		boost::scoped_ptr< StrIDConverter > seqid2taxid;
		if( map_filename.empty() ) warnDegradedMode( "no taxonomy map given", logsink );
		else {
			try {
				seqid2taxid.reset( loadStrIDConverterFromFile( map_filename ) );
			} catch( FileNotFound& ) {
				warnDegradedMode( "cannot read taxonomy map " + map_filename, logsink );
			} catch( ParsingError& e ) {
				warnDegradedMode( "cannot parse taxonomy map " + map_filename + ": " + boost::diagnostic_information( e ), logsink );
			}
		}

		std::vector< std::string > query_ids;
		for( vector< string >::const_iterator it = query_filenames.begin(); it != query_filenames.end(); ++it ) readIdentifiers( *it, query_ids );

		StopWatch watch( "classification" );
		watch.start();
		ClassificationPipeline classifier( tax.get(), seqid2taxid.get(), params, number_threads, logsink );
		std::vector< ClassificationRecord > results;
		classifier.run( paf_filename, query_ids, results );
		watch.stop();
		std::cerr << classifier.stats() << " (" << classifier.threads() << " threads, " << watch.read() << " ms)" << std::endl;

		if( profile_filename.empty() ) writeClassification( output_filename, results, tax.get() );
		else {
			ProfileAggregator aggregator( tax.get(), renormalize );
			for( std::vector< ClassificationRecord >::const_iterator it = results.begin(); it != results.end(); ++it ) aggregator.add( *it );
			writeClassificationAndProfile( output_filename, results, tax.get(), profile_filename, aggregator, sample_id );
		}
		return EXIT_SUCCESS;

	} catch( CancellationError& ) {
		cerr << "Interrupted, no output written" << endl;
		return EXIT_FAILURE;
	} catch( Exception& e ) {
		cerr << "An unrecoverable error occurred: " << e.what() << endl;
		cerr << endl << "Here is some debugging information to locate the problem:" << endl << boost::diagnostic_information( e ) << endl;
		return EXIT_FAILURE;
	} catch( boost::filesystem::filesystem_error& e ) {
		cerr << "An unrecoverable error occurred: " << e.what() << endl;
		return EXIT_FAILURE;
	}
}
