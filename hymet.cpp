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
#include <boost/filesystem/exception.hpp>
#include <iostream>
#include <fstream>
#include "src/cancellation.hh"
#include "src/constants.hh"
#include "src/exception.hh"
#include "src/pipeline.hh"

using namespace std;



void printReport( const Pipeline& pipeline, std::ostream& strm ) {
	const boost::ptr_vector< StageReport >& reports = pipeline.reports();
	for( boost::ptr_vector< StageReport >::const_iterator it = reports.begin(); it != reports.end(); ++it ) {
		strm << it->name << tab << it->outcome << tab << it->attempts << tab << it->watch.read() << " ms" << endline;
	}
}



int main( int argc, char** argv ) {

	PipelineSettings settings;
	string config_filename;

	namespace po = boost::program_options;
	po::options_description visible_options ( "Allowed options" );
	visible_options.add_options()
	( "help,h", "show help message" )
	( "citation", "show citation info" )
	( "advanced-options", "show advanced program options" )
	( "config", po::value< string >( &config_filename ), "read further options from this INI-style file, the command line takes precedence" )
	( "input,i", po::value< vector< string > >( &settings.inputs )->multitoken(), "query FASTA files" )
	( "outdir,o", po::value< string >( &settings.outdir ), "output directory" )
	( "sketch,s", po::value< vector< string > >( &settings.sketches )->multitoken(), "Mash sketch per reference database" )
	( "hierarchy,t", po::value< string >( &settings.hierarchy ), "taxonomy hierarchy TSV (TaxID, Name, Rank, ParentTaxID), else NCBI dump directory in " + ENVVAR_TAXONOMY_NCBI )
	( "cache-dir,c", po::value< string >( &settings.cache_dir ), "reference cache directory" )
	( "downloader,d", po::value< string >( &settings.downloader ), "command downloading the reference genomes of a candidate list" )
	( "assembly-summary,a", po::value< vector< string > >( &settings.assembly_summaries )->multitoken(), "NCBI assembly_summary files for species deduplication" )
	( "threads,p", po::value< uint >( &settings.threads )->default_value( 1 ), "threads for external tools and classification" )
	( "max-candidates,m", po::value< uint >( &settings.max_candidates )->default_value( default_max_candidates ), "keep at most this many candidate genomes" )
	( "sample-id", po::value< string >( &settings.sample_id )->default_value( "sample" ), "sample identifier in the CAMI profile" )
	( "force-refresh", po::value< bool >( &settings.force_refresh )->default_value( false ), "download the reference set even if it is cached" )
	( "logfile,l", po::value< string >( &settings.logfile )->default_value( "/dev/null" ), "specify name of file for logging (appending lines)" );

	po::options_description hidden_options( "Hidden options" );
	hidden_options.add_options()
	( "taxonomy-map,g", po::value< string >( &settings.taxonomy_map ), "taxonomy map used instead of the one of the cached reference set" )
	( "assembly-cache-dir", po::value< string >( &settings.assembly_cache_dir ), "directory of downloaded assemblies passed to the downloader" )
	( "mash", po::value< string >( &settings.mash )->default_value( "mash" ), "mash executable" )
	( "minimap2", po::value< string >( &settings.minimap2 )->default_value( "minimap2" ), "minimap2 executable" )
	( "screen-pvalue", po::value< string >( &settings.screen_pvalue )->default_value( "0.9" ), "maximum p-value reported by mash screen" )
	( "index-split", po::value< string >( &settings.index_split )->default_value( "2g" ), "minimap2 index batch size" )
	( "preset", po::value< string >( &settings.preset )->default_value( "asm10" ), "minimap2 alignment preset" )
	( "dedupe", po::value< bool >( &settings.dedupe )->default_value( true ), "keep only the best scoring candidate per species" )
	( "retries", po::value< uint >( &settings.retries )->default_value( 2 ), "additional attempts of a stage whose external tool failed" )
	( "renormalize", po::value< bool >( &settings.renormalize )->default_value( false ), "profile percentages relative to queries classified at each rank" )
	( "ranks,r", po::value< vector< string > >( &settings.ranks )->multitoken(), "set ranks of lineages and profile" )
	( "initial-threshold", po::value< double >( &settings.selector.initial_threshold )->default_value( default_initial_threshold ), "first identity threshold" )
	( "min-threshold", po::value< double >( &settings.selector.min_threshold )->default_value( default_min_threshold ), "lowest identity threshold tried" )
	( "step", po::value< double >( &settings.selector.step )->default_value( default_threshold_step ), "threshold decrement" )
	( "fallback-threshold", po::value< double >( &settings.selector.fallback_threshold )->default_value( default_fallback_threshold ), "threshold if no step selects enough genomes" )
	( "margin", po::value< float >( &settings.consensus.margin )->default_value( default_consensus_margin ), "hits within this fraction of the best score join the consensus" )
	( "identity-exponent", po::value< float >( &settings.consensus.identity_exponent )->default_value( default_identity_exponent ), "exponent of the identity in the hit score" )
	( "coverage-exponent", po::value< float >( &settings.consensus.coverage_exponent )->default_value( default_coverage_exponent ), "exponent of the query coverage in the hit score" )
	( "mapq-weight", po::value< float >( &settings.consensus.mapq_weight )->default_value( default_mapq_weight ), "influence of the mapping quality on the hit score" )
	( "mapq-cap", po::value< uint >( &settings.consensus.mapq_cap )->default_value( default_mapq_cap ), "mapping quality treated as certain" );

	po::options_description all_options;
	all_options.add( visible_options ).add( hidden_options );

	po::variables_map vm;
	try {
		po::store( po::command_line_parser( argc, argv ).options( all_options ).run(), vm );
		if( vm.count( "config" ) ) {
			const string filename = vm[ "config" ].as< string >();
			std::ifstream config( filename.c_str() );
			if( ! config ) {
				cerr << "Cannot read configuration file " << filename << endl;
				return EXIT_FAILURE;
			}
			po::store( po::parse_config_file( config, all_options ), vm );
		}
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

	std::ofstream logsink( settings.logfile.c_str(), std::ios_base::app );
	cancellation::installSignalHandlers();

	try {
		Pipeline pipeline( settings, logsink );
		try {
			pipeline.run();
		} catch( std::exception& ) {
			printReport( pipeline, cerr );
			throw;
		}
		printReport( pipeline, cerr );
		cout << pipeline.classificationFile().string() << endline << pipeline.profileFile().string() << endline;
		return EXIT_SUCCESS;

	} catch( CancellationError& ) {
		cerr << "Interrupted, stages completed so far are kept" << endl;
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
