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

#ifndef constants_hh_
#define constants_hh_

#include <string>
#include <vector>

const char endline = '\n';
const char tab = '\t';
const std::string tab_as_str = {tab};
const std::string default_field_separator = tab_as_str;
const std::vector< std::string > default_ranks = { "superkingdom", "phylum", "class", "order", "family", "genus", "species" };
const char default_comment_symbol = '#';
const std::string empty_string;
const std::string ENVVAR_TAXONOMY_NCBI = "HYMET_TAXONOMY_NCBI";

// classification output
const std::string lineage_separator = ";";
const char rank_name_separator = ':';
const std::string unclassified_label = "unclassified";
const std::string classification_header = "Query\tLineage\tTaxonomic Level\tConfidence";

// taxonomy map columns
const std::string identifier_list_separator = ";";
const char version_separator = '.';

// PAF mapping quality "not available"
const unsigned int mapq_unavailable = 255;

// candidate selection defaults
const double default_initial_threshold = 0.90;
const double default_min_threshold = 0.70;
const double default_threshold_step = 0.02;
const double default_fallback_threshold = 0.71;
const double candidates_per_input_sequence = 3.25;
const unsigned int min_candidates_floor = 5;
const unsigned int default_max_candidates = 5000;

// consensus defaults
const float default_consensus_margin = 0.10;
const float default_identity_exponent = 1.0;
const float default_coverage_exponent = 1.0;
const float default_mapq_weight = 0.2;
const unsigned int default_mapq_cap = 60;

// reference cache layout
namespace cachefiles {
	const std::string fasta = "reference.fasta";
	const std::string taxonomy = "taxonomy.tsv";
	const std::string index = "reference.mmi";
	const std::string candidates = "candidates.txt";
	const std::string ready = "READY";
	const std::string lock_suffix = ".lock";
	const std::string building_infix = ".building.";
	const std::string version_infix = ".v.";
	const std::string link_infix = ".link.";
}

const std::string program_version = "1.0.0";
const std::string citation_note = u8R"(
HYMET: hybrid metagenomic classification by Mash screening, minimap2 alignment
and weighted lowest common ancestor consensus.
Alignment-based taxon assignment follows taxator-tk:
J. Dröge, I. Gregor, and A. C. McHardy
Taxator-tk: precise taxonomic assignment of metagenomes by fast approximation of evolutionary neighborhoods
Bioinformatics 2015 31: 817-824.
)";

#endif //constants_hh_
