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

#ifndef ncbidata_hh_
#define ncbidata_hh_

#include "taxontree.hh"
#include "constants.hh"
#include <map>
#include <string>
#include <vector>



struct TaxonRecord {
	TaxonID parent_taxid;
	std::string rank;
	std::string name;
};

typedef std::map< TaxonID, TaxonRecord > TaxonRecordMap;



// builds and finalizes the tree; throws DataIntegrityError for orphans, several roots and cycles
Taxonomy* buildTaxonomy( const TaxonRecordMap& records, const std::vector< std::string >& ranked_levels = default_ranks );



// tab-separated with header, needs the columns TaxID, Name, Rank and ParentTaxID
Taxonomy* parseHierarchyFile( const std::string& filename, const std::vector< std::string >& ranked_levels = default_ranks );



Taxonomy* parseNCBIFlatFiles( const std::string& nodes_filename, const std::string& names_filename, const std::vector< std::string >& ranked_levels = default_ranks );



// NCBI dump directory from the environment, NULL if the variable is not set
Taxonomy* loadTaxonomyFromEnvironment( const std::vector< std::string >& ranked_levels = default_ranks );



// hierarchy file if given, else the environment
Taxonomy* loadTaxonomy( const std::string& hierarchy_filename, const std::vector< std::string >& ranked_levels = default_ranks );

#endif // ncbidata_hh_
