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

#ifndef profileaggregator_hh_
#define profileaggregator_hh_

#include <map>
#include <ostream>
#include <string>
#include <vector>
#include "types.hh"
#include "classificationrecord.hh"
#include "taxonomyinterface.hh"



struct ProfileEntry {
	TaxonID taxid;
	std::string rank;
	std::string taxpath;
	std::string taxpathsn;
	double percentage;
};



// rank-wise relative abundance over all queries; unresolved queries count towards the total
class ProfileAggregator {
	public:
		explicit ProfileAggregator( const Taxonomy* tax, bool renormalize = false );

		void add( const ClassificationRecord& rec ) { add( rec.getNode() ); }

		// NULL for an unresolved query
		void add( const TaxonNode* node );

		large_unsigned_int total() const { return total_; }

		// ordered by rank, then by decreasing percentage and increasing taxid
		void getEntries( std::vector< ProfileEntry >& entries ) const;

		void write( std::ostream& strm, const std::string& sampleid ) const;

	private:
		const TaxonomyInterface taxinter_;
		const bool renormalize_;
		large_unsigned_int total_;
		std::vector< std::map< const TaxonNode*, large_unsigned_int > > counts_; // per ranked level
		std::vector< large_unsigned_int > reached_; // per ranked level
};



void writeProfile( const std::string& filename, const ProfileAggregator& profile, const std::string& sampleid );



// "rank:name;rank:name" to the deepest resolvable ranked node, NULL if nothing resolves
const TaxonNode* resolveLineage( const std::string& lineage, const TaxonomyInterface& taxinter );

#endif // profileaggregator_hh_
