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

#ifndef lineageconsensus_hh_
#define lineageconsensus_hh_

#include <map>
#include <ostream>
#include <string>
#include <vector>
#include "types.hh"
#include "constants.hh"
#include "alignmentrecord.hh"
#include "classificationrecord.hh"
#include "taxonomyinterface.hh"



struct ConsensusParameters {
    ConsensusParameters() :
        margin( default_consensus_margin ),
        identity_exponent( default_identity_exponent ),
        coverage_exponent( default_coverage_exponent ),
        mapq_weight( default_mapq_weight ),
        mapq_cap( default_mapq_cap ) {}

    // throws ConfigurationError
    void validate() const;

    float margin;
    float identity_exponent;
    float coverage_exponent;
    float mapq_weight;
    unsigned int mapq_cap;
};



// identity^a * coverage^b * mapping quality factor, in [0,1]
double scoreAlignment( const AlignmentRecord& rec, const ConsensusParameters& params );



struct TaxonHit {
    TaxonHit( const TaxonNode* n, double s, const std::string& t ) : node( n ), score( s ), target( t ) {}
    const TaxonNode* node;
    double score;
    std::string target;
};



// higher score first, then smaller target identifier
inline bool betterHit( const TaxonHit& a, const TaxonHit& b ) {
    if( a.score != b.score ) return a.score > b.score;
    return a.target < b.target;
}



// collected hits of one query, only the best hit per taxon is kept
class QueryHits {
public:
    typedef std::map< TaxonID, TaxonHit > container_type;

    QueryHits() : records_( 0 ) {}

    void add( const TaxonNode* node, double score, const std::string& target );
    void countRecord() { ++records_; }

    bool empty() const { return hits_.empty(); }
    std::size_t size() const { return hits_.size(); }
    large_unsigned_int numRecords() const { return records_; }
    const container_type& hits() const { return hits_; }

    // best first
    std::vector< TaxonHit > ranked() const;

private:
    container_type hits_;
    large_unsigned_int records_;
};



// resolves the collected hits of a query into one lineage with confidence
class LineageConsensus {
public:
    LineageConsensus( const Taxonomy* tax, const ConsensusParameters& params ) : taxinter_( tax ), params_( params ) {}

    void resolve( const QueryHits& hits, ClassificationRecord& rec, std::ostream& logsink ) const;

    const ConsensusParameters& parameters() const { return params_; }

private:
    const TaxonomyInterface taxinter_;
    const ConsensusParameters params_;
};

#endif // lineageconsensus_hh_
