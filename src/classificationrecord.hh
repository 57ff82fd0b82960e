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

#ifndef classificationrecord_hh_
#define classificationrecord_hh_

#include <algorithm>
#include <string>
#include <iostream>
#include "types.hh"
#include "constants.hh"
#include "taxontree.hh"
#include "taxonomyinterface.hh"



// the one result reported per query; node is NULL for unresolved queries
class ClassificationRecord {
public:
    ClassificationRecord() : ordinal_( 0 ), node_( NULL ), confidence_( 0. ), fallback_( false ) {}

    ClassificationRecord( QueryOrdinal ordinal, const std::string& query_identifier ) :
        query_identifier_( query_identifier ), ordinal_( ordinal ), node_( NULL ), confidence_( 0. ), fallback_( false ) {}

    void setUnclassified() {
        node_ = NULL;
        confidence_ = 0.;
        fallback_ = false;
    }

    // node must be ranked
    void setAssignment( const TaxonNode* node, float confidence, bool fallback = false ) {
        node_ = node;
        confidence_ = std::max( 0.f, std::min( 1.f, confidence ) );
        fallback_ = fallback;
    }

    const std::string& getQueryIdentifier() const { return query_identifier_; }
    QueryOrdinal getOrdinal() const { return ordinal_; }
    const TaxonNode* getNode() const { return node_; }
    float getConfidence() const { return confidence_; }
    bool isResolved() const { return node_; }
    bool isFallback() const { return fallback_; }

    void setQueryIdentifier( const std::string& id ) { query_identifier_ = id; }
    void setOrdinal( QueryOrdinal ordinal ) { ordinal_ = ordinal; }

    // "rank:name" pairs from the top level down to the assigned node
    std::string getLineage( const TaxonomyInterface& taxinter ) const;
    const std::string& getLevel() const;

    // Query, Lineage, Taxonomic Level, Confidence
    void print( std::ostream& strm, const TaxonomyInterface& taxinter ) const;

private:
    std::string query_identifier_;
    QueryOrdinal ordinal_;
    const TaxonNode* node_;
    float confidence_;
    bool fallback_;
};



inline bool operator<( const ClassificationRecord& a, const ClassificationRecord& b ) {
    return a.getOrdinal() < b.getOrdinal();
}



// header line of classified_sequences.tsv
inline std::ostream& writeClassificationHeader( std::ostream& strm ) {
    return strm << classification_header << endline;
}

#endif // classificationrecord_hh_
