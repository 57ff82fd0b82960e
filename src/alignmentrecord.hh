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

#ifndef alignmentrecord_hh_
#define alignmentrecord_hh_

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>
#include <boost/lexical_cast.hpp>
#include "constants.hh"
#include "types.hh"
#include "utils.hh"
#include "exception.hh"



// one line of PAF as written by minimap2, optional SAM-like tags are ignored
class AlignmentRecord {
public:
    AlignmentRecord() : query_length_( 0 ), query_start_( 0 ), query_stop_( 0 ), strand_( '+' ),
                        reference_length_( 0 ), reference_start_( 0 ), reference_stop_( 0 ),
                        matches_( 0 ), alignment_length_( 0 ), mapq_( mapq_unavailable ) {}

    inline const std::string& getQueryIdentifier() const {
        return query_identifier_;
    };
    inline large_unsigned_int getQueryLength() const {
        return query_length_;
    };
    inline large_unsigned_int getQueryStart() const {
        return query_start_;
    };
    inline large_unsigned_int getQueryStop() const {
        return query_stop_;
    };
    inline char getStrand() const {
        return strand_;
    };
    inline const std::string& getReferenceIdentifier() const {
        return reference_identifier_;
    };
    inline large_unsigned_int getReferenceLength() const {
        return reference_length_;
    };
    inline large_unsigned_int getReferenceStart() const {
        return reference_start_;
    };
    inline large_unsigned_int getReferenceStop() const {
        return reference_stop_;
    };
    inline large_unsigned_int getMatches() const {
        return matches_;
    };
    inline large_unsigned_int getAlignmentLength() const {
        return alignment_length_;
    };
    inline unsigned int getMappingQuality() const {
        return mapq_;
    };
    inline bool hasMappingQuality() const {
        return mapq_ != mapq_unavailable;
    };

    // fraction of matching bases in the alignment block
    inline double getIdentity() const {
        return matches_/double( alignment_length_ );
    };

    // alignment block relative to the query, at most one
    inline double getCoverage() const {
        return std::min( 1., alignment_length_/double( query_length_ ) );
    };

    void parse( const std::string& line ) {
        std::vector< std::string > fields;
        tokenizeSingleCharDelim( line, fields, default_field_separator, 13, false );
        parse( fields );
    }

    void parse( const std::vector< std::string >& fields ) {
        if ( fields.size() < 11 ) BOOST_THROW_EXCEPTION( ParsingError {} << general_info {"bad number of fields in alignment line"} );

        try {
            query_length_ = boost::lexical_cast< large_unsigned_int >( fields[1] );
            query_start_ = boost::lexical_cast< large_unsigned_int >( fields[2] );
            query_stop_ = boost::lexical_cast< large_unsigned_int >( fields[3] );
            reference_length_ = boost::lexical_cast< large_unsigned_int >( fields[6] );
            reference_start_ = boost::lexical_cast< large_unsigned_int >( fields[7] );
            reference_stop_ = boost::lexical_cast< large_unsigned_int >( fields[8] );
        } catch( boost::bad_lexical_cast& ) {
            BOOST_THROW_EXCEPTION( ParsingError {} << general_info {"bad position number or sequence length"} );
        }

        if( query_start_ > query_stop_ ) BOOST_THROW_EXCEPTION( ParsingError {} << general_info {"reverse query positions not allowed"} );
        if( query_length_ == 0 ) BOOST_THROW_EXCEPTION( ParsingError {} << general_info {"zero query length"} );

        try {
            matches_ = boost::lexical_cast< large_unsigned_int >( fields[9] );
            alignment_length_ = boost::lexical_cast< large_unsigned_int >( fields[10] );
        } catch( boost::bad_lexical_cast& ) {
            BOOST_THROW_EXCEPTION( ParsingError {} << general_info {"bad match count or alignment block length"} );
        }

        if( alignment_length_ == 0 || matches_ > alignment_length_ ) BOOST_THROW_EXCEPTION( ParsingError {} << general_info {"bad alignment block length"} );

        mapq_ = mapq_unavailable;
        if( fields.size() >= 12 ) {
            const std::string mapq_field = fields[11].substr( 0, fields[11].find( tab ) );
            try {
                mapq_ = boost::lexical_cast< unsigned int >( mapq_field );
            } catch( boost::bad_lexical_cast& ) {
                BOOST_THROW_EXCEPTION( ParsingError {} << general_info {"bad mapping quality"} );
            }
        }

        if( fields[4].size() != 1 || ( fields[4][0] != '+' && fields[4][0] != '-' ) ) BOOST_THROW_EXCEPTION( ParsingError {} << general_info {"bad strand"} );
        strand_ = fields[4][0];

        // easy things that cannot go wrong
        query_identifier_ = fields[0];
        reference_identifier_ = fields[5];
        if( query_identifier_.empty() || reference_identifier_.empty() ) BOOST_THROW_EXCEPTION( ParsingError {} << general_info {"empty sequence identifier"} );
    }

    void print( std::ostream& strm = std::cout ) const {
        strm << query_identifier_ << default_field_separator
             << query_length_ << default_field_separator
             << query_start_ << default_field_separator
             << query_stop_ << default_field_separator
             << strand_ << default_field_separator
             << reference_identifier_ << default_field_separator
             << reference_length_ << default_field_separator
             << reference_start_ << default_field_separator
             << reference_stop_ << default_field_separator
             << matches_ << default_field_separator
             << alignment_length_ << default_field_separator
             << mapq_ << endline;
    }

private:
    std::string query_identifier_;
    large_unsigned_int query_length_;
    large_unsigned_int query_start_;
    large_unsigned_int query_stop_;
    char strand_;
    std::string reference_identifier_;
    large_unsigned_int reference_length_;
    large_unsigned_int reference_start_;
    large_unsigned_int reference_stop_;
    large_unsigned_int matches_;
    large_unsigned_int alignment_length_;
    unsigned int mapq_;
};



//overload ostream operator for class AlignmentRecord ->print()
std::ostream& operator<<( std::ostream& strm, const AlignmentRecord& rec );



class AlignmentRecordFactory {
public:
    typedef AlignmentRecord value_type;

    AlignmentRecordFactory() {}

    AlignmentRecord* create( const std::string& line ) {
        AlignmentRecord* rec = new AlignmentRecord;
        try {
            rec->parse( line );
        } catch ( Exception &e ) {  // prevent memory leak
            destroy( rec );
            throw;
        }
        return rec;
    }

    inline void destroy( const AlignmentRecord* rec ) { delete rec; }
};

#endif // alignmentrecord_hh_
