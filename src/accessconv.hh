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

#ifndef accessconv_hh_
#define accessconv_hh_

#include <string>
#include <map>
#include <vector>
#include <iostream>
#include <fstream>
#include <boost/lexical_cast.hpp>
#include <boost/filesystem.hpp>
#include "constants.hh"
#include "types.hh"
#include "utils.hh"
#include "exception.hh"



// converts from access identifier to taxonomic id, immutable after construction
template< typename TypeT >
class AccessIDConverter {
public:
    virtual ~AccessIDConverter() {};
    virtual bool find( const TypeT& acc, TaxonID& taxid ) const = 0;
    virtual std::size_t size() const = 0;

    TaxonID operator[]( const TypeT& acc ) const {
        TaxonID taxid;
        if( ! find( acc, taxid ) ) BOOST_THROW_EXCEPTION( TaxonMappingNotFound{} << seqid_info{ acc } );
        return taxid;
    }
};



// reads the reference taxonomy table (header with TaxID and Identifiers, identifiers separated
// by semicolons, the first column names the assembly and is an identifier as well) or a plain
// two-column file mapping identifier to taxid
template< typename TypeT >
class AccessIDConverterFlatfileMemory : public AccessIDConverter< TypeT > {
public:
    AccessIDConverterFlatfileMemory( const std::string& flatfile_filename ) : filename_( flatfile_filename ) {
        parse( flatfile_filename );
    }

    // exact identifier first, then without version suffix
    bool find( const TypeT& acc, TaxonID& taxid ) const {
        typename std::map< TypeT, TaxonID >::const_iterator it = accessidconv.find( acc );
        if( it == accessidconv.end() ) {
            it = accessidconv.find( stripVersion( acc ) );
            if( it == accessidconv.end() ) return false;
        }
        taxid = it->second;
        return true;
    }

    std::size_t size() const { return accessidconv.size(); }

private:
    void add( const std::string& id, TaxonID taxid ) {
        const std::string cleaned = trimmed( id );
        if( cleaned.empty() ) return;
        accessidconv.insert( std::make_pair( boost::lexical_cast< TypeT >( cleaned ), taxid ) ); //first mapping wins
        const std::string unversioned = stripVersion( cleaned );
        if( unversioned != cleaned ) accessidconv.insert( std::make_pair( boost::lexical_cast< TypeT >( unversioned ), taxid ) );
    }

    void parse( const std::string& flatfile_filename ) {
        std::vector< std::string > fields;
        std::string line;
        std::ifstream flatfile( flatfile_filename.c_str() );
        if( ! flatfile ) BOOST_THROW_EXCEPTION( FileNotFound{} << file_info{ flatfile_filename } );

        // header detection
        std::size_t taxid_col = 1;
        std::size_t ids_col = 0;
        bool table = false;
        uint linenum = 0;
        while( std::getline( flatfile, line ) ) {
            ++linenum;
            if( ignoreLine( line ) ) continue;
            fields.clear();
            tokenizeSingleCharDelim( line, fields, default_field_separator );
            for( std::size_t i = 0; i < fields.size(); ++i ) {
                const std::string name = trimmed( fields[i] );
                if( name == "TaxID" ) { taxid_col = i; table = true; }
                else if( name == "Identifiers" ) ids_col = i;
            }
            if( ! table ) parseLine( fields, taxid_col, ids_col, false, linenum );
            break;
        }

        while( std::getline( flatfile, line ) ) {
            ++linenum;
            if( ignoreLine( line ) ) continue;
            fields.clear();
            tokenizeSingleCharDelim( line, fields, default_field_separator );
            parseLine( fields, taxid_col, ids_col, table, linenum );
        }
    };

    void parseLine( const std::vector< std::string >& fields, std::size_t taxid_col, std::size_t ids_col, bool table, uint linenum ) {
        if( fields.size() <= std::max( taxid_col, ids_col ) ) {
            BOOST_THROW_EXCEPTION( ParsingError{} << file_info{ filename_ } << line_info{ linenum } );
        }
        TaxonID taxid;
        try {
            taxid = boost::lexical_cast< TaxonID >( trimmed( fields[ taxid_col ] ) );
        } catch( boost::bad_lexical_cast& ) {
            BOOST_THROW_EXCEPTION( ParsingError{} << file_info{ filename_ } << line_info{ linenum } << general_info{ "bad taxonomic ID" } );
        }

        if( ! table ) {
            add( fields[0], taxid );
            return;
        }
        if( taxid_col != 0 ) add( fields[0], taxid );
        std::vector< std::string > ids;
        tokenizeSingleCharDelim( fields[ ids_col ], ids, identifier_list_separator, 0, true );
        for( std::vector< std::string >::const_iterator it = ids.begin(); it != ids.end(); ++it ) add( *it, taxid );
    }

    typename std::map< TypeT, TaxonID > accessidconv;
    const std::string filename_;
};



template< typename TypeT >
AccessIDConverter< TypeT >* loadAccessIDConverterFromFile( const std::string& filename ) {
    if( ! boost::filesystem::exists( filename ) ) BOOST_THROW_EXCEPTION( FileNotFound{} << file_info{ filename } );
    return new AccessIDConverterFlatfileMemory< TypeT >( filename );
}



// converts general string sequence identifier to taxonomic id
typedef AccessIDConverter< std::string > StrIDConverter;
typedef AccessIDConverterFlatfileMemory< std::string > StrIDConverterFlatfileMemory;



inline StrIDConverter* loadStrIDConverterFromFile( const std::string& filename ) {
    return loadAccessIDConverterFromFile< std::string >( filename );
}

#endif // accessconv_hh_
