#include "ncbidata.hh"
#include "exception.hh"
#include "utils.hh"
#include <boost/filesystem/operations.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/scoped_ptr.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stack>



Taxonomy* buildTaxonomy( const TaxonRecordMap& records, const std::vector< std::string >& ranked_levels ) {
	typedef std::multimap< TaxonID, TaxonID > ChildMap;
	ChildMap children;
	std::vector< TaxonID > roots;

	for( TaxonRecordMap::const_iterator it = records.begin(); it != records.end(); ++it ) {
		const TaxonID taxid = it->first;
		const TaxonID parent_taxid = it->second.parent_taxid;
		if( parent_taxid == taxid || parent_taxid == 0 ) {
			roots.push_back( taxid );
			continue;
		}
		if( ! records.count( parent_taxid ) ) {
			BOOST_THROW_EXCEPTION( DataIntegrityError() << taxid_info( taxid ) << general_info( "parent " + boost::lexical_cast< std::string >( parent_taxid ) + " is missing" ) );
		}
		children.insert( std::make_pair( parent_taxid, taxid ) );
	}

	if( roots.empty() ) {
		BOOST_THROW_EXCEPTION( DataIntegrityError() << general_info( "no root node" ) );
	}
	if( roots.size() > 1 ) {
		BOOST_THROW_EXCEPTION( DataIntegrityError() << taxid_info( roots[1] ) << general_info( "more than one root node" ) );
	}

	boost::scoped_ptr< Taxonomy > tax( new Taxonomy( ranked_levels ) );

	const TaxonID root_taxid = roots.front();
	const TaxonRecord& root_record = records.find( root_taxid )->second;
	Taxonomy::iterator root_it = tax->set_head( new Taxon( root_taxid, tax->insertRankInternal( root_record.rank ), root_record.name, tax->getRankIndex( root_record.rank ) ) );
	tax->addToIndex( root_taxid, root_it.node );

	// depth-first construction
	std::stack< std::pair< Taxonomy::iterator, TaxonID > > pending;
	pending.push( std::make_pair( root_it, root_taxid ) );
	std::size_t inserted = 1;
	while( ! pending.empty() ) {
		Taxonomy::iterator node_it = pending.top().first;
		const TaxonID node_taxid = pending.top().second;
		pending.pop();

		std::pair< ChildMap::const_iterator, ChildMap::const_iterator > range = children.equal_range( node_taxid );
		for( ChildMap::const_iterator child_it = range.first; child_it != range.second; ++child_it ) {
			const TaxonID child_taxid = child_it->second;
			const TaxonRecord& record = records.find( child_taxid )->second;
			Taxonomy::iterator child_node_it = tax->append_child( node_it, new Taxon( child_taxid, tax->insertRankInternal( record.rank ), record.name, tax->getRankIndex( record.rank ) ) );
			tax->addToIndex( child_taxid, child_node_it.node );
			pending.push( std::make_pair( child_node_it, child_taxid ) );
			++inserted;
		}
	}

	// every node has a known parent, so whatever is not reachable from the root sits on a cycle
	if( inserted != records.size() ) {
		for( TaxonRecordMap::const_iterator it = records.begin(); it != records.end(); ++it ) {
			if( ! tax->contains( it->first ) ) {
				BOOST_THROW_EXCEPTION( DataIntegrityError() << taxid_info( it->first ) << general_info( "node is part of a cycle" ) );
			}
		}
	}

	tax->finalize();
	return tax.release();
}



namespace {

std::size_t findColumn( const std::vector< std::string >& header, const std::string& name, const std::string& filename ) {
	for( std::size_t i = 0; i < header.size(); ++i ) {
		if( trimmed( header[i] ) == name ) return i;
	}
	BOOST_THROW_EXCEPTION( ParsingError() << file_info( filename ) << line_info( 1 ) << general_info( "missing column " + name ) );
}

}



Taxonomy* parseHierarchyFile( const std::string& filename, const std::vector< std::string >& ranked_levels ) {
	std::ifstream handle( filename.c_str() );
	if( ! handle ) {
		BOOST_THROW_EXCEPTION( FileNotFound() << file_info( filename ) );
	}

	std::string line;
	std::vector< std::string > fields;
	if( ! std::getline( handle, line ) ) {
		BOOST_THROW_EXCEPTION( ParsingError() << file_info( filename ) << general_info( "empty hierarchy file" ) );
	}
	tokenizeSingleCharDelim( line, fields, default_field_separator );
	const std::size_t taxid_col = findColumn( fields, "TaxID", filename );
	const std::size_t name_col = findColumn( fields, "Name", filename );
	const std::size_t rank_col = findColumn( fields, "Rank", filename );
	const std::size_t parent_col = findColumn( fields, "ParentTaxID", filename );
	const std::size_t min_fields = std::max( std::max( taxid_col, name_col ), std::max( rank_col, parent_col ) ) + 1;

	TaxonRecordMap records;
	uint linenum = 1;
	while( std::getline( handle, line ) ) {
		++linenum;
		if( ignoreLine( line ) ) continue;
		fields.clear();
		tokenizeSingleCharDelim( line, fields, default_field_separator );
		if( fields.size() < min_fields ) {
			BOOST_THROW_EXCEPTION( ParsingError() << file_info( filename ) << line_info( linenum ) );
		}
		try {
			const TaxonID taxid = boost::lexical_cast< TaxonID >( trimmed( fields[ taxid_col ] ) );
			TaxonRecord& record = records[ taxid ];
			record.parent_taxid = boost::lexical_cast< TaxonID >( trimmed( fields[ parent_col ] ) );
			record.rank = trimmed( fields[ rank_col ] );
			record.name = trimmed( fields[ name_col ] );
		} catch( boost::bad_lexical_cast& ) {
			BOOST_THROW_EXCEPTION( ParsingError() << file_info( filename ) << line_info( linenum ) );
		}
	}

	return buildTaxonomy( records, ranked_levels );
}



Taxonomy* parseNCBIFlatFiles( const std::string& nodes_filename, const std::string& names_filename, const std::vector< std::string >& ranked_levels ) {
	TaxonRecordMap records;
	std::string line;

	{ // process nodes.dmp
		std::ifstream nodesfile( nodes_filename.c_str() );
		if( ! nodesfile ) {
			BOOST_THROW_EXCEPTION( FileNotFound() << file_info( nodes_filename ) );
		}
		std::vector< std::string > fields;
		uint linenum = 0;
		while( std::getline( nodesfile, line ) ) {
			++linenum;
			fields.clear();
			tokenizeMultiCharDelim( line, fields, "\t|\t", 4 );
			if( fields.size() < 3 ) {
				BOOST_THROW_EXCEPTION( ParsingError() << file_info( nodes_filename ) << line_info( linenum ) );
			}
			try {
				const TaxonID taxid = boost::lexical_cast< TaxonID >( fields[0] );
				TaxonRecord& record = records[ taxid ];
				record.parent_taxid = boost::lexical_cast< TaxonID >( fields[1] );
				record.rank = fields[2];
			} catch( boost::bad_lexical_cast& ) {
				BOOST_THROW_EXCEPTION( ParsingError() << file_info( nodes_filename ) << line_info( linenum ) );
			}
		}
	}

	{ // process names.dmp
		std::ifstream namesfile( names_filename.c_str() );
		if( ! namesfile ) {
			BOOST_THROW_EXCEPTION( FileNotFound() << file_info( names_filename ) );
		}
		std::vector< std::string > fields;
		while( std::getline( namesfile, line ) ) {
			fields.clear();
			tokenizeMultiCharDelim( line, fields, "\t|\t", 4 );
			if( fields.size() == 4 && fields[3].compare( 0, 15, "scientific name" ) == 0 ) { //NCBI row separator is still attached
				try {
					TaxonRecordMap::iterator it = records.find( boost::lexical_cast< TaxonID >( fields[0] ) );
					if( it != records.end() ) it->second.name = fields[1];
				} catch( boost::bad_lexical_cast& ) {
					BOOST_THROW_EXCEPTION( ParsingError() << file_info( names_filename ) << general_info( line ) );
				}
			}
		}
	}

	return buildTaxonomy( records, ranked_levels );
}



Taxonomy* loadTaxonomyFromEnvironment( const std::vector< std::string >& ranked_levels ) {
	const char* env = std::getenv( ENVVAR_TAXONOMY_NCBI.c_str() );
	if( env == NULL ) {
		return NULL;
	}

	const std::string ncbi_root_folder = env;
	const std::string nodes_filename = ncbi_root_folder + "/nodes.dmp";
	const std::string names_filename = ncbi_root_folder + "/names.dmp";

	if( ! boost::filesystem::exists( nodes_filename ) ) {
		BOOST_THROW_EXCEPTION( FileNotFound() << file_info( nodes_filename ) );
	}
	if( ! boost::filesystem::exists( names_filename ) ) {
		BOOST_THROW_EXCEPTION( FileNotFound() << file_info( names_filename ) );
	}

	return parseNCBIFlatFiles( nodes_filename, names_filename, ranked_levels );
}



Taxonomy* loadTaxonomy( const std::string& hierarchy_filename, const std::vector< std::string >& ranked_levels ) {
	if( ! hierarchy_filename.empty() ) {
		return parseHierarchyFile( hierarchy_filename, ranked_levels );
	}
	Taxonomy* tax = loadTaxonomyFromEnvironment( ranked_levels );
	if( ! tax ) {
		BOOST_THROW_EXCEPTION( ConfigurationError() << general_info( "specify a hierarchy file or set " + ENVVAR_TAXONOMY_NCBI + " to the folder containing the NCBI taxonomy dump files" ) );
	}
	return tax;
}
