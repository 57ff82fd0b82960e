#include <iostream>
#include <cstdlib>
#include <boost/scoped_ptr.hpp>
#include "src/accessconv.hh"
#include "src/constants.hh"
#include "src/exception.hh"
#include "src/ncbidata.hh"
#include "src/taxonomyinterface.hh"
#include "src/unittest.hh"



using namespace std;



namespace {

TaxonRecordMap makeRecords( const TaxonID* taxids, const TaxonID* parents, std::size_t n ) {
	TaxonRecordMap records;
	for( std::size_t i = 0; i < n; ++i ) {
		TaxonRecord& record = records[ taxids[i] ];
		record.parent_taxid = parents[i];
		record.rank = "no rank";
		record.name = "taxon";
	}
	return records;
}

}



int main( int argc, char** argv ) {
	bool alltests = true;
	TestDirectory dir;

	{ // structure of the test hierarchy
		boost::scoped_ptr< Taxonomy > tax( parseHierarchyFile( dir.write( "hierarchy.tsv", test_hierarchy ) ) );
		TaxonomyInterface taxinter( tax.get() );
		cerr << "taxonomy size: " << tax->size() << " nodes" << endl;

		alltests = unittest_assert( tax->size() == 18, "TAXONOMY_SIZE" ) && alltests;
		alltests = unittest_assert( static_cast< int >( tax->size() ) == tax->indexSize(), "TAXONOMY_INDEX_SIZE" ) && alltests;
		alltests = unittest_assert( taxinter.getTaxID( taxinter.getRoot() ) == 1, "ROOT_TAXID" ) && alltests;

		// nested set values of children lie within those of the parent
		for( Taxonomy::iterator node_it = ++( tax->begin() ); node_it != tax->end(); ++node_it ) {
			const TaxonNode* node = node_it.node;
			alltests = unittest_assert( node->parent->data->leftvalue < node->data->leftvalue && node->data->rightvalue <= node->parent->data->rightvalue, "NESTED_SET (" + node->data->name + ")" ) && alltests;
			alltests = unittest_assert( node->parent->data->root_pathlength + 1 == node->data->root_pathlength, "PATHLENGTH_TO_PARENT_EQUALS_ONE (" + node->data->name + ")" ) && alltests;
		}

		// ranked depth counts ranked nodes on the root path
		alltests = unittest_assert( taxinter.getRankedDepth( taxinter.getRoot() ) == 0, "RANKED_DEPTH_ROOT" ) && alltests;
		alltests = unittest_assert( taxinter.getRankedDepth( taxinter.getNode( 2 ) ) == 1, "RANKED_DEPTH_SUPERKINGDOM" ) && alltests;
		alltests = unittest_assert( taxinter.getRankedDepth( taxinter.getNode( 51 ) ) == 7, "RANKED_DEPTH_SPECIES" ) && alltests;
		alltests = unittest_assert( taxinter.getRankedDepth( taxinter.getNode( 55 ) ) == 6, "RANKED_DEPTH_UNRANKED" ) && alltests;
		alltests = unittest_assert( taxinter.getRankedDepth( taxinter.getNode( 56 ) ) == 7, "RANKED_DEPTH_BELOW_UNRANKED" ) && alltests;
		alltests = unittest_assert( taxinter.getRankedDepth( taxinter.getNode( 151 ) ) == 3, "RANKED_DEPTH_GAPS" ) && alltests;
		alltests = unittest_assert( taxinter.getRankedDepth( taxinter.getNode( 901 ) ) == 0, "RANKED_DEPTH_NO_RANKED_ANCESTOR" ) && alltests;
		alltests = unittest_assert( taxinter.getMaxDepth() == 8, "MAX_DEPTH" ) && alltests;

		// lowest common ancestors
		alltests = unittest_assert( taxinter.getTaxID( taxinter.getLCA( 51, 52 ) ) == 50, "LCA_SIBLINGS" ) && alltests;
		alltests = unittest_assert( taxinter.getTaxID( taxinter.getLCA( 56, 61 ) ) == 40, "LCA_ACROSS_UNRANKED" ) && alltests;
		alltests = unittest_assert( taxinter.getTaxID( taxinter.getLCA( 51, 151 ) ) == 2, "LCA_PHYLA" ) && alltests;
		alltests = unittest_assert( taxinter.getTaxID( taxinter.getLCA( 51, 901 ) ) == 1, "LCA_ROOT" ) && alltests;
		alltests = unittest_assert( taxinter.getTaxID( taxinter.getLCA( 50, 56 ) ) == 50, "LCA_ANCESTOR" ) && alltests;
		alltests = unittest_assert( taxinter.getTaxID( taxinter.getLCA( 61, 61 ) ) == 61, "LCA_SAME" ) && alltests;

		std::vector< const TaxonNode* > nodes;
		nodes.push_back( taxinter.getNode( 51 ) );
		nodes.push_back( taxinter.getNode( 56 ) );
		nodes.push_back( taxinter.getNode( 52 ) );
		alltests = unittest_assert( taxinter.getTaxID( taxinter.getLCA( nodes ) ) == 50, "LCA_CONTAINER" ) && alltests;
		nodes.push_back( taxinter.getNode( 61 ) );
		alltests = unittest_assert( taxinter.getTaxID( taxinter.getLCA( nodes ) ) == 40, "LCA_CONTAINER_WIDER" ) && alltests;

		alltests = unittest_assert( taxinter.isParentOf( 50, 56 ), "IS_PARENT" ) && alltests;
		alltests = unittest_assert( ! taxinter.isParentOf( 56, 56 ), "IS_PARENT_STRICT" ) && alltests;
		alltests = unittest_assert( ! taxinter.isParentOf( 60, 51 ), "IS_PARENT_OTHER_BRANCH" ) && alltests;

		// ranked views
		alltests = unittest_assert( taxinter.getTaxID( taxinter.getRankedAncestor( taxinter.getNode( 55 ) ) ) == 50, "RANKED_ANCESTOR" ) && alltests;
		alltests = unittest_assert( taxinter.getRankedAncestor( taxinter.getNode( 901 ) ) == NULL, "RANKED_ANCESTOR_NONE" ) && alltests;

		const std::vector< const TaxonNode* > lineage = taxinter.getRankedLineage( taxinter.getNode( 56 ) );
		alltests = unittest_assert( lineage.size() == 7 && taxinter.getTaxID( lineage.front() ) == 2 && taxinter.getTaxID( lineage.back() ) == 56, "RANKED_LINEAGE" ) && alltests;

		const std::vector< const TaxonNode* > slots = taxinter.getRankedSlots( taxinter.getNode( 150 ) );
		alltests = unittest_assert( slots.size() == default_ranks.size(), "RANKED_SLOTS_SIZE" ) && alltests;
		alltests = unittest_assert( slots[0] && taxinter.getTaxID( slots[0] ) == 2 && slots[1] && taxinter.getTaxID( slots[1] ) == 110, "RANKED_SLOTS_TOP" ) && alltests;
		alltests = unittest_assert( ! slots[2] && ! slots[3] && ! slots[4] && ! slots[6], "RANKED_SLOTS_GAPS" ) && alltests;
		alltests = unittest_assert( slots[5] && taxinter.getTaxID( slots[5] ) == 150, "RANKED_SLOTS_GENUS" ) && alltests;

		alltests = unittest_assert( taxinter.findRankedNode( "genus", "Escherichia" ) == taxinter.getNode( 50 ), "FIND_RANKED_NODE" ) && alltests;
		alltests = unittest_assert( taxinter.findRankedNode( "domain", "Bacteria" ) == taxinter.getNode( 2 ), "FIND_RANKED_NODE_DOMAIN" ) && alltests;
		alltests = unittest_assert( taxinter.findRankedNode( "species", "Escherichia" ) == NULL, "FIND_RANKED_NODE_WRONG_RANK" ) && alltests;

		alltests = unittest_assert( taxinter.getNode( 12345 ) == NULL, "UNKNOWN_TAXON" ) && alltests;
		bool thrown = false;
		try {
			taxinter.getNodeChecked( 12345 );
		} catch( TaxonNotFound& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "UNKNOWN_TAXON_CHECKED" ) && alltests;

		// the iterator walks up to the root
		std::size_t steps = 0;
		for( Taxonomy::PathUpIterator it = taxinter.traverseUp( taxinter.getNode( 56 ) ); it.valid(); ++it ) ++steps;
		alltests = unittest_assert( steps == 9, "PATH_UP_ITERATOR" ) && alltests;
	}

	{ // broken hierarchies are rejected
		const TaxonID cycle_ids[] = { 1, 2, 3, 4 };
		const TaxonID cycle_parents[] = { 1, 1, 4, 3 };
		bool thrown = false;
		try {
			delete buildTaxonomy( makeRecords( cycle_ids, cycle_parents, 4 ) );
		} catch( DataIntegrityError& e ) {
			const TaxonID* taxid = boost::get_error_info< taxid_info >( e );
			thrown = taxid && ( *taxid == 3 || *taxid == 4 );
		}
		alltests = unittest_assert( thrown, "CYCLE_REJECTED" ) && alltests;

		const TaxonID orphan_ids[] = { 1, 2, 3 };
		const TaxonID orphan_parents[] = { 1, 1, 99 };
		thrown = false;
		try {
			delete buildTaxonomy( makeRecords( orphan_ids, orphan_parents, 3 ) );
		} catch( DataIntegrityError& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "ORPHAN_REJECTED" ) && alltests;

		const TaxonID roots_ids[] = { 1, 2, 5 };
		const TaxonID roots_parents[] = { 1, 1, 0 };
		thrown = false;
		try {
			delete buildTaxonomy( makeRecords( roots_ids, roots_parents, 3 ) );
		} catch( DataIntegrityError& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "MULTIPLE_ROOTS_REJECTED" ) && alltests;

		thrown = false;
		try {
			delete parseHierarchyFile( dir.write( "broken.tsv", "TaxID\tName\tParentTaxID\n1\troot\t1\n" ) );
		} catch( ParsingError& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "HIERARCHY_MISSING_COLUMN" ) && alltests;

		thrown = false;
		try {
			delete parseHierarchyFile( dir.file( "missing.tsv" ) );
		} catch( FileNotFound& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "HIERARCHY_MISSING_FILE" ) && alltests;
	}

	{ // NCBI dump files
		const std::string nodes = dir.write( "nodes.dmp",
			"1\t|\t1\t|\tno rank\t|\t\t|\n"
			"2\t|\t131567\t|\tsuperkingdom\t|\t\t|\n"
			"131567\t|\t1\t|\tno rank\t|\t\t|\n"
			"1224\t|\t2\t|\tphylum\t|\t\t|\n" );
		const std::string names = dir.write( "names.dmp",
			"1\t|\troot\t|\t\t|\tscientific name\t|\n"
			"2\t|\tBacteria\t|\tBacteria <bacteria>\t|\tscientific name\t|\n"
			"2\t|\teubacteria\t|\t\t|\tgenbank common name\t|\n"
			"131567\t|\tcellular organisms\t|\t\t|\tscientific name\t|\n"
			"1224\t|\tPseudomonadota\t|\t\t|\tscientific name\t|\n" );
		boost::scoped_ptr< Taxonomy > tax( parseNCBIFlatFiles( nodes, names ) );
		TaxonomyInterface taxinter( tax.get() );
		alltests = unittest_assert( tax->size() == 4, "NCBI_SIZE" ) && alltests;
		alltests = unittest_assert( taxinter.getName( taxinter.getNode( 2 ) ) == "Bacteria", "NCBI_SCIENTIFIC_NAME" ) && alltests;
		alltests = unittest_assert( taxinter.getRankedDepth( taxinter.getNode( 1224 ) ) == 2, "NCBI_RANKED_DEPTH" ) && alltests;
	}

	{ // identifier to taxon mapping
		boost::scoped_ptr< StrIDConverter > seqid2taxid( loadStrIDConverterFromFile( dir.write( "taxonomy.tsv", test_taxonomy_map ) ) );
		TaxonID taxid = 0;
		alltests = unittest_assert( seqid2taxid->find( "NC_000913.3", taxid ) && taxid == 51, "MAP_EXACT" ) && alltests;
		alltests = unittest_assert( seqid2taxid->find( "NZ_CP009072.1", taxid ) && taxid == 51, "MAP_SECOND_IDENTIFIER" ) && alltests;
		alltests = unittest_assert( seqid2taxid->find( "NC_000913.4", taxid ) && taxid == 51, "MAP_OTHER_VERSION" ) && alltests;
		alltests = unittest_assert( seqid2taxid->find( "NC_000913", taxid ) && taxid == 51, "MAP_NO_VERSION" ) && alltests;
		alltests = unittest_assert( seqid2taxid->find( "GCF_000006945.2", taxid ) && taxid == 61, "MAP_ASSEMBLY" ) && alltests;
		alltests = unittest_assert( ! seqid2taxid->find( "NC_999999.1", taxid ), "MAP_UNKNOWN" ) && alltests;

		bool thrown = false;
		try {
			( *seqid2taxid )[ "NC_999999.1" ];
		} catch( TaxonMappingNotFound& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "MAP_UNKNOWN_THROWS" ) && alltests;

		boost::scoped_ptr< StrIDConverter > plain( loadStrIDConverterFromFile( dir.write( "plain.tsv", "NC_000913.3\t51\nNC_003197.2\t61\n" ) ) );
		alltests = unittest_assert( plain->find( "NC_003197.2", taxid ) && taxid == 61, "MAP_TWO_COLUMNS" ) && alltests;
	}

	if( alltests ) {
		cout << std::endl << "All tests ran through!" << endl;
	} else {
		cerr << std::endl << "At least one test failed!" << endl;
	}

	return alltests ? EXIT_SUCCESS : EXIT_FAILURE;
}
