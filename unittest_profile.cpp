#include <iostream>
#include <cstdlib>
#include <sstream>
#include <boost/scoped_ptr.hpp>
#include "src/atomicoutput.hh"
#include "src/bioboxes.hh"
#include "src/constants.hh"
#include "src/exception.hh"
#include "src/ncbidata.hh"
#include "src/profileaggregator.hh"
#include "src/unittest.hh"



using namespace std;



namespace {

const ProfileEntry* findEntry( const std::vector< ProfileEntry >& entries, const std::string& rank, TaxonID taxid ) {
	for( std::vector< ProfileEntry >::const_iterator it = entries.begin(); it != entries.end(); ++it ) {
		if( it->rank == rank && it->taxid == taxid ) return &*it;
	}
	return NULL;
}

}



int main( int argc, char** argv ) {
	bool alltests = true;

	TestDirectory dir;
	boost::scoped_ptr< Taxonomy > tax( parseHierarchyFile( dir.write( "hierarchy.tsv", test_hierarchy ) ) );
	const TaxonomyInterface taxinter( tax.get() );

	{ // lineage strings of the classification table
		const TaxonNode* coli = taxinter.getNode( 51 );
		alltests = unittest_assert( resolveLineage( "superkingdom:Bacteria;phylum:Pseudomonadota;class:Gammaproteobacteria;order:Enterobacterales;family:Enterobacteriaceae;genus:Escherichia;species:Escherichia coli", taxinter ) == coli, "LINEAGE_FULL" ) && alltests;
		alltests = unittest_assert( resolveLineage( "superkingdom:Bacteria;genus:Escherichia;species:Escherichia novum", taxinter ) == taxinter.getNode( 50 ), "LINEAGE_UNKNOWN_LEAF" ) && alltests;
		alltests = unittest_assert( resolveLineage( "superkingdom:Bacteria; genus:Bacillus ", taxinter ) == taxinter.getNode( 150 ), "LINEAGE_WHITESPACE" ) && alltests;
		alltests = unittest_assert( ! resolveLineage( unclassified_label, taxinter ), "LINEAGE_UNCLASSIFIED" ) && alltests;
		alltests = unittest_assert( ! resolveLineage( "", taxinter ), "LINEAGE_EMPTY" ) && alltests;
	}

	{ // homonyms at the same rank are told apart by their ancestors
		const std::string homonyms =
			"TaxID\tName\tRank\tParentTaxID\n"
			"1\troot\tno rank\t1\n"
			"2\tBacteria\tsuperkingdom\t1\n"
			"10\tP1\tphylum\t2\n"
			"20\tP2\tphylum\t2\n"
			"11\tX\tgenus\t10\n"
			"21\tX\tgenus\t20\n"
			"22\tX y\tspecies\t21\n";
		boost::scoped_ptr< Taxonomy > htax( parseHierarchyFile( dir.write( "homonyms.tsv", homonyms ) ) );
		const TaxonomyInterface hinter( htax.get() );

		alltests = unittest_assert( hinter.findRankedNodes( "genus", "X" ).size() == 2, "HOMONYMS_INDEXED" ) && alltests;
		alltests = unittest_assert( resolveLineage( "superkingdom:Bacteria;phylum:P2;genus:X", hinter ) == hinter.getNode( 21 ), "LINEAGE_HOMONYM_SECOND" ) && alltests;
		alltests = unittest_assert( resolveLineage( "superkingdom:Bacteria;phylum:P1;genus:X", hinter ) == hinter.getNode( 11 ), "LINEAGE_HOMONYM_FIRST" ) && alltests;
		alltests = unittest_assert( resolveLineage( "phylum:P2;genus:X;species:X y", hinter ) == hinter.getNode( 22 ), "LINEAGE_HOMONYM_SPECIES" ) && alltests;
		alltests = unittest_assert( resolveLineage( "phylum:P1;genus:X;species:X y", hinter ) == hinter.getNode( 11 ), "LINEAGE_HOMONYM_FOREIGN_LEAF" ) && alltests;
	}

	{ // percentages over all queries
		ProfileAggregator profile( tax.get() );
		profile.add( taxinter.getNode( 51 ) );
		profile.add( taxinter.getNode( 51 ) );
		profile.add( taxinter.getNode( 52 ) );
		profile.add( taxinter.getNode( 61 ) );
		profile.add( NULL );

		std::vector< ProfileEntry > entries;
		profile.getEntries( entries );
		alltests = unittest_assert( profile.total() == 5 && entries.size() == 10, "PROFILE_ENTRIES" ) && alltests;

		const ProfileEntry* bacteria = findEntry( entries, "superkingdom", 2 );
		const ProfileEntry* escherichia = findEntry( entries, "genus", 50 );
		const ProfileEntry* salmonella = findEntry( entries, "genus", 60 );
		const ProfileEntry* coli = findEntry( entries, "species", 51 );
		alltests = unittest_assert( bacteria && nearlyEqual( bacteria->percentage, 80. ), "PROFILE_UNRESOLVED_IN_TOTAL" ) && alltests;
		alltests = unittest_assert( escherichia && salmonella && nearlyEqual( escherichia->percentage, 60. ) && nearlyEqual( salmonella->percentage, 20. ), "PROFILE_GENUS" ) && alltests;
		alltests = unittest_assert( coli && nearlyEqual( coli->percentage, 40. ), "PROFILE_SPECIES" ) && alltests;
		alltests = unittest_assert( coli && coli->taxpath == "2|10|20|30|40|50|51" && coli->taxpathsn == "Bacteria|Pseudomonadota|Gammaproteobacteria|Enterobacterales|Enterobacteriaceae|Escherichia|Escherichia coli", "PROFILE_TAXPATH" ) && alltests;

		// ranks top down, within a rank by decreasing percentage, then taxid
		alltests = unittest_assert( entries.front().rank == "superkingdom" && entries.back().rank == "species", "PROFILE_RANK_ORDER" ) && alltests;
		alltests = unittest_assert( entries[7].taxid == 51 && entries[8].taxid == 52 && entries[9].taxid == 61, "PROFILE_SPECIES_ORDER" ) && alltests;
	}

	{ // missing ranks stay empty in the paths
		ProfileAggregator profile( tax.get() );
		profile.add( taxinter.getNode( 151 ) );
		profile.add( taxinter.getNode( 901 ) );
		std::vector< ProfileEntry > entries;
		profile.getEntries( entries );
		const ProfileEntry* subtilis = findEntry( entries, "species", 151 );
		alltests = unittest_assert( subtilis && subtilis->taxpath == "2|110||||150|151" && subtilis->taxpathsn == "Bacteria|Bacillota||||Bacillus|Bacillus subtilis", "PROFILE_EMPTY_SLOTS" ) && alltests;
		alltests = unittest_assert( entries.size() == 4 && nearlyEqual( subtilis->percentage, 50. ), "PROFILE_NO_RANKED_ANCESTOR" ) && alltests;

		// unranked node counts at its ranked ancestors
		ProfileAggregator unranked( tax.get() );
		unranked.add( taxinter.getNode( 55 ) );
		unranked.getEntries( entries );
		alltests = unittest_assert( entries.size() == 6 && entries.back().rank == "genus" && entries.back().taxid == 50, "PROFILE_UNRANKED_NODE" ) && alltests;
	}

	{ // renormalized per rank
		ProfileAggregator profile( tax.get(), true );
		profile.add( taxinter.getNode( 51 ) );
		profile.add( taxinter.getNode( 50 ) );
		profile.add( taxinter.getNode( 61 ) );
		profile.add( NULL );
		std::vector< ProfileEntry > entries;
		profile.getEntries( entries );
		const ProfileEntry* bacteria = findEntry( entries, "superkingdom", 2 );
		const ProfileEntry* coli = findEntry( entries, "species", 51 );
		const ProfileEntry* escherichia = findEntry( entries, "genus", 50 );
		alltests = unittest_assert( bacteria && nearlyEqual( bacteria->percentage, 100. ), "RENORMALIZED_TOP" ) && alltests;
		alltests = unittest_assert( escherichia && nearlyEqual( escherichia->percentage, 200./3. ), "RENORMALIZED_GENUS" ) && alltests;
		alltests = unittest_assert( coli && nearlyEqual( coli->percentage, 50. ), "RENORMALIZED_SPECIES" ) && alltests;
	}

	{ // empty profile still has a header
		ProfileAggregator profile( tax.get() );
		profile.add( NULL );
		std::ostringstream out;
		profile.write( out, "s0" );
		alltests = unittest_assert( out.str() == "@SampleID:s0\n@Version:0.9.1\n@Ranks:superkingdom|phylum|class|order|family|genus|species\n\n@@TAXID\tRANK\tTAXPATH\tTAXPATHSN\tPERCENTAGE\n", "PROFILE_HEADER_ONLY" ) && alltests;
	}

	{ // written file
		ProfileAggregator profile( tax.get() );
		profile.add( taxinter.getNode( 61 ) );
		const std::string filename = dir.file( "hymet.s1.cami.tsv" );
		writeProfile( filename, profile, "s1" );
		const std::string content = readFile( filename );
		alltests = unittest_assert( content.find( "@SampleID:s1\n" ) == 0, "PROFILE_FILE_HEADER" ) && alltests;
		alltests = unittest_assert( content.find( "61\tspecies\t2|10|20|30|40|60|61\tBacteria|Pseudomonadota|Gammaproteobacteria|Enterobacterales|Enterobacteriaceae|Salmonella|Salmonella enterica\t100.000000\n" ) != std::string::npos, "PROFILE_FILE_LINE" ) && alltests;
	}

	{ // classification table input
		const std::string filename = dir.write( "classified_sequences.tsv",
			classification_header + "\n"
			"read_1\tsuperkingdom:Bacteria;genus:Escherichia\tgenus\t0.9000\n"
			"read_2\tunclassified\tunclassified\t0.0000\n" );
		ClassificationTableParser parser( filename );
		ClassificationRow row;
		std::vector< ClassificationRow > rows;
		while( parser.getNext( row ) ) rows.push_back( row );
		alltests = unittest_assert( rows.size() == 2 && rows[0].queryid == "read_1" && rows[0].level == "genus" && rows[0].confidence == "0.9000", "TABLE_ROWS" ) && alltests;
		alltests = unittest_assert( resolveLineage( rows[0].lineage, taxinter ) == taxinter.getNode( 50 ) && ! resolveLineage( rows[1].lineage, taxinter ), "TABLE_LINEAGES" ) && alltests;

		const std::string broken = dir.write( "broken.tsv", "read_1\tsuperkingdom:Bacteria\n" );
		ClassificationTableParser broken_parser( broken );
		bool thrown = false;
		try {
			broken_parser.getNext( row );
		} catch( ParsingError& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "TABLE_TOO_FEW_COLUMNS" ) && alltests;
	}

	{ // atomic output
		const std::string filename = dir.write( "result.tsv", "old\n" );
		{
			AtomicOutputFile output( filename );
			output.stream() << "new\n";
		}
		alltests = unittest_assert( readFile( filename ) == "old\n", "ATOMIC_WITHOUT_COMMIT" ) && alltests;
		{
			AtomicOutputFile output( filename );
			output.stream() << "new\n";
			output.commit();
		}
		alltests = unittest_assert( readFile( filename ) == "new\n", "ATOMIC_COMMIT" ) && alltests;

		std::size_t hidden = 0;
		for( boost::filesystem::directory_iterator it( dir.path() ), end; it != end; ++it ) {
			if( it->path().filename().string()[0] == '.' ) ++hidden;
		}
		alltests = unittest_assert( hidden == 0, "ATOMIC_NO_TEMPORARIES" ) && alltests;

		bool thrown = false;
		try {
			AtomicOutputFile output( dir.file( "missing/result.tsv" ) );
		} catch( FileNotFound& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "ATOMIC_MISSING_DIRECTORY" ) && alltests;

		// a directory that cannot be inspected is reported like other file errors
		boost::filesystem::create_symlink( "loop", dir.file( "loop" ) );
		thrown = false;
		try {
			AtomicOutputFile output( dir.file( "loop/result.tsv" ) );
		} catch( FileError& ) {
			thrown = true;
		}
		alltests = unittest_assert( thrown, "ATOMIC_UNREADABLE_DIRECTORY" ) && alltests;
	}

	if( alltests ) {
		cout << std::endl << "All tests ran through!" << endl;
	} else {
		cerr << std::endl << "At least one test failed!" << endl;
	}

	return alltests ? EXIT_SUCCESS : EXIT_FAILURE;
}
