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

#ifndef unittest_hh_
#define unittest_hh_

#include <cmath>
#include <fstream>
#include <iostream>
#include <string>
#include <boost/filesystem.hpp>



inline bool unittest_assert( bool condition, const std::string& testname ) {
	if( !condition ) {
		std::cerr << "Test " << testname << " failed!" << std::endl;
	} else {
// 		std::cout << "Test " << testname << " succeeded" << std::endl;
	}
	return condition;
}



inline bool nearlyEqual( double a, double b, double epsilon = 1e-6 ) {
	return std::fabs( a - b ) <= epsilon;
}



// fresh directory below the system temp directory, removed with all contents on destruction
class TestDirectory {
	public:
		TestDirectory() : path_( boost::filesystem::temp_directory_path() / boost::filesystem::unique_path( "hymet-test-%%%%-%%%%-%%%%" ) ) {
			boost::filesystem::create_directories( path_ );
		}

		~TestDirectory() {
			boost::system::error_code ec;
			boost::filesystem::remove_all( path_, ec );
		}

		const boost::filesystem::path& path() const { return path_; }

		std::string file( const std::string& name ) const { return ( path_ / name ).string(); }

		// returns the file name
		std::string write( const std::string& name, const std::string& content ) const {
			const std::string filename = file( name );
			std::ofstream handle( filename.c_str() );
			handle << content;
			return filename;
		}

	private:
		const boost::filesystem::path path_;
};



inline std::string readFile( const std::string& filename ) {
	std::ifstream handle( filename.c_str() );
	return std::string( ( std::istreambuf_iterator< char >( handle ) ), std::istreambuf_iterator< char >() );
}



// small hierarchy shared by the tests
//
// 1 root (no rank)
// +- 2 Bacteria (superkingdom)
//    +- 10 Pseudomonadota (phylum)
//    |  +- 20 Gammaproteobacteria (class)
//    |     +- 30 Enterobacterales (order)
//    |        +- 40 Enterobacteriaceae (family)
//    |           +- 50 Escherichia (genus)
//    |           |  +- 51 Escherichia coli (species)
//    |           |  +- 52 Escherichia fergusonii (species)
//    |           |  +- 55 Escherichia group (no rank)
//    |           |     +- 56 Escherichia albertii (species)
//    |           +- 60 Salmonella (genus)
//    |              +- 61 Salmonella enterica (species)
//    +- 110 Bacillota (phylum)
//       +- 150 Bacillus (genus)
//          +- 151 Bacillus subtilis (species)
// +- 900 environmental samples (no rank)
//    +- 901 uncultured organism (no rank)
const std::string test_hierarchy =
	"TaxID\tName\tRank\tParentTaxID\n"
	"1\troot\tno rank\t1\n"
	"2\tBacteria\tsuperkingdom\t1\n"
	"10\tPseudomonadota\tphylum\t2\n"
	"20\tGammaproteobacteria\tclass\t10\n"
	"30\tEnterobacterales\torder\t20\n"
	"40\tEnterobacteriaceae\tfamily\t30\n"
	"50\tEscherichia\tgenus\t40\n"
	"51\tEscherichia coli\tspecies\t50\n"
	"52\tEscherichia fergusonii\tspecies\t50\n"
	"55\tEscherichia group\tno rank\t50\n"
	"56\tEscherichia albertii\tspecies\t55\n"
	"60\tSalmonella\tgenus\t40\n"
	"61\tSalmonella enterica\tspecies\t60\n"
	"110\tBacillota\tphylum\t2\n"
	"150\tBacillus\tgenus\t110\n"
	"151\tBacillus subtilis\tspecies\t150\n"
	"900\tenvironmental samples\tno rank\t1\n"
	"901\tuncultured organism\tno rank\t900\n";

// reference taxonomy table for the hierarchy above
const std::string test_taxonomy_map =
	"GCF\tTaxID\tIdentifiers\n"
	"GCF_000005845.2\t51\tNC_000913.3;NZ_CP009072.1\n"
	"GCF_000026225.1\t52\tNC_011740.1\n"
	"GCF_000759775.1\t56\tNZ_CP070290.1\n"
	"GCF_000006945.2\t61\tNC_003197.2\n"
	"GCF_000009045.1\t151\tNC_000964.3\n"
	"GCF_900000001.1\t901\tENV_000001.1\n";

#endif // unittest_hh_
