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

#ifndef atomicoutput_hh_
#define atomicoutput_hh_

#include <fstream>
#include <string>
#include <boost/filesystem/path.hpp>

// writes into a temporary file next to the target which replaces the target on commit();
// without commit() the temporary file is removed and the target stays untouched
class AtomicOutputFile {
	public:
		explicit AtomicOutputFile( const std::string& filename );
		~AtomicOutputFile();

		std::ostream& stream() { return handle_; }
		const std::string& filename() const { return filename_; }

		// throws FileError
		void commit();

	private:
		AtomicOutputFile( const AtomicOutputFile& );
		AtomicOutputFile& operator=( const AtomicOutputFile& );

		const std::string filename_;
		boost::filesystem::path tmppath_;
		std::ofstream handle_;
		bool committed_;
};

#endif // atomicoutput_hh_
