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

#ifndef identifierlist_hh_
#define identifierlist_hh_

#include <string>
#include <vector>
#include "types.hh"

// identifiers in file order, either from FASTA headers (first word after '>') or one per line
void readIdentifiers( const std::string& filename, std::vector< std::string >& ids );

// number of FASTA records in the file
large_unsigned_int countFastaRecords( const std::string& filename );

// one identifier per line, atomically replaced
void writeIdentifiers( const std::string& filename, const std::vector< std::string >& ids );

#endif // identifierlist_hh_
