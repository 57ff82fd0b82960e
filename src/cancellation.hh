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

#ifndef cancellation_hh_
#define cancellation_hh_

#include <csignal>

// process-wide flag set by SIGINT and SIGTERM; long running loops poll it and stop between units
// of work, running external tools are terminated
namespace cancellation {

void installSignalHandlers();
void request();
bool requested();
void reset();

// throws CancellationError if requested
void checkpoint();

}

#endif // cancellation_hh_
