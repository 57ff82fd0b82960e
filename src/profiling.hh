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

#ifndef profiling_hh_
#define profiling_hh_

#include <string>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include "types.hh"

// accumulates wall-clock time of one pipeline stage over possibly several attempts
class StopWatch {
	public:
		StopWatch( const std::string& info ) : info_( info ), stopped_( true ), sum_( 0 ), counter_( 0 ) {}

		void start() {
			if( stopped_ ) {
				timestamp_ = boost::posix_time::microsec_clock::universal_time();
				stopped_ = false;
			}
		}

		void stop() {
			if( ! stopped_ ) {
				sum_ += elapsed();
				++counter_;
				stopped_ = true;
			}
		}

		// milliseconds
		very_large_unsigned_int read() const {
			if( stopped_ ) return sum_;
			return sum_ + elapsed();
		}

		large_unsigned_int rounds() const { return counter_; }
		const std::string& info() const { return info_; }

	private:
		very_large_unsigned_int elapsed() const {
			return ( boost::posix_time::microsec_clock::universal_time() - timestamp_ ).total_milliseconds();
		}

		const std::string info_;
		bool stopped_;
		boost::posix_time::ptime timestamp_;
		very_large_unsigned_int sum_;
		large_unsigned_int counter_;
};

#endif //profiling_hh_
