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

#ifndef bioboxes_hh_
#define bioboxes_hh_

#include <fstream>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>


class BioboxesProfilingFormat{  // implements Bioboxes.org (CAMI) profiling format 0.9.1
public:
    BioboxesProfilingFormat(
        const std::string& sampleid,
        const std::vector<std::string>& ranks,
        const std::string& taxonomyid = "",
        std::ostream& ostr = std::cout
        );

    ~BioboxesProfilingFormat();

    void writeBodyLine(
        const std::string& taxid,
        const std::string& rank,
        const std::string& taxpath,
        const std::string& taxpathsn,
        const std::string& percentage
    );

private:
    void writeHeader(const std::string& sampleid, const std::vector<std::string>& ranks, const std::string& taxonomyid);

    void writeHeaderColumnTags();

    std::ostream& ostr_;
    const std::string format_version_ = "0.9.1";
};


// reads the classification table written by the classifier
struct ClassificationRow {
    std::string queryid;
    std::string lineage;
    std::string level;
    std::string confidence;
};


class ClassificationTableParser{
public:
    explicit ClassificationTableParser(const std::string& filename);

    // false at the end of the table; throws ParsingError for rows with too few columns
    bool getNext(ClassificationRow& row);

private:
    const std::string filename_;
    std::ifstream filehandle_;
    unsigned int line_num_ = 0;
};

#endif // bioboxes_hh_
