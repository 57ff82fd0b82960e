#include "bioboxes.hh"
#include "constants.hh"
#include "exception.hh"
#include "utils.hh"
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>


BioboxesProfilingFormat::BioboxesProfilingFormat(const std::string& sampleid, const std::vector<std::string>& ranks, const std::string& taxonomyid, std::ostream& ostr) :
    ostr_(ostr)
{
    writeHeader(sampleid, ranks, taxonomyid);
    ostr_ << endline;

    writeHeaderColumnTags();
    ostr_ << endline;
}


BioboxesProfilingFormat::~BioboxesProfilingFormat()
{
    ostr_ << std::flush;
}


void BioboxesProfilingFormat::writeHeader(const std::string& sampleid, const std::vector<std::string>& ranks, const std::string& taxonomyid)
{
    // output header tags
    ostr_ << "@SampleID:" << sampleid << endline;
    ostr_ << "@Version:" << format_version_ << endline;
    ostr_ << "@Ranks:" << boost::algorithm::join(ranks, "|") << endline;
    if(!taxonomyid.empty()) ostr_ << "@TaxonomyID:" << taxonomyid << endline;
}


void BioboxesProfilingFormat::writeHeaderColumnTags()
{
    ostr_ << "@@TAXID" << tab << "RANK" << tab << "TAXPATH" << tab << "TAXPATHSN" << tab << "PERCENTAGE";
}


void BioboxesProfilingFormat::writeBodyLine(const std::string& taxid, const std::string& rank, const std::string& taxpath, const std::string& taxpathsn, const std::string& percentage)
{
    ostr_ << taxid << tab << rank << tab << taxpath << tab << taxpathsn << tab << percentage << endline;
}



ClassificationTableParser::ClassificationTableParser(const std::string& filename) : filename_(filename), filehandle_(filename.c_str())
{
    if(!filehandle_) BOOST_THROW_EXCEPTION(FileNotFound {} << file_info {filename});
}


bool ClassificationTableParser::getNext(ClassificationRow& row)
{
    std::string line;
    std::vector<std::string> fields;
    while(std::getline(filehandle_, line)) {
        ++line_num_;
        if(ignoreLine(line)) continue;
        if(line_num_ == 1 && boost::starts_with(line, "Query" + tab_as_str)) continue;  // header
        fields.clear();
        tokenizeSingleCharDelim(line, fields, default_field_separator, 4);
        if(fields.size() < 4) BOOST_THROW_EXCEPTION(ParsingError {} << file_info {filename_} << line_info {line_num_});
        row.queryid = fields[0];
        row.lineage = fields[1];
        row.level = fields[2];
        row.confidence = trimmed(fields[3]);
        return true;
    }
    return false;
}
