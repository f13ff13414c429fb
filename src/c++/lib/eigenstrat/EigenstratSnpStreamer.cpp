//
// EigenConv - VCF to Eigenstrat genotype converter
// Copyright (c) 2009-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file

#include "eigenstrat/EigenstratSnpStreamer.hh"

#include "blt_util/parse_util.hh"
#include "blt_util/seq_util.hh"
#include "common/Exceptions.hh"

#include "boost/algorithm/string/classification.hpp"
#include "boost/algorithm/string/split.hpp"
#include "boost/algorithm/string/trim.hpp"

#include <iostream>
#include <sstream>



namespace SNPID
{
enum index_t
{
    ID,
    CHROM,
    GENETIC_POS,
    POS,
    REF,
    ALT,
    SIZE
};
}



EigenstratSnpStreamer::
EigenstratSnpStreamer(
    const char* filename,
    const std::string& chromFilter)
    : hts_streamer(filename)
    , _chromFilter(chromFilter)
{}



static
char
parseAllele(
    const std::string& word,
    const char* label)
{
    if (word.size() != 1)
    {
        std::ostringstream oss;
        oss << "Expected single base " << label << " allele, found: '" << word << "'";
        BOOST_THROW_EXCEPTION(eigenconv::common::GeneralException(oss.str()));
    }
    std::string allele(word);
    stoupper(allele);
    return allele[0];
}



void
EigenstratSnpStreamer::
parseLine(const char* line)
{
    std::string trimmedLine(line);
    boost::algorithm::trim(trimmedLine);
    boost::split(_words, trimmedLine, boost::is_any_of(" \t"), boost::token_compress_on);

    if (_words.size() < SNPID::SIZE)
    {
        std::ostringstream oss;
        oss << "Expected at least " << SNPID::SIZE << " columns in Eigenstrat snp record, found "
            << _words.size() << "\n";
        report_line_state(oss);
        BOOST_THROW_EXCEPTION(eigenconv::common::GeneralException(oss.str()));
    }

    using namespace eigenconv::blt_util;

    _snprec.clear();
    try
    {
        _snprec.snpId = _words[SNPID::ID];
        _snprec.chrom = _words[SNPID::CHROM];
        _snprec.geneticPos = parse_double_str(_words[SNPID::GENETIC_POS]);
        _snprec.pos = parse_long_str(_words[SNPID::POS]);
        _snprec.ref = parseAllele(_words[SNPID::REF], "reference");
        _snprec.alt = parseAllele(_words[SNPID::ALT], "alternate");
    }
    catch (const eigenconv::common::GeneralException& e)
    {
        std::ostringstream oss;
        oss << "Can't parse Eigenstrat snp record: " << e.what() << "\n";
        report_line_state(oss);
        BOOST_THROW_EXCEPTION(eigenconv::common::GeneralException(oss.str()));
    }
}



bool
EigenstratSnpStreamer::
next()
{
    _is_record_set=false;

    while (next_line())
    {
        const char* line(get_line());
        if (line[0] == '\0') continue;

        // whitespace-only lines are treated as blank:
        bool isBlank(true);
        for (const char* p(line); *p != '\0'; ++p)
        {
            if ((*p != ' ') && (*p != '\t') && (*p != '\r'))
            {
                isBlank=false;
                break;
            }
        }
        if (isBlank) continue;

        parseLine(line);
        _record_no++;

        if ((! _chromFilter.empty()) && (_snprec.chrom != _chromFilter)) continue;

        _is_record_set=true;
        return true;
    }
    return false;
}



void
EigenstratSnpStreamer::
report_state(std::ostream& os) const
{
    const EigenstratSnpRecord* snpp(get_record_ptr());

    os << "\tsnp_stream_label: " << name() << "\n";
    if (nullptr != snpp)
    {
        os << "\tsnp_stream_record_no: " << record_no() << "\n"
           << "\tsnp_record: " << *(snpp) << "\n";
    }
    else
    {
        os << "\tno snp record currently set\n";
    }
}
