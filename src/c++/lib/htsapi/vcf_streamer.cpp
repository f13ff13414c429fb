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

#include "htsapi/vcf_streamer.hh"
#include "htsapi/vcf_util.hh"

#include "common/Exceptions.hh"

#include "boost/algorithm/string/classification.hpp"
#include "boost/algorithm/string/split.hpp"

#include <cstring>

#include <ostream>
#include <sstream>



vcf_streamer::
vcf_streamer(
    const char* filename,
    const bool isBiallelicSnpOnly)
    : hts_streamer(filename)
    , _isBiallelicSnpOnly(isBiallelicSnpOnly)
{
    loadHeader();
}



void
vcf_streamer::
loadHeader()
{
    static const char chromHeaderPrefix[] = "#CHROM";

    bool isChromHeaderFound(false);
    while (next_line())
    {
        const char* line(get_line());
        if (line[0] != '#')
        {
            // keep the first data line for the first call to next():
            _isLineBuffered = true;
            break;
        }
        if (0 != strncmp(line, chromHeaderPrefix, strlen(chromHeaderPrefix))) continue;

        const std::string headerLine(line);
        std::vector<std::string> words;
        boost::split(words, headerLine, boost::is_any_of("\t"));
        if (words.size() < VCFID::INFO+1)
        {
            std::ostringstream oss;
            oss << "Unexpected VCF column header line:\n";
            report_line_state(oss);
            BOOST_THROW_EXCEPTION(eigenconv::common::GeneralException(oss.str()));
        }
        for (unsigned wordIndex(VCFID::SAMPLE); wordIndex<words.size(); ++wordIndex)
        {
            _sampleNames.push_back(words[wordIndex]);
        }
        isChromHeaderFound = true;
    }

    if (! isChromHeaderFound)
    {
        std::ostringstream oss;
        oss << "VCF file is missing the '" << chromHeaderPrefix << "' column header line: '" << name() << "'";
        BOOST_THROW_EXCEPTION(eigenconv::common::GeneralException(oss.str()));
    }

    if (_sampleNames.empty())
    {
        std::ostringstream oss;
        oss << "VCF file contains no samples: '" << name() << "'";
        BOOST_THROW_EXCEPTION(eigenconv::common::GeneralException(oss.str()));
    }
}



bool
vcf_streamer::
next()
{
    _is_record_set=false;

    while (true)
    {
        if (_isLineBuffered)
        {
            _isLineBuffered = false;
        }
        else if (! next_line())
        {
            return false;
        }

        const char* line(get_line());
        if (line[0] == '\0') continue;
        if (line[0] == '#')
        {
            std::ostringstream oss;
            oss << "Unexpected VCF header line after the first data record:\n";
            report_line_state(oss);
            BOOST_THROW_EXCEPTION(eigenconv::common::GeneralException(oss.str()));
        }

        if (! _vcfrec.set(line))
        {
            std::ostringstream oss;
            oss << "Can't parse VCF record:\n";
            report_line_state(oss);
            BOOST_THROW_EXCEPTION(eigenconv::common::GeneralException(oss.str()));
        }
        _record_no++;

        if (_isBiallelicSnpOnly && (! _vcfrec.is_biallelic_snp())) continue;

        _is_record_set=true;
        return true;
    }
}



void
vcf_streamer::
report_state(std::ostream& os) const
{
    const vcf_record* vcfp(get_record_ptr());

    os << "\tvcf_stream_label: " << name() << "\n";
    if (nullptr != vcfp)
    {
        os << "\tvcf_stream_record_no: " << record_no() << "\n"
           << "\tvcf_record: " << *(vcfp);
    }
    else
    {
        os << "\tno vcf record currently set\n";
    }
}
