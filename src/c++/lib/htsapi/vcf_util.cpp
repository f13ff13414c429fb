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

#include "htsapi/vcf_util.hh"

#include "blt_util/parse_util.hh"
#include "common/Exceptions.hh"

#include <cctype>

#include <limits>
#include <sstream>



static
void
parse_gt_exception(const char* gt)
{
    std::ostringstream oss;
    oss << "Can't parse VCF GT field: '" << gt << "'";
    BOOST_THROW_EXCEPTION(eigenconv::common::GeneralException(oss.str()));
}



void
parse_gt(
    const char* gt,
    std::vector<int>& gti,
    const bool is_allow_bad_end_char)
{
    gti.clear();

    const char* p(gt);
    bool isAlleleExpected(true);
    while ((*p != '\0') && (*p != ':'))
    {
        if (isAlleleExpected)
        {
            if (*p == '.')
            {
                gti.push_back(-1);
                ++p;
            }
            else if (isdigit(static_cast<unsigned char>(*p)))
            {
                // indices past the int range are still invalid alleles, keep them out of range
                const long val(eigenconv::blt_util::parse_long(p));
                if (val > std::numeric_limits<int>::max())
                {
                    gti.push_back(std::numeric_limits<int>::max());
                }
                else
                {
                    gti.push_back(static_cast<int>(val));
                }
            }
            else
            {
                if (is_allow_bad_end_char) return;
                parse_gt_exception(gt);
            }
            isAlleleExpected=false;
        }
        else
        {
            if ((*p == '/') || (*p == '|'))
            {
                isAlleleExpected=true;
                ++p;
            }
            else
            {
                if (is_allow_bad_end_char) return;
                parse_gt_exception(gt);
            }
        }
    }

    // empty field or trailing separator:
    if (isAlleleExpected && (! is_allow_bad_end_char))
    {
        parse_gt_exception(gt);
    }
}
