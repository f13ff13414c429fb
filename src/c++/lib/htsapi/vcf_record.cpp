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

#include "htsapi/vcf_record.hh"
#include "htsapi/vcf_util.hh"

#include "blt_util/parse_util.hh"
#include "blt_util/seq_util.hh"
#include "common/Exceptions.hh"

#include <cassert>

#include <iostream>
#include <sstream>



bool
vcf_record::
set(const char* s)
{
    static const char sep('\t');

    clear();

    // simple tab parse:
    const char* start(s);
    const char* p(start);

    unsigned wordindex(0);
    while (true)
    {
        if ((*p == sep) || (*p == '\n') || (*p == '\r') || (*p == '\0'))
        {
            switch (wordindex)
            {
            case VCFID::CHROM:
                chrom.assign(start,p);
                break;
            case VCFID::POS:
            {
                const char* posEnd(start);
                pos=eigenconv::blt_util::parse_long(posEnd);
                if (posEnd != p) return false;
            }
            break;
            case VCFID::ID:
            case VCFID::QUAL:
            case VCFID::FILT:
            case VCFID::INFO:
                // skip these fields...
                break;
            case VCFID::REF:
                ref.assign(start,p);
                stoupper(ref);
                break;
            case VCFID::ALT:
                // additional parse loop for ',' character:
            {
                const char* p2(start);
                while (p2<=p)
                {
                    if ((*p2==',') || (p2==p))
                    {
                        alt.emplace_back(start,p2);
                        stoupper(alt.back());
                        start=p2+1;
                    }
                    p2++;
                }
            }
            break;
            case VCFID::FORMAT:
                format.assign(start,p);
                break;
            default:
                samples.emplace_back(start,p);
                break;
            }
            start=p+1;
            wordindex++;
        }
        if ((*p == '\n') || (*p == '\r') || (*p == '\0')) break;
        ++p;
    }

    return (wordindex > VCFID::ALT);
}



bool
vcf_record::
is_biallelic_snp() const
{
    if (ref.size() != 1) return false;
    if (alt.size() != 1) return false;
    if (alt[0].size() != 1) return false;
    if (! (is_valid_base(ref[0]) && is_valid_base(alt[0][0]))) return false;
    return (ref[0] != alt[0][0]);
}



const char*
vcf_record::
get_gt(const unsigned sampleIndex) const
{
    assert(sampleIndex < samples.size());

    unsigned keyIndex(0);
    if ((! get_format_key_index(format.c_str(), "GT", keyIndex)) || (keyIndex != 0))
    {
        std::ostringstream oss;
        oss << "First VCF FORMAT field must be GT at " << chrom << ":" << pos
            << ", found FORMAT: '" << format << "'";
        BOOST_THROW_EXCEPTION(eigenconv::common::GeneralException(oss.str()));
    }
    return samples[sampleIndex].c_str();
}



std::ostream& operator<<(std::ostream& os, const vcf_record& vcfr)
{
    os << vcfr.chrom << '\t'
       << vcfr.pos << '\t'
       << '.' << '\t'
       << vcfr.ref << '\t';

    const unsigned nalt(vcfr.alt.size());
    for (unsigned a(0); a<nalt; ++a)
    {
        if (a) os << ',';
        os << vcfr.alt[a];
    }
    os << '\t'
       << '.' << '\t'
       << '.' << '\t'
       << '.';

    if (! vcfr.format.empty())
    {
        os << '\t' << vcfr.format;
        for (const auto& sample : vcfr.samples)
        {
            os << '\t' << sample;
        }
    }
    os << '\n';

    return os;
}
