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

#include "conversion/VcfDosageUtil.hh"

#include "common/Exceptions.hh"
#include "htsapi/vcf_util.hh"

#include <sstream>
#include <vector>



DOSAGE::index_t
getGtDosage(const char* gt)
{
    std::vector<int> gti;
    parse_gt(gt, gti);

    const unsigned ploidy(gti.size());
    if ((ploidy < 1) || (ploidy > 2)) return DOSAGE::MISSING;

    unsigned altCount(0);
    for (const int alleleIndex : gti)
    {
        if ((alleleIndex < 0) || (alleleIndex > 1)) return DOSAGE::MISSING;
        altCount += alleleIndex;
    }

    switch (altCount)
    {
    case 0:
        return DOSAGE::REF;
    case 1:
        return DOSAGE::HET;
    default:
        return DOSAGE::HOM_ALT;
    }
}



void
getVcfDosages(
    const vcf_record& vcfr,
    DosageVector& dosages)
{
    using namespace eigenconv::common;

    dosages.clear();

    const unsigned sampleCount(vcfr.sample_count());
    if (sampleCount == 0)
    {
        std::ostringstream oss;
        oss << "No genotypes found in VCF record at " << vcfr.chrom << ":" << vcfr.pos;
        BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
    }

    for (unsigned sampleIndex(0); sampleIndex<sampleCount; ++sampleIndex)
    {
        const char* gt(vcfr.get_gt(sampleIndex));
        try
        {
            dosages.push_back(getGtDosage(gt));
        }
        catch (const GeneralException& e)
        {
            std::ostringstream oss;
            oss << "Can't extract dosage for sample " << (sampleIndex+1)
                << " in VCF record at " << vcfr.chrom << ":" << vcfr.pos << ": " << e.what();
            BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
        }
    }
}
