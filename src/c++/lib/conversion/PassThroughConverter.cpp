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

#include "conversion/PassThroughConverter.hh"
#include "conversion/VcfDosageUtil.hh"

#include "common/Exceptions.hh"

#include <sstream>



PassThroughConverter::
PassThroughConverter(
    const std::string& targetChrom,
    const unsigned sampleCount)
    : _targetChrom(targetChrom)
    , _sampleCount(sampleCount)
{}



std::unique_ptr<DosageRecord>
PassThroughConverter::
convert(const vcf_record& vcfr)
{
    using namespace eigenconv::common;

    if (vcfr.chrom != _targetChrom)
    {
        std::ostringstream oss;
        oss << "VCF record at " << vcfr.chrom << ":" << vcfr.pos
            << " is not on the target chromosome '" << _targetChrom << "'";
        BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
    }

    getVcfDosages(vcfr, _dosages);

    if (_dosages.size() != _sampleCount)
    {
        std::ostringstream oss;
        oss << "Inconsistent number of genotypes in VCF record at " << vcfr.chrom << ":" << vcfr.pos
            << ". Expected " << _sampleCount << " genotypes from VCF header but found " << _dosages.size();
        BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
    }

    if ((vcfr.ref.size() != 1) || (vcfr.alt.size() != 1) || (vcfr.alt[0].size() != 1))
    {
        std::ostringstream oss;
        oss << "VCF record at " << vcfr.chrom << ":" << vcfr.pos << " is not a biallelic SNV";
        BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
    }

    return std::unique_ptr<DosageRecord>(
               new DosageRecord(vcfr.chrom, vcfr.pos, vcfr.ref[0], vcfr.alt[0][0], _dosages));
}
