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

#pragma once

#include "conversion/DosageRecord.hh"
#include "htsapi/vcf_record.hh"

#include <memory>
#include <string>


/// converts each observed VCF record directly to a dosage record in its
/// own allele orientation, used when no SNP panel is given
///
struct PassThroughConverter
{
    PassThroughConverter(
        const std::string& targetChrom,
        const unsigned sampleCount);

    /// throws if the record is off the target chromosome, is not a
    /// biallelic SNV, or does not have one valid genotype per sample
    std::unique_ptr<DosageRecord>
    convert(const vcf_record& vcfr);

private:
    const std::string _targetChrom;
    const unsigned _sampleCount;
    DosageVector _dosages;
};
