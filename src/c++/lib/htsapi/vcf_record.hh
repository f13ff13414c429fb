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

#include "blt_util/blt_types.hh"

#include <iosfwd>
#include <string>
#include <vector>


/// a single VCF data line, split into the fields needed for genotype conversion
///
struct vcf_record
{
    vcf_record()
    {
        clear();
    }

    /// set record from record string s, return false on error
    bool
    set(const char* s);

    void
    clear()
    {
        chrom.clear();
        pos=0;
        ref.clear();
        alt.clear();
        format.clear();
        samples.clear();
    }

    /// true for a record with no ALT allele ('.')
    bool
    is_ref_site() const
    {
        return ((alt.size() == 1) && (alt[0] == "."));
    }

    /// a single-base ACGT REF with exactly one single-base ACGT ALT
    bool
    is_biallelic_snp() const;

    unsigned
    sample_count() const
    {
        return samples.size();
    }

    /// the GT value of a sample, with any trailing FORMAT values still attached
    ///
    /// GT must be the first FORMAT key, an exception is thrown otherwise
    const char*
    get_gt(const unsigned sampleIndex) const;

    std::string chrom;
    pos_t pos;
    std::string ref;
    std::vector<std::string> alt;
    std::string format;
    std::vector<std::string> samples;
};


std::ostream& operator<<(std::ostream& os, const vcf_record& vcfr);
