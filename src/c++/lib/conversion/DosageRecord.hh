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

#include "conversion/Dosage.hh"
#include "blt_util/blt_types.hh"

#include <string>


/// a biallelic site with one normalized dosage per sample
///
/// When a reference panel is in use the alleles are always in panel
/// orientation. Records are immutable once created.
///
struct DosageRecord
{
    DosageRecord(
        const std::string& initChrom,
        const pos_t initPos,
        const char initRef,
        const char initAlt,
        const DosageVector& initDosages)
        : chrom(initChrom)
        , pos(initPos)
        , ref(initRef)
        , alt(initAlt)
        , dosages(initDosages)
    {}

    const std::string chrom;
    const pos_t pos;
    const char ref;
    const char alt;
    const DosageVector dosages;
};
