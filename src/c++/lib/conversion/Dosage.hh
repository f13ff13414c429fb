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
/// \brief per-sample alternate allele dosage
///

#pragma once

#include <vector>


namespace DOSAGE
{
/// count of alternate allele copies carried by one sample
enum index_t
{
    REF,
    HET,
    HOM_ALT,
    MISSING,
    SIZE
};

/// dosage after swapping which allele is reference and which is alternate
///
/// unrecognized values map to MISSING
inline
index_t
flip(const index_t i)
{
    switch (i)
    {
    case REF:
        return HOM_ALT;
    case HET:
        return HET;
    case HOM_ALT:
        return REF;
    default:
        return MISSING;
    }
}
}


/// one dosage per sample, in sample order
typedef std::vector<DOSAGE::index_t> DosageVector;
