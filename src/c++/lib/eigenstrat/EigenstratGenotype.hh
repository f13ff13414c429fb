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
/// \brief categorical genotype calls written to the Eigenstrat .geno file
///

#pragma once

#include <vector>


namespace GENO_CALL
{
enum index_t
{
    HOM_REF,
    HET,
    HOM_ALT,
    MISSING,
    SIZE
};

/// .geno files count reference alleles, with 9 for missing data
inline
char
eigenstratCode(const index_t i)
{
    switch (i)
    {
    case HOM_REF:
        return '2';
    case HET:
        return '1';
    case HOM_ALT:
        return '0';
    default:
        return '9';
    }
}
}


/// per-sample calls for one site, in sample order
typedef std::vector<GENO_CALL::index_t> GenoLine;
