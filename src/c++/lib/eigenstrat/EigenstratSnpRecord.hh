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


/// one line of an Eigenstrat .snp file
///
struct EigenstratSnpRecord
{
    void
    clear()
    {
        snpId.clear();
        chrom.clear();
        geneticPos=0.;
        pos=0;
        ref='N';
        alt='N';
    }

    std::string snpId;
    std::string chrom;
    /// genetic distance, carried through but never used for conversion
    double geneticPos = 0.;
    pos_t pos = 0;
    char ref = 'N';
    char alt = 'N';
};


/// write the record in .snp file layout (no line terminator)
std::ostream& operator<<(std::ostream& os, const EigenstratSnpRecord& snp);
