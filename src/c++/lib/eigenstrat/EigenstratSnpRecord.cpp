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

#include "eigenstrat/EigenstratSnpRecord.hh"

#include <iostream>



std::ostream&
operator<<(std::ostream& os, const EigenstratSnpRecord& snp)
{
    static const char sep('\t');
    os << snp.snpId << sep
       << snp.chrom << sep
       << snp.geneticPos << sep
       << snp.pos << sep
       << snp.ref << sep
       << snp.alt;
    return os;
}
