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

#include "blt_util/seq_util.hh"

#include <cctype>

#include <algorithm>



void
stoupper(std::string& s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](const unsigned char c)
    {
        return static_cast<char>(toupper(c));
    });
}



void
standardize_ref_seq(std::string& seq)
{
    for (char& c : seq)
    {
        c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
        if (! is_valid_base(c)) c = 'N';
    }
}
