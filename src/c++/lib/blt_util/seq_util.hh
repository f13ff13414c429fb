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
/// \brief nucleotide utilities
///

#pragma once

#include <string>


namespace BASE_ID
{
enum index_t
{
    A,
    C,
    G,
    T,
    ANY,
    SIZE
};
}


inline
BASE_ID::index_t
base_to_id(const char c)
{
    switch (c)
    {
    case 'A':
        return BASE_ID::A;
    case 'C':
        return BASE_ID::C;
    case 'G':
        return BASE_ID::G;
    case 'T':
        return BASE_ID::T;
    default:
        return BASE_ID::ANY;
    }
}


/// true for an upper-case A,C,G or T
inline
bool
is_valid_base(const char c)
{
    return (base_to_id(c) != BASE_ID::ANY);
}


/// true if the two bases are a purine (A<->G) or pyrimidine (C<->T)
/// substitution, false for transversions, identical bases or any
/// non-ACGT base
inline
bool
is_transition(
    const char base1,
    const char base2)
{
    using namespace BASE_ID;
    const index_t id1(base_to_id(base1));
    const index_t id2(base_to_id(base2));
    if ((id1 == ANY) || (id2 == ANY) || (id1 == id2)) return false;
    return (((id1 == A) && (id2 == G)) || ((id1 == G) && (id2 == A)) ||
            ((id1 == C) && (id2 == T)) || ((id1 == T) && (id2 == C)));
}


inline
bool
is_transversion(
    const char base1,
    const char base2)
{
    using namespace BASE_ID;
    const index_t id1(base_to_id(base1));
    const index_t id2(base_to_id(base2));
    if ((id1 == ANY) || (id2 == ANY) || (id1 == id2)) return false;
    return (! is_transition(base1, base2));
}


/// convert a string to upper case in place
void
stoupper(std::string& s);


/// upper case all bases and replace anything outside of ACGT with N
void
standardize_ref_seq(std::string& seq);
