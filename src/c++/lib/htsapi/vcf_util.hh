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
///
/// \brief VCF utilities
///

#pragma once

#include <cstring>

#include <vector>


namespace VCFID
{
enum index_t
{
    CHROM,
    POS,
    ID,
    REF,
    ALT,
    QUAL,
    FILT,
    INFO,
    FORMAT,
    SAMPLE,
    SIZE
};
}



/// look for 'key' in vcf FORMAT field, provide index of key or return
/// false
///
inline
bool
get_format_key_index(
    const char* format,
    const char* key,
    unsigned& index)
{
    const size_t keylen(strlen(key));
    index=0;
    do
    {
        if (index>0) format++;
        if ((0==strncmp(format,key,keylen)) &&
            ((format[keylen] == ':') || (format[keylen] == '\0')))
        {
            return true;
        }
        index++;
    }
    while (nullptr != (format=strchr(format,':')));
    return false;
}



/// parse the allele indices of a VCF GT value
///
/// parsing stops at the end of the string or at the first ':'. Alleles may be
/// separated by either '/' or '|'. Missing alleles ('.') are returned as -1.
///
/// throws if any other character is found, unless is_allow_bad_end_char
/// is set, in which case parsing stops at the first unexpected character
///
void
parse_gt(
    const char* gt,
    std::vector<int>& gti,
    const bool is_allow_bad_end_char=false);
