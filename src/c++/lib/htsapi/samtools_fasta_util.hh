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
/// \brief fasta reference access through htslib faidx
///

#pragma once

#include "blt_util/reference_contig_segment.hh"

#include <string>


/// Get the full sequence of one chromosome from a fasta file
///
/// The fasta index (.fai) is created by htslib if it does not already exist.
/// An exception is thrown if the chromosome is not found.
///
void
get_chrom_seq(
    const std::string& fastaFilename,
    const std::string& chromName,
    std::string& chromSeq);


/// Load one chromosome into a zero-offset reference segment, with all bases
/// standardized to upper-case ACGTN
///
void
getChromReferenceSegment(
    const std::string& fastaFilename,
    const std::string& chromName,
    reference_contig_segment& ref);
