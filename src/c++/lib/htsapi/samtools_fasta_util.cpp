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

#include "htsapi/samtools_fasta_util.hh"

#include "blt_util/seq_util.hh"
#include "common/Exceptions.hh"

#include "htslib/faidx.h"

#include <cerrno>
#include <cstdlib>

#include <sstream>



void
get_chrom_seq(
    const std::string& fastaFilename,
    const std::string& chromName,
    std::string& chromSeq)
{
    using namespace eigenconv::common;

    chromSeq.clear();

    faidx_t* fai(fai_load(fastaFilename.c_str()));
    if (nullptr == fai)
    {
        std::ostringstream oss;
        oss << "Can't load fasta reference (or create its index): '" << fastaFilename << "'";
        BOOST_THROW_EXCEPTION(IoException(errno, oss.str()));
    }

    const int chromLength(faidx_seq_len(fai, chromName.c_str()));
    if (chromLength < 0)
    {
        fai_destroy(fai);
        std::ostringstream oss;
        oss << "Can't find chromosome '" << chromName << "' in fasta reference: '" << fastaFilename << "'";
        BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
    }

    if (chromLength > 0)
    {
        int len(0);
        char* seq(faidx_fetch_seq(fai, chromName.c_str(), 0, chromLength-1, &len));
        if ((nullptr == seq) || (len != chromLength))
        {
            free(seq);
            fai_destroy(fai);
            std::ostringstream oss;
            oss << "Failed to read chromosome '" << chromName << "' from fasta reference: '" << fastaFilename << "'";
            BOOST_THROW_EXCEPTION(IoException(EIO, oss.str()));
        }
        chromSeq.assign(seq, len);
        free(seq);
    }
    fai_destroy(fai);
}



void
getChromReferenceSegment(
    const std::string& fastaFilename,
    const std::string& chromName,
    reference_contig_segment& ref)
{
    ref.set_offset(0);
    get_chrom_seq(fastaFilename, chromName, ref.seq());
    standardize_ref_seq(ref.seq());
}
