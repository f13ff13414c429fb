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

#include "eigenstrat/EigenstratSnpRecord.hh"
#include "htsapi/hts_streamer.hh"

#include <iosfwd>
#include <string>
#include <vector>


/// Stream records from an Eigenstrat .snp file (plain or compressed)
///
/// Columns are separated by any run of spaces or tabs:
///
///   snpId chrom geneticPos pos ref alt
///
/// Records on chromosomes other than the filter chromosome (if given) are skipped.
///
struct EigenstratSnpStreamer : public hts_streamer
{
    typedef EigenstratSnpRecord record_type;

    /// \param[in] chromFilter if non-empty, only records on this chromosome are returned
    explicit
    EigenstratSnpStreamer(
        const char* filename,
        const std::string& chromFilter = "");

    /// advance to the next record, returns false at the end of the stream
    bool
    next();

    const EigenstratSnpRecord*
    get_record_ptr() const
    {
        if (_is_record_set) return &_snprec;
        else                return nullptr;
    }

    /// number of records parsed so far, including those skipped by the chromosome filter
    unsigned
    record_no() const
    {
        return _record_no;
    }

    void
    report_state(std::ostream& os) const;

private:
    void
    parseLine(const char* line);

    std::string _chromFilter;
    bool _is_record_set = false;
    unsigned _record_no = 0;
    std::vector<std::string> _words;
    EigenstratSnpRecord _snprec;
};
