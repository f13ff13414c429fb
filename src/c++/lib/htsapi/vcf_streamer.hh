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

#include "htsapi/hts_streamer.hh"
#include "htsapi/vcf_record.hh"

#include <iosfwd>
#include <string>
#include <vector>


/// Stream VCF records from a plain or bgzip compressed VCF file, or stdin ("-")
///
/// The header is read on construction, so that sample names are available
/// before the first record is requested. A header without sample columns is
/// rejected at this point.
///
struct vcf_streamer : public hts_streamer
{
    typedef vcf_record record_type;

    /// \param[in] isBiallelicSnpOnly If true, records which are not biallelic SNVs are skipped
    explicit
    vcf_streamer(
        const char* filename,
        const bool isBiallelicSnpOnly = false);

    /// advance to the next record, returns false at the end of the stream
    bool
    next();

    const vcf_record*
    get_record_ptr() const
    {
        if (_is_record_set) return &_vcfrec;
        else                return nullptr;
    }

    const std::vector<std::string>&
    getSampleNames() const
    {
        return _sampleNames;
    }

    unsigned
    getSampleCount() const
    {
        return _sampleNames.size();
    }

    /// number of data records parsed so far, including any skipped by the biallelic filter
    unsigned
    record_no() const
    {
        return _record_no;
    }

    void
    report_state(std::ostream& os) const;

private:
    void
    loadHeader();

    bool _isBiallelicSnpOnly;
    bool _is_record_set = false;
    bool _isLineBuffered = false;
    unsigned _record_no = 0;
    std::vector<std::string> _sampleNames;
    vcf_record _vcfrec;
};
