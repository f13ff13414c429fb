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
/// \brief line-oriented reader for any text file htslib can open
///

#pragma once

#include "htslib/hts.h"
#include "htslib/kstring.h"

#include "boost/utility.hpp"

#include <iosfwd>
#include <string>


/// Base class for the tab/whitespace delimited text streamers
///
/// Plain and bgzip/gzip compressed input are both accepted. The filename
/// "-" reads from stdin.
///
struct hts_streamer : private boost::noncopyable
{
    explicit
    hts_streamer(
        const char* filename);

    ~hts_streamer();

    const char*
    name() const
    {
        return _stream_name.c_str();
    }

protected:
    /// read the next line into the internal buffer, returns false at end of input
    bool
    next_line();

    /// current line, without the line terminator
    const char*
    get_line() const
    {
        return _kstr.s;
    }

    void
    report_line_state(std::ostream& os) const;

    bool _is_stream_end = false;

private:
    std::string _stream_name;
    htsFile* _hfp = nullptr;
    kstring_t _kstr;
    unsigned _line_no = 0;
};
