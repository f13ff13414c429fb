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

#include "htsapi/hts_streamer.hh"

#include "blt_util/log.hh"
#include "common/Exceptions.hh"

#include <cerrno>
#include <cstdlib>

#include <iostream>
#include <sstream>



hts_streamer::
hts_streamer(
    const char* filename)
    : _stream_name(filename)
{
    _kstr.l = 0;
    _kstr.m = 0;
    _kstr.s = nullptr;

    if (nullptr == filename)
    {
        BOOST_THROW_EXCEPTION(eigenconv::common::InvalidParameterException("hts filename is null ptr"));
    }

    if ('\0' == *filename)
    {
        BOOST_THROW_EXCEPTION(eigenconv::common::InvalidParameterException("hts filename is empty string"));
    }

    _hfp = hts_open(filename, "r");
    if (nullptr == _hfp)
    {
        std::ostringstream oss;
        oss << "Failed to open hts file for reading: '" << filename << "'";
        BOOST_THROW_EXCEPTION(eigenconv::common::IoException(errno, oss.str()));
    }
}



hts_streamer::
~hts_streamer()
{
    if (nullptr != _hfp)
    {
        const int retval(hts_close(_hfp));
        if (retval != 0)
        {
            log_os << "WARNING: Failed to close hts file: '" << name() << "'\n";
        }
    }
    free(_kstr.s);
}



bool
hts_streamer::
next_line()
{
    if (_is_stream_end) return false;

    const int retval(hts_getline(_hfp, KS_SEP_LINE, &_kstr));
    if (retval == -1)
    {
        _is_stream_end = true;
        return false;
    }
    else if (retval < -1)
    {
        std::ostringstream oss;
        oss << "Unexpected read failure in hts file: '" << name() << "' after line " << _line_no;
        BOOST_THROW_EXCEPTION(eigenconv::common::IoException(EIO, oss.str()));
    }

    _line_no++;
    return true;
}



void
hts_streamer::
report_line_state(std::ostream& os) const
{
    os << "\tfile: '" << name() << "'\n"
       << "\tline_no: " << _line_no << "\n";
    if ((_line_no > 0) && (nullptr != _kstr.s))
    {
        os << "\tline: '" << _kstr.s << "'\n";
    }
}
