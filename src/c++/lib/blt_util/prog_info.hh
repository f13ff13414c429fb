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
/// \brief Program identity and usage interface shared by the command-line front ends
///

#pragma once


struct prog_info
{
    virtual
    const char* name() const = 0;

    virtual
    const char* version() const = 0;

    /// write the program description and options to log_os and exit
    ///
    /// When xmessage is set it is reported as a command-line error and the
    /// process exits with a failure status.
    virtual
    void usage(const char* xmessage = nullptr) const = 0;

protected:
    prog_info() {}
    virtual ~prog_info() {}
};
