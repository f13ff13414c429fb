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

#include "blt_util/log.hh"
#include "blt_util/sig_handler.hh"

#include <csignal>
#include <cstdlib>

#include <iostream>
#include <string>


static std::string progName;
static std::string progCmdline;



static
const char*
getSignalName(const int sig)
{
    switch (sig)
    {
    case SIGTERM:
        return "termination";
    case SIGINT:
        return "interrupt";
    case SIGHUP:
        return "hangup";
    default:
        return "unknown";
    }
}



/// output files are written incrementally, so any fatal signal leaves them truncated
static
void
conversionSignalHandler(int sig)
{
    log_os << "ERROR: " << progName << " received " << getSignalName(sig) << " signal (" << sig << ")."
           << " Eigenstrat output files are incomplete. cmdline: " << progCmdline << std::endl;
    exit(EXIT_FAILURE);
}



void
initializeSignalHandlers(
    const char* progname,
    const char* cmdline)
{
    progName=progname;
    progCmdline=cmdline;

    signal(SIGTERM, conversionSignalHandler);
    signal(SIGINT, conversionSignalHandler);
    signal(SIGHUP, conversionSignalHandler);
}
