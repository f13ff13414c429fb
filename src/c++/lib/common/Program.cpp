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

#include "common/Program.hh"
#include "common/Exceptions.hh"
#include "blt_util/log.hh"
#include "blt_util/sig_handler.hh"

#include "config.h"

#include <cstdlib>

#include <iostream>
#include <string>


static
void
dump_cl(
    int argc,
    char* argv[],
    std::ostream& os)
{
    os << "cmdline:";
    for (int i(0); i<argc; ++i)
    {
        os << ' ' << argv[i];
    }
    os << '\n';
}



namespace eigenconv
{

const char*
Program::
version() const
{
    return EIGENCONV_VERSION;
}



const char*
Program::
compiler() const
{
    return EIGENCONV_CXX_COMPILER;
}



const char*
Program::
buildTime() const
{
    return EIGENCONV_BUILD_TIME;
}



int
Program::
run(int argc, char* argv[]) const
{
    try
    {
        std::string cmdline;
        for (int i(0); i<argc; ++i)
        {
            if (i) cmdline += ' ';
            cmdline += argv[i];
        }
        initializeSignalHandlers(name(), cmdline.c_str());

        runInternal(argc, argv);
    }
    catch (const common::ExceptionData& e)
    {
        log_os << "FATAL_ERROR: " << name() << " EXCEPTION: "
               << e.getContext() << "\n"
               << "...caught in program.run()\n";
        dump_cl(argc, argv, log_os);
        return EXIT_FAILURE;
    }
    catch (const boost::exception& e)
    {
        log_os << "FATAL_ERROR: " << name() << " EXCEPTION: "
               << boost::diagnostic_information(e) << "\n"
               << "...caught in program.run()\n";
        dump_cl(argc, argv, log_os);
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        log_os << "FATAL_ERROR: " << name() << " EXCEPTION: "
               << e.what() << "\n"
               << "...caught in program.run()\n";
        dump_cl(argc, argv, log_os);
        return EXIT_FAILURE;
    }
    catch (...)
    {
        log_os << "FATAL_ERROR: " << name() << " UNKNOWN EXCEPTION\n"
               << "...caught in program.run()\n";
        dump_cl(argc, argv, log_os);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

}
