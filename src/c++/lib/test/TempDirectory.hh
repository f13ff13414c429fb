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
/// \brief scratch directory and file helpers shared by unit tests
///

#pragma once

#include "boost/filesystem.hpp"

#include <fstream>
#include <sstream>
#include <string>


/// creates a unique temporary directory, removed with its contents on destruction
struct TempDirectory
{
    TempDirectory()
        : path(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("eigenconv-%%%%-%%%%-%%%%"))
    {
        boost::filesystem::create_directories(path);
    }

    ~TempDirectory()
    {
        boost::system::error_code ec;
        boost::filesystem::remove_all(path, ec);
    }

    boost::filesystem::path path;
};


inline
std::string
readTestFile(const std::string& filename)
{
    std::ifstream ifs(filename.c_str());
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}
