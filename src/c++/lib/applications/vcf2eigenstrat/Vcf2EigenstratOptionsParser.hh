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

#include "Vcf2EigenstratOptions.hh"

#include "blt_util/prog_info.hh"

#include "boost/program_options.hpp"

namespace po = boost::program_options;


po::options_description
getVcf2EigenstratOptionsParser(
    Vcf2EigenstratOptions& opt);


/// validate options and exit with usage on error
void
finalizeVcf2EigenstratOptions(
    const prog_info& pinfo,
    const po::variables_map& vm,
    Vcf2EigenstratOptions& opt);
