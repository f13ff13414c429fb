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

#include "eigenstrat/EigenstratGenotype.hh"
#include "eigenstrat/EigenstratSnpRecord.hh"

#include "boost/utility.hpp"

#include <fstream>
#include <string>
#include <vector>


/// Anything which can accept encoded Eigenstrat site records
///
struct EigenstratRecordSink
{
    virtual
    ~EigenstratRecordSink() {}

    virtual
    void
    write(
        const EigenstratSnpRecord& snp,
        const GenoLine& geno) = 0;
};



/// Writes the Eigenstrat .geno.txt, .snp.txt and .ind.txt files for an output prefix
///
/// The .ind.txt file is written in full on construction, site records are
/// appended to the .geno.txt and .snp.txt files as they are written.
///
struct EigenstratWriter : public EigenstratRecordSink, private boost::noncopyable
{
    EigenstratWriter(
        const std::string& outPrefix,
        const std::vector<std::string>& sampleNames);

    void
    write(
        const EigenstratSnpRecord& snp,
        const GenoLine& geno) override;

    /// flush all output and check for write errors
    void
    flush();

    static
    std::string
    getGenoFilename(const std::string& outPrefix)
    {
        return outPrefix + ".geno.txt";
    }

    static
    std::string
    getSnpFilename(const std::string& outPrefix)
    {
        return outPrefix + ".snp.txt";
    }

    static
    std::string
    getIndFilename(const std::string& outPrefix)
    {
        return outPrefix + ".ind.txt";
    }

private:
    std::string _genoFilename;
    std::string _snpFilename;
    std::ofstream _genoOs;
    std::ofstream _snpOs;
    unsigned _sampleCount;
};
