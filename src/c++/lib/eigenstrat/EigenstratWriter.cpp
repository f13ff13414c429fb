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

#include "eigenstrat/EigenstratWriter.hh"

#include "common/Exceptions.hh"

#include <cerrno>

#include <sstream>



static
void
openOutputFile(
    const std::string& filename,
    std::ofstream& ofs)
{
    ofs.open(filename.c_str());
    if (! ofs)
    {
        std::ostringstream oss;
        oss << "Can't open output file: '" << filename << "'";
        BOOST_THROW_EXCEPTION(eigenconv::common::IoException(errno, oss.str()));
    }
}



static
void
checkOutputFile(
    const std::string& filename,
    const std::ofstream& ofs)
{
    if (! ofs)
    {
        std::ostringstream oss;
        oss << "Failed to write to output file: '" << filename << "'";
        BOOST_THROW_EXCEPTION(eigenconv::common::IoException(EIO, oss.str()));
    }
}



EigenstratWriter::
EigenstratWriter(
    const std::string& outPrefix,
    const std::vector<std::string>& sampleNames)
    : _genoFilename(getGenoFilename(outPrefix))
    , _snpFilename(getSnpFilename(outPrefix))
    , _sampleCount(sampleNames.size())
{
    {
        static const char sep('\t');
        static const char unknownSex('U');
        static const char unknownPopulation[] = "Unknown";

        const std::string indFilename(getIndFilename(outPrefix));
        std::ofstream indOs;
        openOutputFile(indFilename, indOs);
        for (const std::string& sampleName : sampleNames)
        {
            indOs << sampleName << sep << unknownSex << sep << unknownPopulation << '\n';
        }
        indOs.flush();
        checkOutputFile(indFilename, indOs);
    }

    openOutputFile(_genoFilename, _genoOs);
    openOutputFile(_snpFilename, _snpOs);
}



void
EigenstratWriter::
write(
    const EigenstratSnpRecord& snp,
    const GenoLine& geno)
{
    if (geno.size() != _sampleCount)
    {
        std::ostringstream oss;
        oss << "Genotype count (" << geno.size() << ") at site '" << snp.snpId
            << "' does not match sample count (" << _sampleCount << ")";
        BOOST_THROW_EXCEPTION(eigenconv::common::LogicException(oss.str()));
    }

    _snpOs << snp << '\n';

    for (const GENO_CALL::index_t call : geno)
    {
        _genoOs << GENO_CALL::eigenstratCode(call);
    }
    _genoOs << '\n';

    checkOutputFile(_snpFilename, _snpOs);
    checkOutputFile(_genoFilename, _genoOs);
}



void
EigenstratWriter::
flush()
{
    _snpOs.flush();
    _genoOs.flush();
    checkOutputFile(_snpFilename, _snpOs);
    checkOutputFile(_genoFilename, _genoOs);
}
