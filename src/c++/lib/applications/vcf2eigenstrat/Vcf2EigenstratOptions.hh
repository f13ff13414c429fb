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

#include <string>


struct Vcf2EigenstratOptions
{
    /// the output chromosome label, which defaults to the target chromosome
    const std::string&
    getOutChrom() const
    {
        if (outChrom.empty()) return chrom;
        return outChrom;
    }

    bool
    isSnpPanel() const
    {
        return (! snpFilename.empty());
    }

    //========= input files:
    /// VCF input, "-" for stdin
    std::string vcfFilename = "-";

    /// optional Eigenstrat SNP file used as the panel of output sites
    std::string snpFilename;

    /// optional fasta reference used to fill panel sites missing from the VCF
    std::string referenceFilename;

    //========= output:
    std::string outPrefix;

    /// chromosome to convert
    std::string chrom;

    /// optional chromosome label to write in place of chrom
    std::string outChrom;

    bool isTransversionsOnly = false;
};
