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

#include "vcf2eigenstrat_info.hh"
#include "Vcf2EigenstratOptionsParser.hh"

#include "blt_util/log.hh"

#include <cstdlib>

#include <iostream>



void
vcf2eigenstrat_info::
usage(const char* xmessage) const
{
    std::ostream& os(log_os);

    static Vcf2EigenstratOptions default_opt;
    static const po::options_description visible(getVcf2EigenstratOptionsParser(default_opt));

    os <<
       "\n" << name() << " - convert VCF genotypes for one chromosome to Eigenstrat format\n"
       "\tversion: " << version() << "\n"
       "\n"
       "Biallelic SNV genotypes are read from a VCF file and written as Eigenstrat\n"
       ".geno.txt, .snp.txt and .ind.txt files. When an Eigenstrat SNP file is given,\n"
       "exactly the SNP file sites of the target chromosome are written, with genotypes\n"
       "oriented to the SNP file alleles.\n"
       "\n"
       "usage: " << name() << " [options]\n\n" << visible << "\n";

    if (xmessage)
    {
        os << "\n"
           << "******** COMMAND-LINE ERROR:: " << xmessage << " ********\n"
           << "\n";
        exit(EXIT_FAILURE);
    }

    exit(EXIT_SUCCESS);
}
