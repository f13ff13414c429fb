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

#include "Vcf2EigenstratOptionsParser.hh"

#include "blt_util/log.hh"

#include "boost/filesystem.hpp"

#include <iostream>



po::options_description
getVcf2EigenstratOptionsParser(
    Vcf2EigenstratOptions& opt)
{
    po::options_description input_opt("Input options");
    input_opt.add_options()
    ("vcf", po::value(&opt.vcfFilename)->default_value(opt.vcfFilename),
     "VCF file containing biallelic SNV genotypes, plain or bgzip compressed. Use '-' to read from stdin")
    ("snp-file,f", po::value(&opt.snpFilename),
     "Eigenstrat SNP file defining the sites to output. If given, only these sites are written, VCF alleles are matched to the SNP file alleles and VCF records at other positions are ignored")
    ("fill-hom-ref,r", po::value(&opt.referenceFilename),
     "fasta reference file, used to fill SNP file sites missing from the VCF with homozygous reference or alternate calls, depending on which allele matches the reference base. Only used with --snp-file")
    ("chrom,c", po::value(&opt.chrom),
     "chromosome to convert (required)")
    ;

    po::options_description output_opt("Output options");
    output_opt.add_options()
    ("out-prefix,e", po::value(&opt.outPrefix),
     "prefix for the Eigenstrat output files <prefix>.geno.txt, <prefix>.snp.txt and <prefix>.ind.txt (required)")
    ("out-chrom", po::value(&opt.outChrom),
     "chromosome label written to the output (default: value of --chrom)")
    ("transversions-only,t", po::bool_switch(&opt.isTransversionsOnly),
     "output only transversion sites")
    ;

    // final assembly
    po::options_description visible("Options");
    visible.add(input_opt).add(output_opt);

    po::options_description help_parse_opt("Help");
    help_parse_opt.add_options()
    ("version", "print the program version")
    ("help,h","print this message");

    visible.add(help_parse_opt);

    return visible;
}



static
void
checkInputFile(
    const prog_info& pinfo,
    const std::string& filename,
    const char* label)
{
    if (! boost::filesystem::exists(filename))
    {
        const std::string msg(std::string("Can't find ") + label + " file: '" + filename + "'");
        pinfo.usage(msg.c_str());
    }
}



void
finalizeVcf2EigenstratOptions(
    const prog_info& pinfo,
    const po::variables_map& /*vm*/,
    Vcf2EigenstratOptions& opt)
{
    if (opt.chrom.empty())
    {
        pinfo.usage("Must specify the chromosome to convert");
    }

    if (opt.outPrefix.empty())
    {
        pinfo.usage("Must specify an output prefix");
    }

    if (opt.vcfFilename.empty())
    {
        pinfo.usage("Must specify a VCF file or '-' for stdin");
    }
    if (opt.vcfFilename != "-")
    {
        checkInputFile(pinfo, opt.vcfFilename, "VCF");
    }

    if (opt.isSnpPanel())
    {
        checkInputFile(pinfo, opt.snpFilename, "SNP");
    }

    if (! opt.referenceFilename.empty())
    {
        checkInputFile(pinfo, opt.referenceFilename, "reference fasta");
        if (! opt.isSnpPanel())
        {
            log_os << "WARNING: reference fasta file is only used with a SNP file, ignoring reference: '"
                   << opt.referenceFilename << "'\n";
        }
    }
}
