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

#include "conversion/EigenstratEncoder.hh"

#include "common/Exceptions.hh"

#include "boost/lexical_cast.hpp"

#include <sstream>



GENO_CALL::index_t
getGenoCall(const DOSAGE::index_t dosage)
{
    switch (dosage)
    {
    case DOSAGE::REF:
        return GENO_CALL::HOM_REF;
    case DOSAGE::HET:
        return GENO_CALL::HET;
    case DOSAGE::HOM_ALT:
        return GENO_CALL::HOM_ALT;
    case DOSAGE::MISSING:
        return GENO_CALL::MISSING;
    default:
    {
        using namespace eigenconv::common;
        std::ostringstream oss;
        oss << "Unrecognized dosage value: " << static_cast<int>(dosage);
        BOOST_THROW_EXCEPTION(LogicException(oss.str()));
    }
    }
}



void
getGenoLine(
    const DosageVector& dosages,
    GenoLine& geno)
{
    geno.clear();
    for (const DOSAGE::index_t dosage : dosages)
    {
        geno.push_back(getGenoCall(dosage));
    }
}



void
getEigenstratSnpRecord(
    const std::string& outChrom,
    const DosageRecord& record,
    EigenstratSnpRecord& snp)
{
    snp.clear();
    snp.snpId = outChrom + "_" + boost::lexical_cast<std::string>(record.pos);
    snp.chrom = outChrom;
    snp.geneticPos = 0.;
    snp.pos = record.pos;
    snp.ref = record.ref;
    snp.alt = record.alt;
}



EigenstratEncoder::
EigenstratEncoder(
    const std::string& outChrom,
    EigenstratRecordSink& recordSink,
    ConversionStats& stats)
    : dosage_pipe_stage_base()
    , _outChrom(outChrom)
    , _recordSink(recordSink)
    , _stats(stats)
{}



void
EigenstratEncoder::
process(std::unique_ptr<DosageRecord> record)
{
    getEigenstratSnpRecord(_outChrom, *record, _snp);
    getGenoLine(record->dosages, _geno);
    _recordSink.write(_snp, _geno);
    _stats.sitesWritten++;
}
