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
/// \brief final pipeline stage, encode dosage records as Eigenstrat output records
///

#pragma once

#include "conversion/ConversionStats.hh"
#include "conversion/dosage_pipe_stage_base.hh"
#include "eigenstrat/EigenstratGenotype.hh"
#include "eigenstrat/EigenstratSnpRecord.hh"
#include "eigenstrat/EigenstratWriter.hh"

#include <string>


/// throws LogicException for a value outside of the dosage enumeration
GENO_CALL::index_t
getGenoCall(const DOSAGE::index_t dosage);


void
getGenoLine(
    const DosageVector& dosages,
    GenoLine& geno);


/// site descriptor for a record, with id "<outChrom>_<pos>" and genetic position 0
void
getEigenstratSnpRecord(
    const std::string& outChrom,
    const DosageRecord& record,
    EigenstratSnpRecord& snp);



/// encodes each record and hands it to the record sink
///
/// this is a terminal stage, nothing is passed downstream
///
class EigenstratEncoder : public dosage_pipe_stage_base
{
public:
    /// \param[in] outChrom chromosome label written to the output
    EigenstratEncoder(
        const std::string& outChrom,
        EigenstratRecordSink& recordSink,
        ConversionStats& stats);

    void process(std::unique_ptr<DosageRecord> record) override;

private:
    const std::string _outChrom;
    EigenstratRecordSink& _recordSink;
    ConversionStats& _stats;

    EigenstratSnpRecord _snp;
    GenoLine _geno;
};
