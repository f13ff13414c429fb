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

#include "conversion/Dosage.hh"
#include "htsapi/vcf_record.hh"


/// convert a single VCF GT value to an alternate allele dosage
///
/// haploid and diploid calls are accepted. Any call with a missing allele
/// or an allele index above one is MISSING. Malformed GT values throw.
///
DOSAGE::index_t
getGtDosage(const char* gt);


/// extract one dosage per sample from a VCF record
///
/// throws if the record has no samples, if GT is not the first FORMAT key,
/// or if any GT value is malformed
///
void
getVcfDosages(
    const vcf_record& vcfr,
    DosageVector& dosages);
