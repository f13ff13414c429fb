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

#include "conversion/SnpPanelReconciler.hh"
#include "conversion/VcfDosageUtil.hh"

#include "common/Exceptions.hh"

#include <algorithm>
#include <sstream>



ALLELE_MATCH::index_t
normalizeDosageOrientation(
    const EigenstratSnpRecord& snp,
    const vcf_record& vcfr,
    DosageVector& dosages)
{
    ALLELE_MATCH::index_t matchType(ALLELE_MATCH::MISMATCH);

    const bool isBiallelicSnv((vcfr.ref.size() == 1) &&
                              (vcfr.alt.size() == 1) &&
                              (vcfr.alt[0].size() == 1));
    if (isBiallelicSnv)
    {
        const char ref(vcfr.ref[0]);
        const char alt(vcfr.alt[0][0]);
        if ((ref == snp.ref) && (alt == snp.alt))
        {
            matchType = ALLELE_MATCH::MATCH;
        }
        else if ((ref == snp.alt) && (alt == snp.ref))
        {
            matchType = ALLELE_MATCH::FLIP;
        }
    }

    switch (matchType)
    {
    case ALLELE_MATCH::MATCH:
        break;
    case ALLELE_MATCH::FLIP:
        std::transform(dosages.begin(), dosages.end(), dosages.begin(), DOSAGE::flip);
        break;
    default:
        std::fill(dosages.begin(), dosages.end(), DOSAGE::MISSING);
        break;
    }
    return matchType;
}



SnpPanelReconciler::
SnpPanelReconciler(
    const unsigned sampleCount,
    const reference_contig_segment* refSegmentPtr,
    ConversionStats& stats)
    : _sampleCount(sampleCount)
    , _refSegmentPtr(refSegmentPtr)
    , _stats(stats)
{}



std::unique_ptr<DosageRecord>
SnpPanelReconciler::
reconcile(const pair_t& pair)
{
    switch (pair.type())
    {
    case MERGE_PAIR_TYPE::LEFT_ONLY:
        return reconcilePanelOnly(pair.left());
    case MERGE_PAIR_TYPE::BOTH:
        return reconcileMatched(pair.left(), pair.right());
    default:
        _stats.observedDropped++;
        return std::unique_ptr<DosageRecord>();
    }
}



std::unique_ptr<DosageRecord>
SnpPanelReconciler::
reconcilePanelOnly(const EigenstratSnpRecord& snp)
{
    DOSAGE::index_t dosage(DOSAGE::MISSING);
    if (_refSegmentPtr != nullptr)
    {
        // panel positions are 1-indexed
        const char refBase(_refSegmentPtr->get_base(snp.pos-1));
        if (refBase == snp.ref)
        {
            dosage = DOSAGE::REF;
        }
        else if (refBase == snp.alt)
        {
            dosage = DOSAGE::HOM_ALT;
        }
    }

    if (dosage == DOSAGE::MISSING)
    {
        _stats.panelOnlyMissing++;
    }
    else
    {
        _stats.panelOnlyRefFilled++;
    }

    return std::unique_ptr<DosageRecord>(
               new DosageRecord(snp.chrom, snp.pos, snp.ref, snp.alt,
                                DosageVector(_sampleCount, dosage)));
}



std::unique_ptr<DosageRecord>
SnpPanelReconciler::
reconcileMatched(
    const EigenstratSnpRecord& snp,
    const vcf_record& vcfr)
{
    using namespace eigenconv::common;

    getVcfDosages(vcfr, _dosages);

    if (_dosages.size() != _sampleCount)
    {
        std::ostringstream oss;
        oss << "Inconsistent number of genotypes in VCF record at " << vcfr.chrom << ":" << vcfr.pos
            << ". Expected " << _sampleCount << " genotypes from VCF header but found " << _dosages.size();
        BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
    }

    if (snp.chrom != vcfr.chrom)
    {
        std::ostringstream oss;
        oss << "Chromosome mismatch at position " << snp.pos << ": SNP file record '" << snp.snpId
            << "' is on chromosome '" << snp.chrom << "' but the VCF record is on chromosome '"
            << vcfr.chrom << "'";
        BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
    }

    switch (normalizeDosageOrientation(snp, vcfr, _dosages))
    {
    case ALLELE_MATCH::MATCH:
        _stats.alleleMatches++;
        break;
    case ALLELE_MATCH::FLIP:
        _stats.alleleFlips++;
        break;
    default:
        _stats.alleleMismatches++;
        break;
    }

    return std::unique_ptr<DosageRecord>(
               new DosageRecord(snp.chrom, snp.pos, snp.ref, snp.alt, _dosages));
}
