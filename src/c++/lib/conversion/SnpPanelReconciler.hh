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
/// \brief reconcile observed VCF genotypes against a fixed panel of SNP sites
///

#pragma once

#include "blt_util/OrderedMergeStreamer.hh"
#include "blt_util/reference_contig_segment.hh"
#include "conversion/ConversionStats.hh"
#include "conversion/DosageRecord.hh"
#include "eigenstrat/EigenstratSnpRecord.hh"
#include "htsapi/vcf_record.hh"

#include <memory>


/// merge key comparison of panel and observed records, by position only
///
struct SnpVcfPositionCompare
{
    int
    operator()(
        const EigenstratSnpRecord& snp,
        const vcf_record& vcfr) const
    {
        if (snp.pos < vcfr.pos) return -1;
        if (snp.pos > vcfr.pos) return 1;
        return 0;
    }
};


namespace ALLELE_MATCH
{
enum index_t
{
    MATCH,
    FLIP,
    MISMATCH
};
}

/// rewrite observed dosages into the panel's allele orientation
///
/// \param[in] vcfr observed record at the panel site
/// \param[in,out] dosages dosages of vcfr, replaced by the normalized dosages
///
/// \returns the orientation relationship found between panel and observed alleles
///
ALLELE_MATCH::index_t
normalizeDosageOrientation(
    const EigenstratSnpRecord& snp,
    const vcf_record& vcfr,
    DosageVector& dosages);



/// Produces one normalized dosage record per panel site from the merge-join of
/// the panel and the observed VCF records
///
/// panel sites without an observed record are filled from the reference
/// sequence when one is provided, observed records without a panel site
/// are dropped.
///
struct SnpPanelReconciler
{
    typedef MergePair<EigenstratSnpRecord, vcf_record> pair_t;

    /// \param[in] refSegmentPtr reference sequence of the target chromosome,
    ///                          may be null if no reference is available
    SnpPanelReconciler(
        const unsigned sampleCount,
        const reference_contig_segment* refSegmentPtr,
        ConversionStats& stats);

    /// returns the normalized record for this pair, or a null pointer when
    /// the pair produces no output
    std::unique_ptr<DosageRecord>
    reconcile(const pair_t& pair);

private:
    std::unique_ptr<DosageRecord>
    reconcilePanelOnly(const EigenstratSnpRecord& snp);

    std::unique_ptr<DosageRecord>
    reconcileMatched(
        const EigenstratSnpRecord& snp,
        const vcf_record& vcfr);

    const unsigned _sampleCount;
    const reference_contig_segment* _refSegmentPtr;
    ConversionStats& _stats;
    DosageVector _dosages;
};
