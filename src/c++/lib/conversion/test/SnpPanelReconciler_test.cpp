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

#include "conversion/SnpPanelReconciler.hh"

#include "common/Exceptions.hh"

#include "boost/test/unit_test.hpp"

#include <string>


namespace
{

EigenstratSnpRecord
getSnp(
    const pos_t pos,
    const char ref,
    const char alt,
    const std::string& chrom = "1")
{
    EigenstratSnpRecord snp;
    snp.snpId = "rs" + std::to_string(pos);
    snp.chrom = chrom;
    snp.pos = pos;
    snp.ref = ref;
    snp.alt = alt;
    return snp;
}


vcf_record
getVcf(const char* line)
{
    vcf_record vcfr;
    BOOST_REQUIRE(vcfr.set(line));
    return vcfr;
}


void
checkDosages(
    const DosageRecord& record,
    const DosageVector& expected)
{
    BOOST_REQUIRE_EQUAL_COLLECTIONS(record.dosages.begin(), record.dosages.end(), expected.begin(), expected.end());
}

}



BOOST_AUTO_TEST_SUITE( SnpPanelReconciler_test )

typedef SnpPanelReconciler::pair_t pair_t;


BOOST_AUTO_TEST_CASE( test_matching_alleles )
{
    ConversionStats stats;
    SnpPanelReconciler reconciler(3, nullptr, stats);

    const EigenstratSnpRecord snp(getSnp(100, 'A', 'G'));
    const vcf_record vcfr(getVcf("1\t100\t.\tA\tG\t.\t.\t.\tGT\t0/0\t0/1\t1/1\n"));

    std::unique_ptr<DosageRecord> record(reconciler.reconcile(pair_t::both(snp, vcfr)));
    BOOST_REQUIRE(record);
    BOOST_REQUIRE_EQUAL(record->chrom, "1");
    BOOST_REQUIRE_EQUAL(record->pos, 100);
    BOOST_REQUIRE_EQUAL(record->ref, 'A');
    BOOST_REQUIRE_EQUAL(record->alt, 'G');
    checkDosages(*record, {DOSAGE::REF, DOSAGE::HET, DOSAGE::HOM_ALT});
    BOOST_REQUIRE_EQUAL(stats.alleleMatches, 1u);
}

BOOST_AUTO_TEST_CASE( test_flipped_alleles )
{
    ConversionStats stats;
    SnpPanelReconciler reconciler(3, nullptr, stats);

    // panel A/G observed G/A
    const EigenstratSnpRecord snp(getSnp(100, 'A', 'G'));
    const vcf_record vcfr(getVcf("1\t100\t.\tG\tA\t.\t.\t.\tGT\t0/0\t0/1\t1/1\n"));

    std::unique_ptr<DosageRecord> record(reconciler.reconcile(pair_t::both(snp, vcfr)));
    BOOST_REQUIRE(record);

    // alleles always follow the panel:
    BOOST_REQUIRE_EQUAL(record->ref, 'A');
    BOOST_REQUIRE_EQUAL(record->alt, 'G');
    checkDosages(*record, {DOSAGE::HOM_ALT, DOSAGE::HET, DOSAGE::REF});
    BOOST_REQUIRE_EQUAL(stats.alleleFlips, 1u);
}

BOOST_AUTO_TEST_CASE( test_mismatched_alleles )
{
    ConversionStats stats;
    SnpPanelReconciler reconciler(3, nullptr, stats);

    // panel A/G observed C/T
    const EigenstratSnpRecord snp(getSnp(100, 'A', 'G'));
    const vcf_record vcfr(getVcf("1\t100\t.\tC\tT\t.\t.\t.\tGT\t0/0\t0/1\t1/1\n"));

    std::unique_ptr<DosageRecord> record(reconciler.reconcile(pair_t::both(snp, vcfr)));
    BOOST_REQUIRE(record);
    BOOST_REQUIRE_EQUAL(record->ref, 'A');
    BOOST_REQUIRE_EQUAL(record->alt, 'G');
    checkDosages(*record, {DOSAGE::MISSING, DOSAGE::MISSING, DOSAGE::MISSING});
    BOOST_REQUIRE_EQUAL(stats.alleleMismatches, 1u);
}

BOOST_AUTO_TEST_CASE( test_multiallelic_observation )
{
    ConversionStats stats;
    SnpPanelReconciler reconciler(2, nullptr, stats);

    const EigenstratSnpRecord snp(getSnp(100, 'A', 'G'));
    const vcf_record vcfr(getVcf("1\t100\t.\tA\tG,T\t.\t.\t.\tGT\t0/1\t0/0\n"));

    std::unique_ptr<DosageRecord> record(reconciler.reconcile(pair_t::both(snp, vcfr)));
    BOOST_REQUIRE(record);
    checkDosages(*record, {DOSAGE::MISSING, DOSAGE::MISSING});
}

BOOST_AUTO_TEST_CASE( test_panel_only_with_reference )
{
    reference_contig_segment ref;
    ref.seq() = "ACGTACGTAC";

    ConversionStats stats;
    SnpPanelReconciler reconciler(2, &ref, stats);

    // position 3 has reference base G
    {
        const EigenstratSnpRecord snp(getSnp(3, 'G', 'A'));
        std::unique_ptr<DosageRecord> record(reconciler.reconcile(pair_t::leftOnly(snp)));
        BOOST_REQUIRE(record);
        checkDosages(*record, {DOSAGE::REF, DOSAGE::REF});
    }
    {
        const EigenstratSnpRecord snp(getSnp(3, 'A', 'G'));
        std::unique_ptr<DosageRecord> record(reconciler.reconcile(pair_t::leftOnly(snp)));
        BOOST_REQUIRE(record);
        BOOST_REQUIRE_EQUAL(record->ref, 'A');
        BOOST_REQUIRE_EQUAL(record->alt, 'G');
        checkDosages(*record, {DOSAGE::HOM_ALT, DOSAGE::HOM_ALT});
    }
    {
        const EigenstratSnpRecord snp(getSnp(3, 'C', 'T'));
        std::unique_ptr<DosageRecord> record(reconciler.reconcile(pair_t::leftOnly(snp)));
        BOOST_REQUIRE(record);
        checkDosages(*record, {DOSAGE::MISSING, DOSAGE::MISSING});
    }

    // beyond the end of the reference
    {
        const EigenstratSnpRecord snp(getSnp(200, 'A', 'C'));
        std::unique_ptr<DosageRecord> record(reconciler.reconcile(pair_t::leftOnly(snp)));
        BOOST_REQUIRE(record);
        checkDosages(*record, {DOSAGE::MISSING, DOSAGE::MISSING});
    }

    BOOST_REQUIRE_EQUAL(stats.panelOnlyRefFilled, 2u);
    BOOST_REQUIRE_EQUAL(stats.panelOnlyMissing, 2u);
}

BOOST_AUTO_TEST_CASE( test_panel_only_without_reference )
{
    ConversionStats stats;
    SnpPanelReconciler reconciler(2, nullptr, stats);

    const EigenstratSnpRecord snp(getSnp(3, 'G', 'A'));
    std::unique_ptr<DosageRecord> record(reconciler.reconcile(pair_t::leftOnly(snp)));
    BOOST_REQUIRE(record);
    BOOST_REQUIRE_EQUAL(record->pos, 3);
    checkDosages(*record, {DOSAGE::MISSING, DOSAGE::MISSING});
}

BOOST_AUTO_TEST_CASE( test_observed_only_dropped )
{
    ConversionStats stats;
    SnpPanelReconciler reconciler(1, nullptr, stats);

    const vcf_record vcfr(getVcf("1\t200\t.\tA\tG\t.\t.\t.\tGT\t0/1\n"));
    BOOST_REQUIRE(! reconciler.reconcile(pair_t::rightOnly(vcfr)));
    BOOST_REQUIRE_EQUAL(stats.observedDropped, 1u);
}

BOOST_AUTO_TEST_CASE( test_sample_count_mismatch )
{
    ConversionStats stats;
    SnpPanelReconciler reconciler(3, nullptr, stats);

    const EigenstratSnpRecord snp(getSnp(100, 'A', 'G'));
    const vcf_record vcfr(getVcf("1\t100\t.\tA\tG\t.\t.\t.\tGT\t0/0\t0/1\n"));
    BOOST_REQUIRE_THROW(reconciler.reconcile(pair_t::both(snp, vcfr)), eigenconv::common::GeneralException);
}

BOOST_AUTO_TEST_CASE( test_chrom_mismatch )
{
    ConversionStats stats;
    SnpPanelReconciler reconciler(1, nullptr, stats);

    const EigenstratSnpRecord snp(getSnp(100, 'A', 'G', "1"));
    const vcf_record vcfr(getVcf("2\t100\t.\tA\tG\t.\t.\t.\tGT\t0/1\n"));
    BOOST_REQUIRE_THROW(reconciler.reconcile(pair_t::both(snp, vcfr)), eigenconv::common::GeneralException);
}

BOOST_AUTO_TEST_CASE( test_position_compare )
{
    SnpVcfPositionCompare compare;
    const vcf_record vcfr(getVcf("1\t100\t.\tA\tG\n"));
    BOOST_REQUIRE_LT(compare(getSnp(99, 'A', 'G'), vcfr), 0);
    BOOST_REQUIRE_EQUAL(compare(getSnp(100, 'A', 'G'), vcfr), 0);
    BOOST_REQUIRE_GT(compare(getSnp(101, 'A', 'G'), vcfr), 0);
}

BOOST_AUTO_TEST_SUITE_END()
