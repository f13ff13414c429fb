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

#include "htsapi/vcf_record.hh"
#include "common/Exceptions.hh"

#include "boost/test/unit_test.hpp"


BOOST_AUTO_TEST_SUITE( vcf_record_test )

BOOST_AUTO_TEST_CASE( test_snv )
{
    vcf_record vcfr;
    BOOST_REQUIRE(vcfr.set("chr1\t10\trs1\ta\tT\t30\tPASS\t.\tGT:DP\t0/1:12\t1/1:3\n"));
    BOOST_REQUIRE_EQUAL(vcfr.chrom, "chr1");
    BOOST_REQUIRE_EQUAL(vcfr.pos, 10);
    BOOST_REQUIRE_EQUAL(vcfr.ref, "A");
    BOOST_REQUIRE_EQUAL(vcfr.alt.size(), 1u);
    BOOST_REQUIRE_EQUAL(vcfr.alt[0], "T");
    BOOST_REQUIRE_EQUAL(vcfr.sample_count(), 2u);
    BOOST_REQUIRE(vcfr.is_biallelic_snp());
    BOOST_REQUIRE(not vcfr.is_ref_site());
    BOOST_REQUIRE_EQUAL(std::string(vcfr.get_gt(1)), "1/1:3");
}

BOOST_AUTO_TEST_CASE( test_site )
{
    vcf_record vcfr;
    BOOST_REQUIRE(vcfr.set("chr1\t1\t.\tA\t.\n"));
    BOOST_REQUIRE(not vcfr.is_biallelic_snp());
    BOOST_REQUIRE(vcfr.is_ref_site());
    BOOST_REQUIRE_EQUAL(vcfr.sample_count(), 0u);
}

BOOST_AUTO_TEST_CASE( test_non_snv )
{
    vcf_record vcfr;
    BOOST_REQUIRE(vcfr.set("chr1\t1\t.\tA\tG,T\n"));
    BOOST_REQUIRE_EQUAL(vcfr.alt.size(), 2u);
    BOOST_REQUIRE(not vcfr.is_biallelic_snp());

    BOOST_REQUIRE(vcfr.set("chr1\t1\t.\tAT\tA\n"));
    BOOST_REQUIRE(not vcfr.is_biallelic_snp());

    BOOST_REQUIRE(vcfr.set("chr1\t1\t.\tA\tN\n"));
    BOOST_REQUIRE(not vcfr.is_biallelic_snp());
}

BOOST_AUTO_TEST_CASE( test_bad_record )
{
    vcf_record vcfr;
    BOOST_REQUIRE(not vcfr.set("chr1\t1\t.\tA\n"));
    BOOST_REQUIRE(not vcfr.set("chr1\t1x\t.\tA\tT\n"));
}

BOOST_AUTO_TEST_CASE( test_gt_not_first )
{
    vcf_record vcfr;
    BOOST_REQUIRE(vcfr.set("chr1\t10\t.\tA\tT\t.\t.\t.\tDP:GT\t12:0/1\n"));
    BOOST_REQUIRE_THROW(vcfr.get_gt(0), eigenconv::common::GeneralException);
}


BOOST_AUTO_TEST_SUITE_END()
