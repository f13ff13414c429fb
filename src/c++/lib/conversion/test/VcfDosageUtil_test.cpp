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

#include "conversion/VcfDosageUtil.hh"

#include "common/Exceptions.hh"

#include "boost/test/unit_test.hpp"


BOOST_AUTO_TEST_SUITE( VcfDosageUtil_test )


BOOST_AUTO_TEST_CASE( test_diploid_dosage )
{
    BOOST_REQUIRE_EQUAL(getGtDosage("0/0"), DOSAGE::REF);
    BOOST_REQUIRE_EQUAL(getGtDosage("0|0"), DOSAGE::REF);
    BOOST_REQUIRE_EQUAL(getGtDosage("0/1"), DOSAGE::HET);
    BOOST_REQUIRE_EQUAL(getGtDosage("1|0"), DOSAGE::HET);
    BOOST_REQUIRE_EQUAL(getGtDosage("1/1"), DOSAGE::HOM_ALT);
    BOOST_REQUIRE_EQUAL(getGtDosage("1/1:35:99"), DOSAGE::HOM_ALT);
}

BOOST_AUTO_TEST_CASE( test_haploid_dosage )
{
    BOOST_REQUIRE_EQUAL(getGtDosage("0"), DOSAGE::REF);
    BOOST_REQUIRE_EQUAL(getGtDosage("1"), DOSAGE::HET);
    BOOST_REQUIRE_EQUAL(getGtDosage("."), DOSAGE::MISSING);
}

BOOST_AUTO_TEST_CASE( test_missing_dosage )
{
    BOOST_REQUIRE_EQUAL(getGtDosage("./."), DOSAGE::MISSING);
    BOOST_REQUIRE_EQUAL(getGtDosage("0/."), DOSAGE::MISSING);
    BOOST_REQUIRE_EQUAL(getGtDosage("0/2"), DOSAGE::MISSING);
    BOOST_REQUIRE_EQUAL(getGtDosage("0/1/1"), DOSAGE::MISSING);
    BOOST_REQUIRE_EQUAL(getGtDosage("4294967297/0"), DOSAGE::MISSING);
    BOOST_REQUIRE_EQUAL(getGtDosage("0/4294967297"), DOSAGE::MISSING);
}

BOOST_AUTO_TEST_CASE( test_record_dosages )
{
    vcf_record vcfr;
    BOOST_REQUIRE(vcfr.set("1\t50\t.\tA\tG\t.\tPASS\t.\tGT:GQ\t0/0:20\t0/1:30\t1|1:40\t./.:0\n"));

    DosageVector dosages;
    getVcfDosages(vcfr, dosages);

    const DosageVector expected = {DOSAGE::REF, DOSAGE::HET, DOSAGE::HOM_ALT, DOSAGE::MISSING};
    BOOST_REQUIRE_EQUAL_COLLECTIONS(dosages.begin(), dosages.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE( test_record_dosage_errors )
{
    using namespace eigenconv::common;

    DosageVector dosages;
    vcf_record vcfr;

    // no samples
    BOOST_REQUIRE(vcfr.set("1\t50\t.\tA\tG\t.\tPASS\t.\n"));
    BOOST_REQUIRE_THROW(getVcfDosages(vcfr, dosages), GeneralException);

    // GT is not the first FORMAT key
    BOOST_REQUIRE(vcfr.set("1\t50\t.\tA\tG\t.\tPASS\t.\tGQ:GT\t20:0/0\n"));
    BOOST_REQUIRE_THROW(getVcfDosages(vcfr, dosages), GeneralException);

    // malformed GT
    BOOST_REQUIRE(vcfr.set("1\t50\t.\tA\tG\t.\tPASS\t.\tGT\t0/0\tA/G\n"));
    BOOST_REQUIRE_THROW(getVcfDosages(vcfr, dosages), GeneralException);
}

BOOST_AUTO_TEST_SUITE_END()
