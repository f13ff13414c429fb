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

#include "blt_util/seq_util.hh"

#include "boost/test/unit_test.hpp"


BOOST_AUTO_TEST_SUITE( seq_util )


BOOST_AUTO_TEST_CASE( test_transition )
{
    BOOST_REQUIRE(is_transition('A','G'));
    BOOST_REQUIRE(is_transition('G','A'));
    BOOST_REQUIRE(is_transition('C','T'));
    BOOST_REQUIRE(is_transition('T','C'));

    BOOST_REQUIRE(! is_transition('A','C'));
    BOOST_REQUIRE(! is_transition('G','T'));
    BOOST_REQUIRE(! is_transition('A','A'));
    BOOST_REQUIRE(! is_transition('N','G'));
}

BOOST_AUTO_TEST_CASE( test_transversion )
{
    BOOST_REQUIRE(is_transversion('A','C'));
    BOOST_REQUIRE(is_transversion('A','T'));
    BOOST_REQUIRE(is_transversion('G','C'));
    BOOST_REQUIRE(is_transversion('G','T'));

    BOOST_REQUIRE(! is_transversion('A','G'));
    BOOST_REQUIRE(! is_transversion('C','C'));
    BOOST_REQUIRE(! is_transversion('A','N'));
}

BOOST_AUTO_TEST_CASE( test_standardize_ref_seq )
{
    std::string seq("acgtNRyT");
    standardize_ref_seq(seq);
    BOOST_REQUIRE_EQUAL(seq, "ACGTNNNT");
}

BOOST_AUTO_TEST_SUITE_END()
