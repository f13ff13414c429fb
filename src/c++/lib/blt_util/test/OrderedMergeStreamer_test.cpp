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

#include "blt_util/OrderedMergeStreamer.hh"

#include "boost/test/unit_test.hpp"

#include <string>
#include <vector>


namespace
{

struct KeyedRecord
{
    int key;
    std::string label;
};


/// minimal streamer over a vector of records
struct VectorStreamer
{
    typedef KeyedRecord record_type;

    explicit
    VectorStreamer(const std::vector<KeyedRecord>& records)
        : _records(records)
    {}

    bool
    next()
    {
        if (_nextIndex >= _records.size())
        {
            _current = nullptr;
            return false;
        }
        _current = &(_records[_nextIndex++]);
        return true;
    }

    const KeyedRecord*
    get_record_ptr() const
    {
        return _current;
    }

private:
    std::vector<KeyedRecord> _records;
    unsigned _nextIndex = 0;
    const KeyedRecord* _current = nullptr;
};


struct KeyCompare
{
    int
    operator()(
        const KeyedRecord& left,
        const KeyedRecord& right) const
    {
        return (left.key - right.key);
    }
};

typedef OrderedMergeStreamer<VectorStreamer,VectorStreamer,KeyCompare> merge_t;


/// flatten merge output into one string token per pair
std::vector<std::string>
getMergeTokens(
    const std::vector<KeyedRecord>& left,
    const std::vector<KeyedRecord>& right)
{
    VectorStreamer leftStream(left);
    VectorStreamer rightStream(right);
    merge_t merge(leftStream, rightStream);

    std::vector<std::string> tokens;
    while (merge.next())
    {
        const merge_t::pair_t pair(merge.getCurrentPair());
        BOOST_REQUIRE_EQUAL(pair.type(), merge.getCurrentType());
        std::string token;
        if (pair.hasLeft()) token += pair.left().label;
        token += ':';
        if (pair.hasRight()) token += pair.right().label;
        tokens.push_back(token);
    }

    // stream end is stable:
    BOOST_REQUIRE(! merge.next());
    return tokens;
}

}



BOOST_AUTO_TEST_SUITE( OrderedMergeStreamer_test )


BOOST_AUTO_TEST_CASE( test_interleaved_merge )
{
    const std::vector<KeyedRecord> left = {{1,"l1"},{3,"l3"},{5,"l5"},{7,"l7"}};
    const std::vector<KeyedRecord> right = {{2,"r2"},{3,"r3"},{6,"r6"},{7,"r7"},{9,"r9"}};

    const std::vector<std::string> expected = {"l1:",":r2","l3:r3","l5:",":r6","l7:r7",":r9"};
    const std::vector<std::string> tokens(getMergeTokens(left, right));
    BOOST_REQUIRE_EQUAL_COLLECTIONS(tokens.begin(), tokens.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE( test_merge_totality )
{
    // every input record appears in exactly one output pair, in input order
    const std::vector<KeyedRecord> left = {{10,"a"},{20,"b"},{30,"c"},{40,"d"}};
    const std::vector<KeyedRecord> right = {{5,"w"},{20,"x"},{25,"y"},{50,"z"}};

    std::string leftSeen;
    std::string rightSeen;
    {
        VectorStreamer leftStream(left);
        VectorStreamer rightStream(right);
        merge_t merge(leftStream, rightStream);
        while (merge.next())
        {
            const merge_t::pair_t pair(merge.getCurrentPair());
            if (pair.hasLeft()) leftSeen += pair.left().label;
            if (pair.hasRight()) rightSeen += pair.right().label;
        }
    }
    BOOST_REQUIRE_EQUAL(leftSeen, "abcd");
    BOOST_REQUIRE_EQUAL(rightSeen, "wxyz");
}

BOOST_AUTO_TEST_CASE( test_single_side_merge )
{
    const std::vector<KeyedRecord> empty;
    const std::vector<KeyedRecord> records = {{1,"a"},{2,"b"}};

    {
        const std::vector<std::string> expected = {"a:","b:"};
        const std::vector<std::string> tokens(getMergeTokens(records, empty));
        BOOST_REQUIRE_EQUAL_COLLECTIONS(tokens.begin(), tokens.end(), expected.begin(), expected.end());
    }
    {
        const std::vector<std::string> expected = {":a",":b"};
        const std::vector<std::string> tokens(getMergeTokens(empty, records));
        BOOST_REQUIRE_EQUAL_COLLECTIONS(tokens.begin(), tokens.end(), expected.begin(), expected.end());
    }

    BOOST_REQUIRE(getMergeTokens(empty, empty).empty());
}

BOOST_AUTO_TEST_CASE( test_repeated_key_merge )
{
    // a repeated key pairs only once, the remainder is emitted alone
    const std::vector<KeyedRecord> left = {{5,"a"},{5,"b"}};
    const std::vector<KeyedRecord> right = {{5,"x"}};

    const std::vector<std::string> expected = {"a:x","b:"};
    const std::vector<std::string> tokens(getMergeTokens(left, right));
    BOOST_REQUIRE_EQUAL_COLLECTIONS(tokens.begin(), tokens.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_SUITE_END()
