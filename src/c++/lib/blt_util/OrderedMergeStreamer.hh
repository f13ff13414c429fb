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
/// \brief Streaming merge-join of two position sorted record streams
///

#pragma once

#include "boost/utility.hpp"

#include <cassert>


namespace MERGE_PAIR_TYPE
{
enum index_t
{
    LEFT_ONLY,
    RIGHT_ONLY,
    BOTH
};
}



/// One element of a merge-join: a left record, a right record, or both
///
/// Only the three factory functions can build a pair, so a pair with
/// neither side present can't exist. The pair refers to records owned
/// elsewhere (typically the current record of a streamer), it is valid
/// only as long as those records are.
///
template <typename L, typename R>
struct MergePair
{
    static
    MergePair
    leftOnly(const L& left)
    {
        return MergePair(MERGE_PAIR_TYPE::LEFT_ONLY, &left, nullptr);
    }

    static
    MergePair
    rightOnly(const R& right)
    {
        return MergePair(MERGE_PAIR_TYPE::RIGHT_ONLY, nullptr, &right);
    }

    static
    MergePair
    both(
        const L& left,
        const R& right)
    {
        return MergePair(MERGE_PAIR_TYPE::BOTH, &left, &right);
    }

    MERGE_PAIR_TYPE::index_t
    type() const
    {
        return _type;
    }

    bool
    hasLeft() const
    {
        return (_type != MERGE_PAIR_TYPE::RIGHT_ONLY);
    }

    bool
    hasRight() const
    {
        return (_type != MERGE_PAIR_TYPE::LEFT_ONLY);
    }

    const L&
    left() const
    {
        assert(hasLeft());
        return *_left;
    }

    const R&
    right() const
    {
        assert(hasRight());
        return *_right;
    }

private:
    MergePair(
        const MERGE_PAIR_TYPE::index_t initType,
        const L* initLeft,
        const R* initRight)
        : _type(initType)
        , _left(initLeft)
        , _right(initRight)
    {}

    MERGE_PAIR_TYPE::index_t _type;
    const L* _left;
    const R* _right;
};



/// Merge-join two streams which are each sorted (non-decreasing) on a shared key
///
/// Each streamer type must provide:
///
///   typedef ... record_type;
///   bool next();
///   const record_type* get_record_ptr() const;
///
/// KeyCompare is called as compare(leftRecord, rightRecord) and returns a negative
/// value, zero or a positive value when the left key is less than, equal to or
/// greater than the right key.
///
/// Records are paired when keys are equal, otherwise the record with the lower key
/// is emitted alone and only its stream is advanced. When one stream ends the
/// remainder of the other is emitted alone.
///
/// Only the current record of each stream is held. Input order is a precondition
/// and is not checked: out-of-order input produces unspecified pairing.
///
template <typename LeftStreamer, typename RightStreamer, typename KeyCompare>
struct OrderedMergeStreamer : private boost::noncopyable
{
    typedef typename LeftStreamer::record_type left_record_t;
    typedef typename RightStreamer::record_type right_record_t;
    typedef MergePair<left_record_t, right_record_t> pair_t;

    OrderedMergeStreamer(
        LeftStreamer& leftStreamer,
        RightStreamer& rightStreamer,
        const KeyCompare& compare = KeyCompare())
        : _leftStreamer(leftStreamer)
        , _rightStreamer(rightStreamer)
        , _compare(compare)
    {}

    /// Advance to the next merged element
    ///
    /// returns false once both streams are exhausted
    ///
    /// This needs to be called once before any data is accessible.
    ///
    bool
    next()
    {
        if (_isStreamEnd) return false;

        if (_isAdvanceLeft) _isLeftEnd = (! _leftStreamer.next());
        if (_isAdvanceRight) _isRightEnd = (! _rightStreamer.next());
        _isStreamBegin = true;

        if (_isLeftEnd && _isRightEnd)
        {
            _isStreamEnd = true;
            return false;
        }

        if (_isLeftEnd)
        {
            _currentType = MERGE_PAIR_TYPE::RIGHT_ONLY;
        }
        else if (_isRightEnd)
        {
            _currentType = MERGE_PAIR_TYPE::LEFT_ONLY;
        }
        else
        {
            const int cmp(_compare(getLeftRecord(), getRightRecord()));
            if (cmp < 0)
            {
                _currentType = MERGE_PAIR_TYPE::LEFT_ONLY;
            }
            else if (cmp > 0)
            {
                _currentType = MERGE_PAIR_TYPE::RIGHT_ONLY;
            }
            else
            {
                _currentType = MERGE_PAIR_TYPE::BOTH;
            }
        }

        _isAdvanceLeft = (_currentType != MERGE_PAIR_TYPE::RIGHT_ONLY);
        _isAdvanceRight = (_currentType != MERGE_PAIR_TYPE::LEFT_ONLY);
        return true;
    }

    MERGE_PAIR_TYPE::index_t
    getCurrentType() const
    {
        assert(_isStreamBegin && (! _isStreamEnd));
        return _currentType;
    }

    /// the returned pair is invalidated by the next call to next()
    pair_t
    getCurrentPair() const
    {
        switch (getCurrentType())
        {
        case MERGE_PAIR_TYPE::LEFT_ONLY:
            return pair_t::leftOnly(getLeftRecord());
        case MERGE_PAIR_TYPE::RIGHT_ONLY:
            return pair_t::rightOnly(getRightRecord());
        default:
            return pair_t::both(getLeftRecord(), getRightRecord());
        }
    }

private:
    const left_record_t&
    getLeftRecord() const
    {
        const left_record_t* ptr(_leftStreamer.get_record_ptr());
        assert(ptr != nullptr);
        return *ptr;
    }

    const right_record_t&
    getRightRecord() const
    {
        const right_record_t* ptr(_rightStreamer.get_record_ptr());
        assert(ptr != nullptr);
        return *ptr;
    }

    LeftStreamer& _leftStreamer;
    RightStreamer& _rightStreamer;
    KeyCompare _compare;

    bool _isStreamBegin = false;
    bool _isStreamEnd = false;
    bool _isLeftEnd = false;
    bool _isRightEnd = false;
    bool _isAdvanceLeft = true;
    bool _isAdvanceRight = true;
    MERGE_PAIR_TYPE::index_t _currentType = MERGE_PAIR_TYPE::BOTH;
};
