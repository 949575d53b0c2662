// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>

#include <stdexcept>
#include <string>

#include "basics/interval.hpp"

namespace rangejoin { namespace test {

BOOST_AUTO_TEST_SUITE(basics)
BOOST_AUTO_TEST_SUITE(interval)

BOOST_AUTO_TEST_CASE(constructing_an_inverted_interval_is_an_error)
{
    BOOST_CHECK_NO_THROW((Interval {0, 0}));
    BOOST_CHECK_NO_THROW((Interval {-5, 1}));
    BOOST_CHECK_THROW((Interval {1, 0}), Interval::BadInterval);
    BOOST_CHECK_THROW((Interval {1, 0}), std::logic_error);
}

BOOST_AUTO_TEST_CASE(ordering_is_by_begin_then_end)
{
    const Interval r1 {0, 0}, r2 {0, 1}, r3 {1, 1}, r4 {0, 2};
    
    BOOST_CHECK_NE(r1, r2);
    BOOST_CHECK_LT(r1, r2);
    BOOST_CHECK_LT(r2, r3);
    BOOST_CHECK_LT(r1, r4);
    BOOST_CHECK_LT(r2, r4);
    BOOST_CHECK_LT(r4, r3);
    BOOST_CHECK_EQUAL(r1, (Interval {0, 0}));
    BOOST_CHECK_GE(r3, r4);
    BOOST_CHECK_LE(r2, r2);
}

BOOST_AUTO_TEST_CASE(half_open_intervals_overlap_only_if_they_share_a_position)
{
    const Interval r1 {0, 6}, r2 {6, 10}, r3 {5, 7}, r4 {1, 2};
    
    BOOST_CHECK(!overlaps(r1, r2));
    BOOST_CHECK(!overlaps(r2, r1));
    BOOST_CHECK(overlaps(r1, r3));
    BOOST_CHECK(overlaps(r3, r2));
    BOOST_CHECK(overlaps(r1, r4));
    BOOST_CHECK(overlaps(r1, r1));
}

BOOST_AUTO_TEST_CASE(closed_intervals_overlap_when_they_touch)
{
    const Interval r1 {0, 6}, r2 {6, 10}, r3 {11, 12};
    
    BOOST_CHECK(overlaps(r1, r2, IntervalClosure::closed));
    BOOST_CHECK(overlaps(r2, r1, IntervalClosure::closed));
    BOOST_CHECK(!overlaps(r2, r3, IntervalClosure::closed));
}

BOOST_AUTO_TEST_CASE(zero_length_intervals_only_overlap_when_closed)
{
    const Interval point {5, 5}, span {0, 10}, left_edge {0, 0};
    
    BOOST_CHECK(is_empty(point));
    BOOST_CHECK(!overlaps(point, span));
    BOOST_CHECK(!overlaps(span, point));
    BOOST_CHECK(!overlaps(point, point));
    BOOST_CHECK(overlaps(point, span, IntervalClosure::closed));
    BOOST_CHECK(overlaps(point, point, IntervalClosure::closed));
    BOOST_CHECK(overlaps(left_edge, span, IntervalClosure::closed));
}

BOOST_AUTO_TEST_CASE(intervals_over_dates_overlap_like_numeric_ones)
{
    const Interval january {std::string {"2022-01-01"}, std::string {"2022-02-01"}};
    const Interval february {std::string {"2022-02-01"}, std::string {"2022-03-01"}};
    const Interval mid_january {std::string {"2022-01-15"}, std::string {"2022-01-16"}};
    
    BOOST_CHECK(overlaps(january, mid_january));
    BOOST_CHECK(!overlaps(january, february));
    BOOST_CHECK(overlaps(january, february, IntervalClosure::closed));
    BOOST_CHECK_LT(january, february);
    BOOST_CHECK_THROW((Interval {std::string {"2022-02-01"}, std::string {"2022-01-01"}}), Interval::BadInterval);
}

BOOST_AUTO_TEST_CASE(real_and_integer_boundaries_can_be_mixed)
{
    const Interval lhs {0, 1}, rhs {1.0, 2.5}, inside {0.25, 0.75};
    
    BOOST_CHECK(!overlaps(lhs, rhs));
    BOOST_CHECK(overlaps(lhs, rhs, IntervalClosure::closed));
    BOOST_CHECK(overlaps(lhs, inside));
    BOOST_CHECK(!is_empty(inside));
    BOOST_CHECK(is_empty(Interval {1, 1.0}));
}

BOOST_AUTO_TEST_CASE(to_closure_maps_the_closed_flag)
{
    BOOST_CHECK(to_closure(true) == IntervalClosure::closed);
    BOOST_CHECK(to_closure(false) == IntervalClosure::half_open);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace rangejoin
