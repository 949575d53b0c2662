// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>

#include <vector>
#include <string>
#include <cstddef>
#include <algorithm>

#include "basics/value.hpp"
#include "basics/table.hpp"
#include "core/join_options.hpp"
#include "core/interval_join.hpp"
#include "mock/mock_tables.hpp"

namespace rangejoin { namespace test {

namespace {

const std::vector<JoinType> all_join_types {JoinType::inner, JoinType::left, JoinType::right, JoinType::outer};
const std::vector<IntervalClosure> all_closures {IntervalClosure::half_open, IntervalClosure::closed};

Table make_primary(const unsigned seed = 42)
{
    return generate_random_table(200, 3, 1000, 40, "x", seed);
}

Table make_secondary(const unsigned seed = 7)
{
    return generate_random_table(150, 4, 1000, 60, "y", seed);
}

JoinOptions make_options(const JoinType how = JoinType::inner, const IntervalClosure closure = IntervalClosure::half_open)
{
    JoinOptions result {};
    result.by = std::vector<std::string> {"key"};
    result.how = how;
    result.closed = closure == IntervalClosure::closed;
    return result;
}

std::size_t count_nulls(const Table& table, const std::string& column)
{
    const auto& values = table.column(column);
    return std::count_if(std::cbegin(values), std::cend(values), [] (const Value& value) { return is_null(value); });
}

// Reorders join(secondary, primary) output into the column order of join(primary, secondary)
Table swap_sides(const Table& table)
{
    return Table {{"key", "start", "end", "x", "start_right", "end_right", "y"},
                  {table.column("key"), table.column("start_right"), table.column("end_right"), table.column("x"),
                   table.column("start"), table.column("end"), table.column("y")}};
}

} // namespace

BOOST_AUTO_TEST_SUITE(core)
BOOST_AUTO_TEST_SUITE(interval_join_properties)

BOOST_AUTO_TEST_CASE(join_finds_exactly_the_pairs_found_by_brute_force)
{
    const auto primary = make_primary();
    const auto secondary = make_secondary();
    for (const auto how : all_join_types) {
        for (const auto closure : all_closures) {
            const auto expected = sort_rows(brute_force_join(primary, secondary, how, closure));
            auto options = make_options(how, closure);
            BOOST_CHECK_EQUAL(sort_rows(join(primary, secondary, options)), expected);
            options.deduplicate = false;
            BOOST_CHECK_EQUAL(sort_rows(join(primary, secondary, options)), expected);
        }
    }
}

BOOST_AUTO_TEST_CASE(inner_join_is_symmetric)
{
    const auto primary = make_primary(3);
    const auto secondary = make_secondary(5);
    for (const auto closure : all_closures) {
        const auto options = make_options(JoinType::inner, closure);
        const auto forward = join(primary, secondary, options);
        const auto backward = join(secondary, primary, options);
        BOOST_CHECK_EQUAL(sort_rows(forward), sort_rows(swap_sides(backward)));
    }
}

BOOST_AUTO_TEST_CASE(every_input_row_is_matched_or_missing_exactly_once)
{
    const auto primary = make_primary(11);
    const auto secondary = make_secondary(13);
    for (const auto closure : all_closures) {
        auto options = make_options(JoinType::left, closure);
        const auto missing_primary = nonoverlapping(primary, secondary, options);
        options.how = JoinType::right;
        const auto missing_secondary = nonoverlapping(primary, secondary, options);
        options.how = JoinType::inner;
        BOOST_CHECK_EQUAL(overlaps(primary, secondary, options).num_rows() + missing_primary.num_rows(),
                          primary.num_rows());
        BOOST_CHECK_EQUAL(overlaps(secondary, primary, options).num_rows() + missing_secondary.num_rows(),
                          secondary.num_rows());
        options.how = JoinType::outer;
        const auto outer = join(primary, secondary, options);
        BOOST_CHECK_EQUAL(count_nulls(outer, "start_right"), missing_primary.num_rows());
        BOOST_CHECK_EQUAL(count_nulls(outer, "start"), missing_secondary.num_rows());
    }
}

BOOST_AUTO_TEST_CASE(duplicated_rows_multiply_their_output_rows)
{
    const auto primary = make_primary(17);
    const auto secondary = make_secondary(19);
    const auto doubled = duplicate_rows(primary, primary.num_rows());
    const auto options = make_options();
    
    const auto single = join(primary, secondary, options);
    BOOST_CHECK_EQUAL(join(doubled, secondary, options).num_rows(), 2 * single.num_rows());
    BOOST_CHECK_EQUAL(overlaps(doubled, secondary, options).num_rows(),
                      2 * overlaps(primary, secondary, options).num_rows());
    BOOST_CHECK_EQUAL(sort_rows(join(doubled, secondary, options)),
                      sort_rows(brute_force_join(doubled, secondary, JoinType::inner, IntervalClosure::half_open)));
}

BOOST_AUTO_TEST_CASE(result_does_not_depend_on_the_number_of_threads)
{
    const auto primary = generate_random_table(500, 8, 5000, 100, "x", 23);
    const auto secondary = generate_random_table(400, 8, 5000, 100, "y", 29);
    for (const auto how : all_join_types) {
        auto options = make_options(how);
        const auto expected = join(primary, secondary, options);
        options.threads = 4;
        BOOST_CHECK_EQUAL(join(primary, secondary, options), expected);
    }
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace rangejoin
