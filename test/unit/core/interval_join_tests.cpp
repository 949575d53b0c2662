// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>

#include <vector>
#include <string>
#include <cstdint>
#include <initializer_list>
#include <limits>

#include <boost/optional.hpp>

#include "basics/value.hpp"
#include "basics/table.hpp"
#include "core/join_options.hpp"
#include "core/interval_join.hpp"
#include "exceptions/invalid_join_mode_error.hpp"
#include "exceptions/missing_column_error.hpp"
#include "exceptions/bad_interval_error.hpp"
#include "exceptions/bad_column_type_error.hpp"
#include "mock/mock_tables.hpp"

namespace rangejoin { namespace test {

namespace {

Table::Column nullable_column(std::initializer_list<boost::optional<std::int64_t>> values)
{
    Table::Column result {};
    for (const auto& value : values) {
        if (value) {
            result.emplace_back(*value);
        } else {
            result.emplace_back(Null {});
        }
    }
    return result;
}

Table make_date_primary()
{
    return Table {{"id", "start", "end"},
                  {make_string_column({"1", "3", "2"}),
                   make_string_column({"2022-01-01", "2022-05-11", "2022-03-04"}),
                   make_string_column({"2022-02-04", "2022-05-16", "2022-03-10"})}};
}

Table make_date_secondary()
{
    return Table {{"start", "end"},
                  {make_string_column({"2021-12-31", "2025-12-31"}),
                   make_string_column({"2022-04-01", "2025-04-01"})}};
}

Table make_chromosome_primary()
{
    return Table {{"chromosome", "starts", "ends"},
                  {make_string_column({"chr1", "chr1", "chr1", "chr1"}),
                   make_integer_column({0, 8, 6, 5}), make_integer_column({6, 9, 10, 7})}};
}

Table make_chromosome_secondary()
{
    return Table {{"chromosome", "starts", "ends", "genes"},
                  {make_string_column({"chr1", "chr1", "chr1"}),
                   make_integer_column({6, 3, 1}), make_integer_column({7, 8, 2}),
                   make_string_column({"a", "b", "c"})}};
}

JoinOptions make_options(const std::string& start, const std::string& end)
{
    JoinOptions result {};
    result.start_column = start;
    result.end_column = end;
    return result;
}

Table make_ab_primary()
{
    return Table {{"a", "b"}, {make_integer_column({1, 10, 30, 0}), make_integer_column({2, 11, 40, 10})}};
}

Table make_ab_secondary()
{
    return Table {{"a", "b"}, {make_integer_column({-5, 6, 0, 100, 100, 400}),
                               make_integer_column({5, 7, 1, 200, 200, 600})}};
}

} // namespace

BOOST_AUTO_TEST_SUITE(core)
BOOST_AUTO_TEST_SUITE(interval_join)

BOOST_AUTO_TEST_CASE(join_pairs_every_overlapping_row)
{
    auto options = make_options("starts", "ends");
    options.suffix = "_2";
    const auto result = join(make_chromosome_primary(), make_chromosome_secondary(), options);
    
    const Table expected {{"chromosome", "starts", "ends", "chromosome_2", "starts_2", "ends_2", "genes"},
                          {make_string_column({"chr1", "chr1", "chr1", "chr1", "chr1", "chr1"}),
                           make_integer_column({0, 0, 5, 5, 6, 6}),
                           make_integer_column({6, 6, 7, 7, 10, 10}),
                           make_string_column({"chr1", "chr1", "chr1", "chr1", "chr1", "chr1"}),
                           make_integer_column({1, 3, 3, 6, 3, 6}),
                           make_integer_column({2, 8, 8, 7, 8, 7}),
                           make_string_column({"c", "b", "b", "a", "b", "a"})}};
    BOOST_CHECK_EQUAL(result, expected);
}

BOOST_AUTO_TEST_CASE(overlaps_returns_primary_rows_with_any_overlap)
{
    const auto result = overlaps(make_chromosome_primary(), make_chromosome_secondary(), make_options("starts", "ends"));
    
    const Table expected {{"chromosome", "starts", "ends"},
                          {make_string_column({"chr1", "chr1", "chr1"}),
                           make_integer_column({0, 5, 6}), make_integer_column({6, 7, 10})}};
    BOOST_CHECK_EQUAL(result, expected);
}

BOOST_AUTO_TEST_CASE(overlaps_keeps_duplicate_primary_rows)
{
    const auto primary = make_interval_table({0, 0, 50}, {10, 10, 60});
    const auto secondary = make_interval_table({5, 6}, {6, 7});
    
    BOOST_CHECK_EQUAL(overlaps(primary, secondary), make_interval_table({0, 0}, {10, 10}));
}

BOOST_AUTO_TEST_CASE(join_only_pairs_rows_with_equal_keys)
{
    const Table primary {{"k", "a", "b"}, {make_string_column({"A", "B", "A"}),
                                           make_integer_column({1, 0, 30}), make_integer_column({2, 7, 40})}};
    const Table secondary {{"k", "a", "b"}, {make_string_column({"B", "A", "C", "B"}),
                                             make_integer_column({6, 0, 5, 29}), make_integer_column({10, 3, 6, 30})}};
    auto options = make_options("a", "b");
    options.by = std::vector<std::string> {"k"};
    options.suffix = "_2";
    
    const Table expected {{"k", "a", "b", "a_2", "b_2"},
                          {make_string_column({"A", "B"}), make_integer_column({1, 0}), make_integer_column({2, 7}),
                           make_integer_column({0, 6}), make_integer_column({3, 10})}};
    BOOST_CHECK_EQUAL(join(primary, secondary, options), expected);
}

BOOST_AUTO_TEST_CASE(grouped_join_orders_rows_by_key_then_position)
{
    const Table primary {{"k", "a", "b"}, {make_string_column({"A", "B", "A", "A"}),
                                           make_integer_column({1, 0, 28, 100}),
                                           make_integer_column({2, 7, 40, 200})}};
    const Table secondary {{"k", "a", "b"}, {make_string_column({"B", "A", "C", "A", "A"}),
                                             make_integer_column({6, 0, 5, 29, 0}),
                                             make_integer_column({10, 3, 6, 30, 300})}};
    auto options = make_options("a", "b");
    options.by = std::vector<std::string> {"k"};
    
    const Table expected {{"k", "a", "b", "a_right", "b_right"},
                          {make_string_column({"A", "A", "A", "A", "A", "B"}),
                           make_integer_column({1, 1, 28, 28, 100, 0}),
                           make_integer_column({2, 2, 40, 40, 200, 7}),
                           make_integer_column({0, 0, 0, 29, 0, 6}),
                           make_integer_column({3, 300, 300, 30, 300, 10})}};
    BOOST_CHECK_EQUAL(join(primary, secondary, options), expected);
}

BOOST_AUTO_TEST_CASE(left_join_pads_unmatched_primary_rows)
{
    auto options = make_options("a", "b");
    options.how = JoinType::left;
    
    const Table expected {{"a", "b", "a_right", "b_right"},
                          {make_integer_column({10, 30, 0, 0, 0, 1}),
                           make_integer_column({11, 40, 10, 10, 10, 2}),
                           nullable_column({boost::none, boost::none, -5, 0, 6, -5}),
                           nullable_column({boost::none, boost::none, 5, 1, 7, 5})}};
    BOOST_CHECK_EQUAL(join(make_ab_primary(), make_ab_secondary(), options), expected);
}

BOOST_AUTO_TEST_CASE(right_join_pads_unmatched_secondary_rows_with_their_multiplicity)
{
    auto options = make_options("a", "b");
    options.how = JoinType::right;
    
    const Table expected {{"a", "b", "a_right", "b_right"},
                          {nullable_column({boost::none, boost::none, boost::none, 0, 0, 0, 1}),
                           nullable_column({boost::none, boost::none, boost::none, 10, 10, 10, 2}),
                           make_integer_column({100, 100, 400, -5, 0, 6, -5}),
                           make_integer_column({200, 200, 600, 5, 1, 7, 5})}};
    BOOST_CHECK_EQUAL(join(make_ab_primary(), make_ab_secondary(), options), expected);
    
    options.deduplicate = false;
    BOOST_CHECK_EQUAL(join(make_ab_primary(), make_ab_secondary(), options), expected);
}

BOOST_AUTO_TEST_CASE(outer_join_pads_both_sides)
{
    auto options = make_options("a", "b");
    options.how = JoinType::outer;
    
    const Table expected {{"a", "b", "a_right", "b_right"},
                          {nullable_column({10, 30, boost::none, boost::none, boost::none, 0, 0, 0, 1}),
                           nullable_column({11, 40, boost::none, boost::none, boost::none, 10, 10, 10, 2}),
                           nullable_column({boost::none, boost::none, 100, 100, 400, -5, 0, 6, -5}),
                           nullable_column({boost::none, boost::none, 200, 200, 600, 5, 1, 7, 5})}};
    BOOST_CHECK_EQUAL(join(make_ab_primary(), make_ab_secondary(), options), expected);
}

BOOST_AUTO_TEST_CASE(nulls_last_moves_missing_rows_after_matched_rows)
{
    auto options = make_options("a", "b");
    options.how = JoinType::left;
    options.nulls_last = true;
    
    const Table expected {{"a", "b", "a_right", "b_right"},
                          {make_integer_column({0, 0, 0, 1, 10, 30}),
                           make_integer_column({10, 10, 10, 2, 11, 40}),
                           nullable_column({-5, 0, 6, -5, boost::none, boost::none}),
                           nullable_column({5, 1, 7, 5, boost::none, boost::none})}};
    BOOST_CHECK_EQUAL(join(make_ab_primary(), make_ab_secondary(), options), expected);
}

BOOST_AUTO_TEST_CASE(closed_join_includes_touching_intervals)
{
    const auto primary = make_interval_table({0}, {6});
    const auto secondary = make_interval_table({6}, {7});
    JoinOptions options {};
    
    BOOST_CHECK(join(primary, secondary, options).empty());
    options.closed = true;
    const Table expected {{"start", "end", "start_right", "end_right"},
                          {make_integer_column({0}), make_integer_column({6}),
                           make_integer_column({6}), make_integer_column({7})}};
    BOOST_CHECK_EQUAL(join(primary, secondary, options), expected);
}

BOOST_AUTO_TEST_CASE(disjoint_inputs_have_no_overlaps)
{
    const auto primary = make_interval_table({1}, {2});
    const auto secondary = make_interval_table({10}, {20});
    JoinOptions options {};
    
    const auto inner = join(primary, secondary, options);
    BOOST_CHECK(inner.empty());
    BOOST_CHECK(inner.column_names() == (std::vector<std::string> {"start", "end", "start_right", "end_right"}));
    BOOST_CHECK(overlaps(primary, secondary, options).empty());
    
    options.how = JoinType::left;
    BOOST_CHECK_EQUAL(nonoverlapping(primary, secondary, options), primary);
    options.how = JoinType::right;
    BOOST_CHECK_EQUAL(nonoverlapping(primary, secondary, options), secondary);
}

BOOST_AUTO_TEST_CASE(nonoverlapping_returns_rows_of_one_side_in_its_own_schema)
{
    auto options = make_options("a", "b");
    options.how = JoinType::left;
    BOOST_CHECK_EQUAL(nonoverlapping(make_ab_primary(), make_ab_secondary(), options),
                      (Table {{"a", "b"}, {make_integer_column({10, 30}), make_integer_column({11, 40})}}));
    options.how = JoinType::right;
    BOOST_CHECK_EQUAL(nonoverlapping(make_ab_primary(), make_ab_secondary(), options),
                      (Table {{"a", "b"}, {make_integer_column({100, 100, 400}), make_integer_column({200, 200, 600})}}));
}

BOOST_AUTO_TEST_CASE(nonoverlapping_includes_groups_missing_from_the_other_side)
{
    const Table primary {{"k", "start", "end"}, {make_string_column({"A", "B"}),
                                                 make_integer_column({0, 0}), make_integer_column({5, 5})}};
    const Table secondary {{"k", "start", "end"}, {make_string_column({"A", "C"}),
                                                   make_integer_column({1, 0}), make_integer_column({2, 5})}};
    JoinOptions options {};
    options.by = std::vector<std::string> {"k"};
    options.how = JoinType::left;
    
    BOOST_CHECK_EQUAL(nonoverlapping(primary, secondary, options),
                      (Table {{"k", "start", "end"}, {make_string_column({"B"}), make_integer_column({0}), make_integer_column({5})}}));
    options.how = JoinType::right;
    BOOST_CHECK_EQUAL(nonoverlapping(primary, secondary, options),
                      (Table {{"k", "start", "end"}, {make_string_column({"C"}), make_integer_column({0}), make_integer_column({5})}}));
}

BOOST_AUTO_TEST_CASE(nonoverlapping_rejects_inner_and_outer_modes)
{
    const auto primary = make_interval_table({1}, {2});
    const auto secondary = make_interval_table({10}, {20});
    JoinOptions options {};
    
    BOOST_CHECK_THROW(nonoverlapping(primary, secondary, options), InvalidJoinModeError);
    options.how = JoinType::outer;
    BOOST_CHECK_THROW(nonoverlapping(primary, secondary, options), InvalidJoinModeError);
}

BOOST_AUTO_TEST_CASE(empty_inputs_short_circuit)
{
    const auto primary = make_interval_table({1, 4}, {2, 8});
    const Table empty {{"start", "end"}};
    JoinOptions options {};
    
    BOOST_CHECK(join(primary, empty, options).empty());
    BOOST_CHECK(join(empty, primary, options).empty());
    
    options.how = JoinType::left;
    const Table left_expected {{"start", "end", "start_right", "end_right"},
                               {make_integer_column({1, 4}), make_integer_column({2, 8}),
                                make_null_column(2), make_null_column(2)}};
    BOOST_CHECK_EQUAL(join(primary, empty, options), left_expected);
    
    options.how = JoinType::right;
    const Table right_expected {{"start", "end", "start_right", "end_right"},
                                {make_null_column(2), make_null_column(2),
                                 make_integer_column({1, 4}), make_integer_column({2, 8})}};
    BOOST_CHECK_EQUAL(join(empty, primary, options), right_expected);
    BOOST_CHECK(join(primary, empty, options).empty());
}

BOOST_AUTO_TEST_CASE(schema_errors_are_raised_before_matching)
{
    const auto primary = make_interval_table({1}, {2});
    const Table secondary {{"begin", "end"}, {make_integer_column({1}), make_integer_column({2})}};
    
    BOOST_CHECK_THROW(join(primary, secondary), MissingColumnError);
    BOOST_CHECK_THROW(join(primary, primary, make_options("start", "stop")), MissingColumnError);
    
    const auto inverted = make_interval_table({5}, {2});
    BOOST_CHECK_THROW(join(inverted, primary), BadIntervalError);
    JoinOptions lenient {};
    lenient.strict = false;
    lenient.how = JoinType::outer;
    const Table expected {{"start", "end", "start_right", "end_right"},
                          {make_null_column(1), make_null_column(1), make_integer_column({1}), make_integer_column({2})}};
    BOOST_CHECK_EQUAL(join(inverted, primary, lenient), expected);
}

BOOST_AUTO_TEST_CASE(key_columns_take_the_value_of_the_present_side)
{
    const Table primary {{"k", "start", "end"}, {make_string_column({"A"}), make_integer_column({0}), make_integer_column({5})}};
    const Table secondary {{"k", "start", "end"}, {make_string_column({"C"}), make_integer_column({0}), make_integer_column({5})}};
    JoinOptions options {};
    options.by = std::vector<std::string> {"k"};
    options.how = JoinType::outer;
    
    const Table expected {{"k", "start", "end", "start_right", "end_right"},
                          {make_string_column({"A", "C"}),
                           nullable_column({0, boost::none}), nullable_column({5, boost::none}),
                           nullable_column({boost::none, 0}), nullable_column({boost::none, 5})}};
    BOOST_CHECK_EQUAL(join(primary, secondary, options), expected);
}

BOOST_AUTO_TEST_CASE(nan_keys_are_not_joined_with_other_keys)
{
    const auto nan = std::numeric_limits<double>::quiet_NaN();
    const Table primary {{"k", "start", "end"},
                         {make_real_column({1.0, nan, 2.0}), make_integer_column({0, 0, 0}),
                          make_integer_column({10, 10, 10})}};
    const Table secondary {{"k", "start", "end"},
                           {make_real_column({1.0}), make_integer_column({5}), make_integer_column({6})}};
    JoinOptions options {};
    options.by = std::vector<std::string> {"k"};
    
    const Table inner_expected {{"k", "start", "end", "start_right", "end_right"},
                                {make_real_column({1.0}), make_integer_column({0}), make_integer_column({10}),
                                 make_integer_column({5}), make_integer_column({6})}};
    BOOST_CHECK_EQUAL(join(primary, secondary, options), inner_expected);
    
    options.how = JoinType::outer;
    const Table outer_expected {{"k", "start", "end", "start_right", "end_right"},
                                {make_real_column({2.0, nan, 1.0}), make_integer_column({0, 0, 0}),
                                 make_integer_column({10, 10, 10}),
                                 nullable_column({boost::none, boost::none, 5}),
                                 nullable_column({boost::none, boost::none, 6})}};
    BOOST_CHECK_EQUAL(join(primary, secondary, options), outer_expected);
}

BOOST_AUTO_TEST_CASE(real_boundaries_join_by_value)
{
    const Table primary {{"start", "end"}, {make_real_column({0.5, 2.0}), make_real_column({1.5, 3.0})}};
    const Table secondary {{"start", "end"}, {make_real_column({1.5}), make_real_column({2.5})}};
    JoinOptions options {};
    
    const Table half_open_expected {{"start", "end", "start_right", "end_right"},
                                    {make_real_column({2.0}), make_real_column({3.0}),
                                     make_real_column({1.5}), make_real_column({2.5})}};
    BOOST_CHECK_EQUAL(join(primary, secondary, options), half_open_expected);
    
    options.closed = true;
    const Table closed_expected {{"start", "end", "start_right", "end_right"},
                                 {make_real_column({0.5, 2.0}), make_real_column({1.5, 3.0}),
                                  make_real_column({1.5, 1.5}), make_real_column({2.5, 2.5})}};
    BOOST_CHECK_EQUAL(join(primary, secondary, options), closed_expected);
}

BOOST_AUTO_TEST_CASE(integer_and_real_boundaries_are_compared_by_value)
{
    const auto primary = make_interval_table({0}, {1});
    const Table secondary {{"start", "end"}, {make_real_column({1.0}), make_real_column({2.0})}};
    JoinOptions options {};
    
    BOOST_CHECK(join(primary, secondary, options).empty());
    options.closed = true;
    const Table expected {{"start", "end", "start_right", "end_right"},
                          {make_integer_column({0}), make_integer_column({1}),
                           make_real_column({1.0}), make_real_column({2.0})}};
    BOOST_CHECK_EQUAL(join(primary, secondary, options), expected);
}

BOOST_AUTO_TEST_CASE(dates_join_as_iso_strings)
{
    JoinOptions options {};
    options.suffix = "_whatevz";
    BOOST_CHECK_THROW(join(make_date_primary(), make_date_secondary(), options), BadIntervalError);
    
    options.strict = false;
    const Table expected {{"id", "start", "end", "start_whatevz", "end_whatevz"},
                          {make_string_column({"1", "2"}),
                           make_string_column({"2022-01-01", "2022-03-04"}),
                           make_string_column({"2022-02-04", "2022-03-10"}),
                           make_string_column({"2021-12-31", "2021-12-31"}),
                           make_string_column({"2022-04-01", "2022-04-01"})}};
    BOOST_CHECK_EQUAL(sort_rows(join(make_date_primary(), make_date_secondary(), options), {"id"}), expected);
}

BOOST_AUTO_TEST_CASE(dates_cannot_be_joined_with_numbers)
{
    BOOST_CHECK_THROW(join(make_date_primary(), make_interval_table({0}, {1})), BadColumnTypeError);
}

BOOST_AUTO_TEST_CASE(padding_joins_with_an_empty_side_keep_key_and_position_order)
{
    const Table primary {{"k", "start", "end"}, {make_string_column({"B", "A", "A"}),
                                                 make_integer_column({5, 7, 1}), make_integer_column({6, 8, 2})}};
    const Table empty {{"k", "start", "end"}};
    JoinOptions options {};
    options.by = std::vector<std::string> {"k"};
    options.how = JoinType::left;
    
    const Table expected {{"k", "start", "end", "start_right", "end_right"},
                          {make_string_column({"A", "A", "B"}), make_integer_column({1, 7, 5}),
                           make_integer_column({2, 8, 6}), make_null_column(3), make_null_column(3)}};
    BOOST_CHECK_EQUAL(join(primary, empty, options), expected);
    options.how = JoinType::outer;
    BOOST_CHECK_EQUAL(join(primary, empty, options), expected);
}

BOOST_AUTO_TEST_CASE(joins_without_contributing_rows_return_the_output_schema)
{
    const auto primary = make_interval_table({1, 4}, {2, 8});
    const Table empty {{"start", "end"}};
    const std::vector<std::string> names {"start", "end", "start_right", "end_right"};
    JoinOptions options {};
    
    options.how = JoinType::outer;
    const auto both_empty = join(empty, empty, options);
    BOOST_CHECK(both_empty.empty());
    BOOST_CHECK(both_empty.column_names() == names);
    
    options.how = JoinType::right;
    const auto right = join(primary, empty, options);
    BOOST_CHECK(right.empty());
    BOOST_CHECK(right.column_names() == names);
    
    options.how = JoinType::left;
    const auto left = join(empty, primary, options);
    BOOST_CHECK(left.empty());
    BOOST_CHECK(left.column_names() == names);
}

BOOST_AUTO_TEST_CASE(a_kept_side_is_validated_even_if_the_other_is_empty)
{
    const auto inverted = make_interval_table({5}, {2});
    const Table empty {{"start", "end"}};
    JoinOptions options {};
    options.how = JoinType::left;
    BOOST_CHECK_THROW(join(inverted, empty, options), BadIntervalError);
    options.strict = false;
    BOOST_CHECK(join(inverted, empty, options).empty());
}

BOOST_AUTO_TEST_CASE(lenient_joins_drop_invalid_rows_from_every_output)
{
    const Table primary {{"start", "end"},
                         {Table::Column {Value {std::int64_t {0}}, Value {std::int64_t {9}}, Value {}},
                          make_integer_column({5, 3, 4})}};
    const auto secondary = make_interval_table({1}, {2});
    JoinOptions options {};
    options.strict = false;
    
    const Table matched {{"start", "end", "start_right", "end_right"},
                         {make_integer_column({0}), make_integer_column({5}),
                          make_integer_column({1}), make_integer_column({2})}};
    for (const auto how : {JoinType::inner, JoinType::left, JoinType::right, JoinType::outer}) {
        options.how = how;
        BOOST_CHECK_EQUAL(join(primary, secondary, options), matched);
    }
    options.how = JoinType::left;
    BOOST_CHECK(nonoverlapping(primary, secondary, options).empty());
    BOOST_CHECK_EQUAL(overlaps(primary, secondary, options), make_interval_table({0}, {5}));
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace rangejoin
