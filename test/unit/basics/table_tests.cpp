// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>

#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>
#include <limits>
#include <algorithm>
#include <iterator>

#include "basics/value.hpp"
#include "basics/table.hpp"
#include "mock/mock_tables.hpp"

namespace rangejoin { namespace test {

BOOST_AUTO_TEST_SUITE(basics)
BOOST_AUTO_TEST_SUITE(value)

BOOST_AUTO_TEST_CASE(values_are_ordered_by_type_then_value)
{
    const Value null {}, small {std::int64_t {-3}}, large {std::int64_t {7}}, real {0.5}, text {std::string {"a"}};
    
    BOOST_CHECK(null < small);
    BOOST_CHECK(small < large);
    BOOST_CHECK(large < real);
    BOOST_CHECK(real < text);
    BOOST_CHECK(!(text < null));
    BOOST_CHECK(null == Value {});
}

BOOST_AUTO_TEST_CASE(type_of_reports_the_held_alternative)
{
    BOOST_CHECK(type_of(Value {}) == ValueType::null);
    BOOST_CHECK(type_of(Value {std::int64_t {1}}) == ValueType::integer);
    BOOST_CHECK(type_of(Value {1.5}) == ValueType::real);
    BOOST_CHECK(type_of(Value {std::string {"x"}}) == ValueType::string);
    BOOST_CHECK(is_null(Value {}));
}

BOOST_AUTO_TEST_CASE(value_less_orders_nan_after_every_other_real)
{
    const auto nan = std::numeric_limits<double>::quiet_NaN();
    const Value a {1.0}, b {2.0}, missing {nan}, text {std::string {"a"}};
    
    BOOST_CHECK(value_less(a, missing));
    BOOST_CHECK(value_less(b, missing));
    BOOST_CHECK(!value_less(missing, a));
    BOOST_CHECK(!value_less(missing, Value {nan}));
    BOOST_CHECK(value_less(missing, text));
    BOOST_CHECK(value_less(Value {}, missing));
    BOOST_CHECK(value_equal(missing, Value {nan}));
    BOOST_CHECK(!value_equal(missing, a));
    BOOST_CHECK(!value_equal(Value {std::int64_t {1}}, a));
}

BOOST_AUTO_TEST_CASE(sorting_cells_with_nan_groups_them_together)
{
    const auto nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<Value> cells {Value {2.0}, Value {nan}, Value {1.0}, Value {nan}, Value {std::int64_t {5}}, Value {0.5}};
    std::sort(std::begin(cells), std::end(cells), ValueLess {});
    BOOST_CHECK(cells[0] == Value {std::int64_t {5}});
    BOOST_CHECK(cells[1] == Value {0.5});
    BOOST_CHECK(cells[2] == Value {1.0});
    BOOST_CHECK(cells[3] == Value {2.0});
    BOOST_CHECK(value_equal(cells[4], Value {nan}));
    BOOST_CHECK(value_equal(cells[5], Value {nan}));
}

BOOST_AUTO_TEST_CASE(nulls_are_printed_as_na)
{
    BOOST_CHECK_EQUAL(to_string(Value {}), "NA");
    BOOST_CHECK_EQUAL(to_string(Value {std::int64_t {-12}}), "-12");
    BOOST_CHECK_EQUAL(to_string(Value {std::string {"chr1"}}), "chr1");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(table)

BOOST_AUTO_TEST_CASE(columns_must_be_uniquely_named_and_equally_long)
{
    BOOST_CHECK_THROW((Table {{"a", "a"}}), std::invalid_argument);
    BOOST_CHECK_THROW((Table {{"a", "b"}, {make_integer_column({1, 2}), make_integer_column({1})}}),
                      std::invalid_argument);
    BOOST_CHECK_THROW((Table {{"a"}, {make_integer_column({1}), make_integer_column({1})}}),
                      std::invalid_argument);
    BOOST_CHECK_NO_THROW((Table {{"a", "b"}, {make_integer_column({1, 2}), make_string_column({"x", "y"})}}));
}

BOOST_AUTO_TEST_CASE(cells_are_addressed_by_row_and_column)
{
    const Table table {{"start", "end", "gene"},
                       {make_integer_column({0, 8}), make_integer_column({6, 9}), make_string_column({"a", "b"})}};
    
    BOOST_CHECK_EQUAL(table.num_rows(), 2);
    BOOST_CHECK_EQUAL(table.num_columns(), 3);
    BOOST_CHECK(!table.empty());
    BOOST_CHECK_EQUAL(table.column_index("gene"), 2);
    BOOST_CHECK(!table.find_column("chromosome"));
    BOOST_CHECK_THROW(table.column_index("chromosome"), std::out_of_range);
    BOOST_CHECK(table.at(1, 2) == Value {std::string {"b"}});
    BOOST_CHECK(table.row(0) == (Table::Row {std::int64_t {0}, std::int64_t {6}, std::string {"a"}}));
}

BOOST_AUTO_TEST_CASE(add_row_checks_the_row_width)
{
    Table table {{"start", "end"}};
    BOOST_CHECK(table.empty());
    table.add_row({std::int64_t {1}, std::int64_t {2}});
    BOOST_CHECK_EQUAL(table.num_rows(), 1);
    BOOST_CHECK_THROW(table.add_row({std::int64_t {1}}), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(tables_with_nan_cells_compare_equal_to_their_copies)
{
    const Table table {{"a"}, {make_real_column({std::numeric_limits<double>::quiet_NaN(), 1.0})}};
    const Table other {{"a"}, {make_real_column({2.0, 1.0})}};
    BOOST_CHECK_EQUAL(table, Table {table});
    BOOST_CHECK_NE(table, other);
}

BOOST_AUTO_TEST_CASE(tables_print_as_tab_separated_text)
{
    const Table table {{"a", "b"}, {make_integer_column({1}), make_null_column(1)}};
    std::ostringstream ss {};
    ss << table;
    BOOST_CHECK_EQUAL(ss.str(), "a\tb\n1\tNA\n");
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace rangejoin
