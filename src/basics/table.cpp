// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "table.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace rangejoin {

namespace {

void check_unique(const std::vector<std::string>& names)
{
    auto sorted_names = names;
    std::sort(std::begin(sorted_names), std::end(sorted_names));
    const auto duplicate = std::adjacent_find(std::cbegin(sorted_names), std::cend(sorted_names));
    if (duplicate != std::cend(sorted_names)) {
        throw std::invalid_argument {"Table: duplicate column name '" + *duplicate + "'"};
    }
}

} // namespace

Table::Table(std::vector<std::string> column_names)
: names_ {std::move(column_names)}
, columns_ (names_.size())
{
    check_unique(names_);
}

Table::Table(std::vector<std::string> column_names, std::vector<Column> columns)
: names_ {std::move(column_names)}
, columns_ {std::move(columns)}
{
    if (names_.size() != columns_.size()) {
        throw std::invalid_argument {"Table: number of names does not match number of columns"};
    }
    check_unique(names_);
    if (!columns_.empty()) {
        num_rows_ = columns_.front().size();
        const bool equal_lengths {std::all_of(std::cbegin(columns_), std::cend(columns_),
                                              [this] (const Column& c) { return c.size() == num_rows_; })};
        if (!equal_lengths) {
            throw std::invalid_argument {"Table: columns must all be the same length"};
        }
    }
}

std::size_t Table::num_rows() const noexcept
{
    return num_rows_;
}

std::size_t Table::num_columns() const noexcept
{
    return names_.size();
}

bool Table::empty() const noexcept
{
    return num_rows_ == 0;
}

const std::vector<std::string>& Table::column_names() const noexcept
{
    return names_;
}

bool Table::has_column(const std::string& name) const noexcept
{
    return static_cast<bool>(find_column(name));
}

boost::optional<std::size_t> Table::find_column(const std::string& name) const noexcept
{
    const auto itr = std::find(std::cbegin(names_), std::cend(names_), name);
    if (itr == std::cend(names_)) return boost::none;
    return static_cast<std::size_t>(std::distance(std::cbegin(names_), itr));
}

std::size_t Table::column_index(const std::string& name) const
{
    const auto result = find_column(name);
    if (!result) {
        throw std::out_of_range {"Table: no column named '" + name + "'"};
    }
    return *result;
}

const Table::Column& Table::column(const std::size_t index) const
{
    return columns_.at(index);
}

const Table::Column& Table::column(const std::string& name) const
{
    return columns_[column_index(name)];
}

const Value& Table::at(const RowIndex row, const std::size_t column) const
{
    return columns_.at(column).at(row);
}

Table::Row Table::row(const RowIndex index) const
{
    Row result {};
    result.reserve(columns_.size());
    for (const auto& column : columns_) {
        result.push_back(column.at(index));
    }
    return result;
}

void Table::add_row(Row values)
{
    if (values.size() != columns_.size()) {
        throw std::invalid_argument {"Table: row has the wrong number of fields"};
    }
    for (std::size_t i {0}; i < values.size(); ++i) {
        columns_[i].push_back(std::move(values[i]));
    }
    ++num_rows_;
}

void Table::reserve_rows(const std::size_t n)
{
    for (auto& column : columns_) column.reserve(n);
}

bool operator==(const Table& lhs, const Table& rhs)
{
    if (lhs.column_names() != rhs.column_names() || lhs.num_rows() != rhs.num_rows()) return false;
    for (std::size_t i {0}; i < lhs.num_columns(); ++i) {
        const auto& a = lhs.column(i);
        const auto& b = rhs.column(i);
        if (!std::equal(std::cbegin(a), std::cend(a), std::cbegin(b), value_equal)) return false;
    }
    return true;
}

bool operator!=(const Table& lhs, const Table& rhs)
{
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const Table& table)
{
    const auto& names = table.column_names();
    for (std::size_t i {0}; i < names.size(); ++i) {
        if (i > 0) os << '\t';
        os << names[i];
    }
    os << '\n';
    for (Table::RowIndex row {0}; row < table.num_rows(); ++row) {
        for (std::size_t col {0}; col < table.num_columns(); ++col) {
            if (col > 0) os << '\t';
            print(os, table.at(row, col));
        }
        os << '\n';
    }
    return os;
}

Table::Column make_integer_column(std::initializer_list<std::int64_t> values)
{
    return Table::Column(std::cbegin(values), std::cend(values));
}

Table::Column make_real_column(std::initializer_list<double> values)
{
    return Table::Column(std::cbegin(values), std::cend(values));
}

Table::Column make_string_column(std::initializer_list<std::string> values)
{
    return Table::Column(std::cbegin(values), std::cend(values));
}

} // namespace rangejoin
