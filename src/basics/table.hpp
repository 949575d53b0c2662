// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef table_hpp
#define table_hpp

#include <vector>
#include <string>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <ostream>

#include <boost/optional.hpp>

#include "value.hpp"

namespace rangejoin {

/**
 A Table is an in-memory collection of uniquely named, equally long columns of Values.
 
 It is the storage the join operates on: the join reads cells and builds new tables, it
 never modifies an input table.
 */
class Table
{
public:
    using Column   = std::vector<Value>;
    using Row      = std::vector<Value>;
    using RowIndex = std::size_t;
    
    Table() = default;
    
    Table(std::vector<std::string> column_names);
    Table(std::vector<std::string> column_names, std::vector<Column> columns);
    
    Table(const Table&)            = default;
    Table& operator=(const Table&) = default;
    Table(Table&&)                 = default;
    Table& operator=(Table&&)      = default;
    
    ~Table() = default;
    
    std::size_t num_rows() const noexcept;
    std::size_t num_columns() const noexcept;
    bool empty() const noexcept;
    
    const std::vector<std::string>& column_names() const noexcept;
    bool has_column(const std::string& name) const noexcept;
    boost::optional<std::size_t> find_column(const std::string& name) const noexcept;
    std::size_t column_index(const std::string& name) const;
    
    const Column& column(std::size_t index) const;
    const Column& column(const std::string& name) const;
    
    const Value& at(RowIndex row, std::size_t column) const;
    Row row(RowIndex index) const;
    
    void add_row(Row values);
    void reserve_rows(std::size_t n);
    
private:
    std::vector<std::string> names_;
    std::vector<Column> columns_;
    std::size_t num_rows_ = 0;
};

// Cells are compared with value_equal, so NaN cells compare equal.
bool operator==(const Table& lhs, const Table& rhs);
bool operator!=(const Table& lhs, const Table& rhs);

std::ostream& operator<<(std::ostream& os, const Table& table);

Table::Column make_integer_column(std::initializer_list<std::int64_t> values);
Table::Column make_real_column(std::initializer_list<double> values);
Table::Column make_string_column(std::initializer_list<std::string> values);

} // namespace rangejoin

#endif
