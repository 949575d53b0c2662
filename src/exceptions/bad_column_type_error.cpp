// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "bad_column_type_error.hpp"

#include <utility>
#include <sstream>

namespace rangejoin {

BadColumnTypeError::BadColumnTypeError(std::string column, std::string table,
                                       const std::size_t row, const ValueType found,
                                       const Coordinate::Kind expected)
: column_ {std::move(column)}
, table_ {std::move(table)}
, row_ {row}
, found_ {found}
, expected_ {expected}
{}

std::string BadColumnTypeError::do_where() const
{
    return "GroupPartitioner";
}

std::string BadColumnTypeError::do_why() const
{
    std::ostringstream ss {};
    ss << "interval boundaries must all be numbers or all be strings, but the boundary column '" << column_
       << "' of the " << table_ << " table holds a " << found_ << " value in row " << row_
       << " where the other boundaries are " << expected_ << "s";
    return ss.str();
}

std::string BadColumnTypeError::do_help() const
{
    return "convert the interval boundaries of both tables to one kind of coordinate";
}

} // namespace rangejoin
