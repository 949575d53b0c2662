// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "missing_column_error.hpp"

#include <utility>
#include <sstream>

namespace rangejoin {

MissingColumnError::MissingColumnError(std::string column, std::string table, std::string where)
: column_ {std::move(column)}
, table_ {std::move(table)}
, where_ {std::move(where)}
{}

std::string MissingColumnError::do_where() const
{
    return where_;
}

std::string MissingColumnError::do_why() const
{
    std::ostringstream ss {};
    ss << "the column '" << column_ << "' is required but is not present in the " << table_ << " table";
    return ss.str();
}

std::string MissingColumnError::do_help() const
{
    return "check the start, end, and group key column names match the table headers";
}

} // namespace rangejoin
