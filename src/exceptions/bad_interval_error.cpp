// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "bad_interval_error.hpp"

#include <utility>
#include <sstream>

namespace rangejoin {

BadIntervalError::BadIntervalError(std::string table, const std::size_t row,
                                   boost::optional<Position> start, boost::optional<Position> end)
: table_ {std::move(table)}
, row_ {row}
, start_ {std::move(start)}
, end_ {std::move(end)}
{}

std::string BadIntervalError::do_where() const
{
    return "GroupPartitioner";
}

std::string BadIntervalError::do_why() const
{
    std::ostringstream ss {};
    ss << "row " << row_ << " of the " << table_ << " table ";
    if (!start_ || !end_) {
        ss << "has a missing interval boundary";
    } else {
        ss << "has a start (" << *start_ << ") greater than its end (" << *end_ << ")";
    }
    return ss.str();
}

std::string BadIntervalError::do_help() const
{
    return "fix the offending rows or disable strict interval checking to skip them";
}

} // namespace rangejoin
