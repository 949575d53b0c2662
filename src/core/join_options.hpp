// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef join_options_hpp
#define join_options_hpp

#include <string>
#include <vector>
#include <ostream>

#include <boost/optional.hpp>

#include "basics/interval.hpp"

namespace rangejoin {

enum class JoinType { inner, left, right, outer };

// Throws InvalidJoinModeError for anything other than inner, left, right, or outer.
JoinType parse_join_type(const std::string& mode, const std::string& operation = "join");

std::string to_string(JoinType how);

std::ostream& operator<<(std::ostream& os, JoinType how);

inline bool includes_missing_primary(const JoinType how) noexcept
{
    return how == JoinType::left || how == JoinType::outer;
}

inline bool includes_missing_secondary(const JoinType how) noexcept
{
    return how == JoinType::right || how == JoinType::outer;
}

struct JoinOptions
{
    std::string start_column = "start", end_column = "end";
    boost::optional<std::vector<std::string>> by = boost::none;
    std::string suffix = "_right";
    JoinType how = JoinType::inner;
    bool closed = false;
    bool deduplicate = true;
    // If false, rows with null, NaN or inverted boundaries are skipped rather than rejected. Skipped
    // rows appear in no output, not even as null padded rows of a left, right or outer join.
    bool strict = true;
    bool nulls_last = false;
    unsigned threads = 1;
};

inline IntervalClosure closure(const JoinOptions& options) noexcept
{
    return to_closure(options.closed);
}

} // namespace rangejoin

#endif
