// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "join_options.hpp"

#include "utils/string_utils.hpp"
#include "exceptions/invalid_join_mode_error.hpp"

namespace rangejoin {

JoinType parse_join_type(const std::string& mode, const std::string& operation)
{
    const auto token = utils::to_lower(mode);
    if (token == "inner") return JoinType::inner;
    if (token == "left") return JoinType::left;
    if (token == "right") return JoinType::right;
    if (token == "outer" || token == "full") return JoinType::outer;
    throw InvalidJoinModeError {mode, operation};
}

std::string to_string(const JoinType how)
{
    switch (how) {
        case JoinType::inner: return "inner";
        case JoinType::left: return "left";
        case JoinType::right: return "right";
        case JoinType::outer: return "outer";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, const JoinType how)
{
    os << to_string(how);
    return os;
}

} // namespace rangejoin
