// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "invalid_join_mode_error.hpp"

#include <utility>

namespace rangejoin {

InvalidJoinModeError::InvalidJoinModeError(std::string mode, std::string operation)
: mode_ {std::move(mode)}
, operation_ {std::move(operation)}
{}

std::string InvalidJoinModeError::do_where() const
{
    return operation_;
}

std::string InvalidJoinModeError::do_why() const
{
    return "the join mode '" + mode_ + "' is not supported by " + operation_;
}

std::string InvalidJoinModeError::do_help() const
{
    if (operation_ == "nonoverlapping") {
        return "use one of left or right";
    }
    return "use one of inner, left, right, or outer";
}

} // namespace rangejoin
