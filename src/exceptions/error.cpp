// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "error.hpp"

#include <sstream>

namespace rangejoin {

std::string Error::type() const
{
    return do_type();
}

std::string Error::where() const
{
    return do_where();
}

std::string Error::why() const
{
    return do_why();
}

std::string Error::help() const
{
    return do_help();
}

const char* Error::what() const noexcept
{
    try {
        std::ostringstream ss {};
        ss << type() << " error in " << where() << ": " << why();
        what_ = ss.str();
    } catch (const std::exception&) {
        what_.clear();
    }
    return what_.c_str();
}

} // namespace rangejoin
