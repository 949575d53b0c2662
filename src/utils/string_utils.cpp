// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "string_utils.hpp"

#include <algorithm>
#include <iterator>
#include <cctype>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>

namespace rangejoin { namespace utils {

// Unlike std::getline splitting, a trailing delimiter yields a trailing empty field.
std::vector<std::string> split(const std::string& str, const char delim)
{
    std::vector<std::string> elems;
    elems.reserve(std::count(std::cbegin(str), std::cend(str), delim) + 1);
    std::string::size_type first {0};
    while (true) {
        const auto last = str.find(delim, first);
        if (last == std::string::npos) {
            elems.emplace_back(str, first);
            break;
        }
        elems.emplace_back(str, first, last - first);
        first = last + 1;
    }
    return elems;
}

std::vector<std::string> split(const std::string& str, const std::string& delims)
{
    std::vector<std::string> elems;
    boost::split(elems, str, boost::is_any_of(delims));
    return elems;
}

std::string join(const std::vector<std::string>& strings, const std::string& delim)
{
    return boost::algorithm::join(strings, delim);
}

std::string join(const std::vector<std::string>& strings, const char delim)
{
    return join(strings, std::string(1, delim));
}

std::string& trim(std::string& str)
{
    boost::algorithm::trim(str);
    return str;
}

std::string trim(const std::string& str)
{
    return boost::algorithm::trim_copy(str);
}

std::string& capitalise_front(std::string& str) noexcept
{
    if (!str.empty()) str.front() = std::toupper(static_cast<unsigned char>(str.front()));
    return str;
}

std::string capitalise_front(const std::string& str)
{
    auto result = str;
    return capitalise_front(result);
}

std::string& to_lower(std::string& str) noexcept
{
    std::transform(std::cbegin(str), std::cend(str), std::begin(str),
                   [] (unsigned char c) { return std::tolower(c); });
    return str;
}

std::string to_lower(const std::string& str)
{
    auto result = str;
    return to_lower(result);
}

} // namespace utils
} // namespace rangejoin
