// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef string_utils_hpp
#define string_utils_hpp

#include <vector>
#include <string>

namespace rangejoin { namespace utils {

std::vector<std::string> split(const std::string& str, char delim);
std::vector<std::string> split(const std::string& str, const std::string& delims);

std::string join(const std::vector<std::string>& strings, const std::string& delim = "");
std::string join(const std::vector<std::string>& strings, char delim);

// Strips leading and trailing whitespace, and a trailing carriage return.
std::string& trim(std::string& str);
std::string trim(const std::string& str);

std::string& capitalise_front(std::string& str) noexcept;
std::string capitalise_front(const std::string& str);
std::string& to_lower(std::string& str) noexcept;
std::string to_lower(const std::string& str);

} // namespace utils
} // namespace rangejoin

#endif
