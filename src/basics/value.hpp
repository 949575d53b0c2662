// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef value_hpp
#define value_hpp

#include <cstdint>
#include <string>
#include <ostream>

#include <boost/blank.hpp>
#include <boost/variant.hpp>

namespace rangejoin {

using Null = boost::blank;

// A single table cell.
using Value = boost::variant<Null, std::int64_t, double, std::string>;

enum class ValueType { null, integer, real, string };

ValueType type_of(const Value& value) noexcept;

bool is_null(const Value& value) noexcept;

std::string to_string(const Value& value);

/**
 A strict weak ordering over cells: null < integer < real < string, then by value.
 
 Unlike the variant's own operator<, NaN is ordered after every other real and is equal to
 itself, so any combination of cells can serve as a group or deduplication key.
 */
bool value_less(const Value& lhs, const Value& rhs) noexcept;

// Equivalence under value_less.
bool value_equal(const Value& lhs, const Value& rhs) noexcept;

struct ValueLess
{
    bool operator()(const Value& lhs, const Value& rhs) const noexcept
    {
        return value_less(lhs, rhs);
    }
};

std::ostream& operator<<(std::ostream& os, ValueType type);

// Nulls are written as NA so that they survive a round trip through a delimited file.
void print(std::ostream& os, const Value& value);

} // namespace rangejoin

#endif
