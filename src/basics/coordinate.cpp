// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "coordinate.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace rangejoin {

namespace {

using Integer = Coordinate::Integer;
using Real    = Coordinate::Real;

// 2^63, the first real above every Integer
constexpr Real integer_limit {9223372036854775808.0};

// Negative, zero, or positive as lhs is less than, equal to, or greater than rhs. rhs is not NaN.
int compare(const Integer lhs, const Real rhs) noexcept
{
    if (rhs >= integer_limit) return -1;
    if (rhs < -integer_limit) return 1;
    const auto whole = std::trunc(rhs);
    const auto rhs_whole = static_cast<Integer>(whole);
    if (lhs != rhs_whole) return lhs < rhs_whole ? -1 : 1;
    const auto fraction = rhs - whole;
    if (fraction > 0) return -1;
    if (fraction < 0) return 1;
    return 0;
}

struct LessVisitor : public boost::static_visitor<bool>
{
    bool operator()(const Integer lhs, const Integer rhs) const noexcept { return lhs < rhs; }
    bool operator()(const Real lhs, const Real rhs) const noexcept { return lhs < rhs; }
    bool operator()(const Integer lhs, const Real rhs) const noexcept { return compare(lhs, rhs) < 0; }
    bool operator()(const Real lhs, const Integer rhs) const noexcept { return compare(rhs, lhs) > 0; }
    bool operator()(const std::string& lhs, const std::string& rhs) const noexcept { return lhs < rhs; }
    template <typename T>
    bool operator()(const T&, const std::string&) const noexcept { return true; }
    template <typename T>
    bool operator()(const std::string&, const T&) const noexcept { return false; }
};

struct EqualVisitor : public boost::static_visitor<bool>
{
    bool operator()(const Integer lhs, const Integer rhs) const noexcept { return lhs == rhs; }
    bool operator()(const Real lhs, const Real rhs) const noexcept { return lhs == rhs; }
    bool operator()(const Integer lhs, const Real rhs) const noexcept { return compare(lhs, rhs) == 0; }
    bool operator()(const Real lhs, const Integer rhs) const noexcept { return compare(rhs, lhs) == 0; }
    bool operator()(const std::string& lhs, const std::string& rhs) const noexcept { return lhs == rhs; }
    template <typename T>
    bool operator()(const T&, const std::string&) const noexcept { return false; }
    template <typename T>
    bool operator()(const std::string&, const T&) const noexcept { return false; }
};

struct KindVisitor : public boost::static_visitor<Coordinate::Kind>
{
    Coordinate::Kind operator()(const std::string&) const noexcept { return Coordinate::Kind::string; }
    template <typename T>
    Coordinate::Kind operator()(const T&) const noexcept { return Coordinate::Kind::number; }
};

} // namespace

Coordinate::Coordinate(const int value) : value_ {Integer {value}} {}

Coordinate::Coordinate(const Integer value) : value_ {value} {}

Coordinate::Coordinate(const Real value) : value_ {value}
{
    if (std::isnan(value)) throw std::invalid_argument {"Coordinate: NaN is not a position"};
}

Coordinate::Coordinate(std::string value) : value_ {std::move(value)} {}

Coordinate::Kind Coordinate::kind() const noexcept
{
    return boost::apply_visitor(KindVisitor {}, value_);
}

bool operator==(const Coordinate& lhs, const Coordinate& rhs) noexcept
{
    return boost::apply_visitor(EqualVisitor {}, lhs.value_, rhs.value_);
}

bool operator<(const Coordinate& lhs, const Coordinate& rhs) noexcept
{
    return boost::apply_visitor(LessVisitor {}, lhs.value_, rhs.value_);
}

std::ostream& operator<<(std::ostream& os, const Coordinate& coordinate)
{
    os << coordinate.value_;
    return os;
}

std::ostream& operator<<(std::ostream& os, const Coordinate::Kind kind)
{
    switch (kind) {
        case Coordinate::Kind::number: os << "number"; break;
        case Coordinate::Kind::string: os << "string"; break;
    }
    return os;
}

} // namespace rangejoin
