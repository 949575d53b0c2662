// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "value.hpp"

#include <sstream>
#include <cmath>

namespace rangejoin {

namespace {

struct TypeVisitor : public boost::static_visitor<ValueType>
{
    ValueType operator()(const Null&) const noexcept { return ValueType::null; }
    ValueType operator()(const std::int64_t) const noexcept { return ValueType::integer; }
    ValueType operator()(const double) const noexcept { return ValueType::real; }
    ValueType operator()(const std::string&) const noexcept { return ValueType::string; }
};

struct PrintVisitor : public boost::static_visitor<>
{
    explicit PrintVisitor(std::ostream& os) : os_ {os} {}
    
    void operator()(const Null&) const { os_ << "NA"; }
    template <typename T>
    void operator()(const T& value) const { os_ << value; }
    
private:
    std::ostream& os_;
};

int compare_reals(const double lhs, const double rhs) noexcept
{
    const auto lhs_nan = std::isnan(lhs), rhs_nan = std::isnan(rhs);
    if (lhs_nan || rhs_nan) return static_cast<int>(lhs_nan) - static_cast<int>(rhs_nan);
    if (lhs < rhs) return -1;
    return rhs < lhs ? 1 : 0;
}

} // namespace

ValueType type_of(const Value& value) noexcept
{
    return boost::apply_visitor(TypeVisitor {}, value);
}

bool is_null(const Value& value) noexcept
{
    return type_of(value) == ValueType::null;
}

std::string to_string(const Value& value)
{
    std::ostringstream ss {};
    print(ss, value);
    return ss.str();
}

bool value_less(const Value& lhs, const Value& rhs) noexcept
{
    if (lhs.which() != rhs.which()) return lhs.which() < rhs.which();
    const auto* lhs_real = boost::get<double>(&lhs);
    if (lhs_real) {
        return compare_reals(*lhs_real, *boost::get<double>(&rhs)) < 0;
    }
    return lhs < rhs;
}

bool value_equal(const Value& lhs, const Value& rhs) noexcept
{
    if (lhs.which() != rhs.which()) return false;
    const auto* lhs_real = boost::get<double>(&lhs);
    if (lhs_real) {
        return compare_reals(*lhs_real, *boost::get<double>(&rhs)) == 0;
    }
    return lhs == rhs;
}

std::ostream& operator<<(std::ostream& os, const ValueType type)
{
    switch (type) {
        case ValueType::null: os << "null"; break;
        case ValueType::integer: os << "integer"; break;
        case ValueType::real: os << "real"; break;
        case ValueType::string: os << "string"; break;
    }
    return os;
}

void print(std::ostream& os, const Value& value)
{
    boost::apply_visitor(PrintVisitor {os}, value);
}

} // namespace rangejoin
