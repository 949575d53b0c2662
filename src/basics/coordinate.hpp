// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef coordinate_hpp
#define coordinate_hpp

#include <cstdint>
#include <string>
#include <ostream>

#include <boost/variant.hpp>

namespace rangejoin {

/**
 A position on an ordered axis: an integer, a real, or a string (e.g. an ISO 8601 date).
 
 Integers and reals are compared by numeric value, exactly, so 1 == 1.0 and 2^53 + 1 > 2^53.
 Strings are compared lexicographically and order after every number. A join only ever
 compares coordinates of one kind.
 */
class Coordinate
{
public:
    using Integer = std::int64_t;
    using Real    = double;
    
    enum class Kind { number, string };
    
    Coordinate() = default;
    
    Coordinate(int value);
    Coordinate(Integer value);
    Coordinate(Real value); // throws std::invalid_argument for NaN
    Coordinate(std::string value);
    
    Coordinate(const Coordinate&)            = default;
    Coordinate& operator=(const Coordinate&) = default;
    Coordinate(Coordinate&&)                 = default;
    Coordinate& operator=(Coordinate&&)      = default;
    
    ~Coordinate() = default;
    
    Kind kind() const noexcept;
    
    friend bool operator==(const Coordinate& lhs, const Coordinate& rhs) noexcept;
    friend bool operator<(const Coordinate& lhs, const Coordinate& rhs) noexcept;
    friend std::ostream& operator<<(std::ostream& os, const Coordinate& coordinate);
    
private:
    boost::variant<Integer, Real, std::string> value_ = Integer {0};
};

inline bool operator!=(const Coordinate& lhs, const Coordinate& rhs) noexcept
{
    return !(lhs == rhs);
}

inline bool operator>(const Coordinate& lhs, const Coordinate& rhs) noexcept
{
    return rhs < lhs;
}

inline bool operator<=(const Coordinate& lhs, const Coordinate& rhs) noexcept
{
    return !(rhs < lhs);
}

inline bool operator>=(const Coordinate& lhs, const Coordinate& rhs) noexcept
{
    return !(lhs < rhs);
}

std::ostream& operator<<(std::ostream& os, Coordinate::Kind kind);

} // namespace rangejoin

#endif
