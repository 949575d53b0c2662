// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef interval_hpp
#define interval_hpp

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <ostream>

#include "coordinate.hpp"

namespace rangejoin {

/*
    A span [begin, end) or [begin, end] over an ordered coordinate axis: integers, reals,
    or strings such as ISO 8601 dates. Whether the end point is included is a property of
    the query, not the interval.
*/
class Interval
{
public:
    using Position = Coordinate;

    class BadInterval;

    Interval() = default;

    explicit Interval(Position begin, Position end);

    Interval(const Interval&)            = default;
    Interval& operator=(const Interval&) = default;
    Interval(Interval&&)                 = default;
    Interval& operator=(Interval&&)      = default;

    ~Interval() = default;

    const Position& begin() const noexcept { return begin_; }
    const Position& end() const noexcept { return end_; }

private:
    Position begin_ = 0, end_ = 0;
};

enum class IntervalClosure { half_open, closed };

inline IntervalClosure to_closure(const bool closed) noexcept
{
    return closed ? IntervalClosure::closed : IntervalClosure::half_open;
}

// BadInterval

class Interval::BadInterval : public std::logic_error
{
public:
    using Position = Interval::Position;

    BadInterval(Position begin, Position end);

    virtual ~BadInterval() override = default;

    const Position& begin() const noexcept { return begin_; }
    const Position& end() const noexcept  { return end_; }

private:
    Position begin_, end_;
};

inline Interval::Interval(Position begin, Position end)
: begin_ {std::move(begin)}
, end_ {std::move(end)}
{
    if (end_ < begin_) throw BadInterval {begin_, end_};
}

inline Interval::BadInterval::BadInterval(Position begin, Position end)
: std::logic_error {"BadInterval"}
, begin_ {std::move(begin)}
, end_ {std::move(end)}
{}

// non-member methods

inline bool is_empty(const Interval& interval) noexcept
{
    return interval.begin() == interval.end();
}

inline bool begins_equal(const Interval& lhs, const Interval& rhs) noexcept
{
    return lhs.begin() == rhs.begin();
}

inline bool ends_equal(const Interval& lhs, const Interval& rhs) noexcept
{
    return lhs.end() == rhs.end();
}

inline bool begins_before(const Interval& lhs, const Interval& rhs) noexcept
{
    return lhs.begin() < rhs.begin();
}

inline bool ends_before(const Interval& lhs, const Interval& rhs) noexcept
{
    return lhs.end() < rhs.end();
}

inline bool operator==(const Interval& lhs, const Interval& rhs) noexcept
{
    return begins_equal(lhs, rhs) && ends_equal(lhs, rhs);
}

inline bool operator!=(const Interval& lhs, const Interval& rhs) noexcept
{
    return !(lhs == rhs);
}

// Ordering is by begin then end, the order every sorted group is kept in.
inline bool operator<(const Interval& lhs, const Interval& rhs) noexcept
{
    return begins_before(lhs, rhs) || (begins_equal(lhs, rhs) && ends_before(lhs, rhs));
}

inline bool operator>(const Interval& lhs, const Interval& rhs) noexcept
{
    return rhs < lhs;
}

inline bool operator<=(const Interval& lhs, const Interval& rhs) noexcept
{
    return !(rhs < lhs);
}

inline bool operator>=(const Interval& lhs, const Interval& rhs) noexcept
{
    return !(lhs < rhs);
}

/**
 Half-open intervals overlap iff max(begin) < min(end), closed intervals iff max(begin) <= min(end).
 A zero-length half-open interval therefore overlaps nothing.
 */
inline bool overlaps(const Interval& lhs, const Interval& rhs,
                     const IntervalClosure closure = IntervalClosure::half_open) noexcept
{
    const auto& max_begin = std::max(lhs.begin(), rhs.begin());
    const auto& min_end   = std::min(lhs.end(), rhs.end());
    return closure == IntervalClosure::closed ? max_begin <= min_end : max_begin < min_end;
}

inline std::ostream& operator<<(std::ostream& os, const Interval& interval)
{
    os << '[' << interval.begin() << ',' << interval.end() << ')';
    return os;
}

} // namespace rangejoin

#endif
