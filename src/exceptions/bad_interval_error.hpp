// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef bad_interval_error_hpp
#define bad_interval_error_hpp

#include <string>
#include <cstddef>

#include <boost/optional.hpp>

#include "user_error.hpp"
#include "basics/interval.hpp"

namespace rangejoin {

/**
 A BadIntervalError should be thrown in strict mode when a row has a null boundary or a start
 greater than its end.
 */
class BadIntervalError : public UserError
{
public:
    using Position = Interval::Position;
    
    BadIntervalError() = delete;
    
    BadIntervalError(std::string table, std::size_t row,
                     boost::optional<Position> start, boost::optional<Position> end);
    
    virtual ~BadIntervalError() override = default;
    
    std::size_t row() const noexcept { return row_; }
    
private:
    virtual std::string do_where() const override;
    virtual std::string do_why() const override;
    virtual std::string do_help() const override;
    
    std::string table_;
    std::size_t row_;
    boost::optional<Position> start_, end_;
};

} // namespace rangejoin

#endif
