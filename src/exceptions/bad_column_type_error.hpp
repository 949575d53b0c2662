// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef bad_column_type_error_hpp
#define bad_column_type_error_hpp

#include <string>
#include <cstddef>

#include "user_error.hpp"
#include "basics/value.hpp"
#include "basics/coordinate.hpp"

namespace rangejoin {

/**
 A BadColumnTypeError should be thrown when the interval boundaries of a join do not share one kind
 of coordinate, e.g. a string date in a column of numbers.
 */
class BadColumnTypeError : public UserError
{
public:
    BadColumnTypeError() = delete;
    
    BadColumnTypeError(std::string column, std::string table, std::size_t row, ValueType found,
                       Coordinate::Kind expected);
    
    virtual ~BadColumnTypeError() override = default;
    
private:
    virtual std::string do_where() const override;
    virtual std::string do_why() const override;
    virtual std::string do_help() const override;
    
    std::string column_, table_;
    std::size_t row_;
    ValueType found_;
    Coordinate::Kind expected_;
};

} // namespace rangejoin

#endif
