// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef missing_column_error_hpp
#define missing_column_error_hpp

#include <string>

#include "user_error.hpp"

namespace rangejoin {

/**
 A MissingColumnError should be thrown when a column referenced by a join (start, end, or a group
 key) is not present in one of the input tables.
 */
class MissingColumnError : public UserError
{
public:
    MissingColumnError() = delete;
    
    MissingColumnError(std::string column, std::string table, std::string where);
    
    virtual ~MissingColumnError() override = default;
    
    const std::string& column() const noexcept { return column_; }
    
private:
    virtual std::string do_where() const override;
    virtual std::string do_why() const override;
    virtual std::string do_help() const override;
    
    std::string column_, table_, where_;
};

} // namespace rangejoin

#endif
