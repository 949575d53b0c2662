// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef invalid_join_mode_error_hpp
#define invalid_join_mode_error_hpp

#include <string>

#include "user_error.hpp"

namespace rangejoin {

/**
 An InvalidJoinModeError should be thrown when a join mode is unknown, or is not supported by the
 requested operation.
 */
class InvalidJoinModeError : public UserError
{
public:
    InvalidJoinModeError() = delete;
    
    InvalidJoinModeError(std::string mode, std::string operation);
    
    virtual ~InvalidJoinModeError() override = default;
    
private:
    virtual std::string do_where() const override;
    virtual std::string do_why() const override;
    virtual std::string do_help() const override;
    
    std::string mode_, operation_;
};

} // namespace rangejoin

#endif
