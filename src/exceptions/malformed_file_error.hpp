// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef malformed_file_error_hpp
#define malformed_file_error_hpp

#include <string>
#include <cstddef>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "user_error.hpp"

namespace rangejoin {

/**
 A MalformedFileError should be thrown when a user-specified file cannot be parsed as the
 required type.
 */
class MalformedFileError : public UserError
{
public:
    using Path = boost::filesystem::path;
    
    MalformedFileError() = delete;
    
    MalformedFileError(Path file, std::string required_type);
    
    virtual ~MalformedFileError() override = default;
    
    void set_reason(std::string reason) noexcept;
    
    void set_line_number(std::size_t line) noexcept;
    
private:
    virtual std::string do_why() const override;
    virtual std::string do_help() const override;
    
    Path file_;
    std::string required_type_;
    boost::optional<std::string> reason_;
    boost::optional<std::size_t> line_;
};

} // namespace rangejoin

#endif
