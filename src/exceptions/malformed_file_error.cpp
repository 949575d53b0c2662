// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "malformed_file_error.hpp"

#include <utility>
#include <sstream>

namespace rangejoin {

MalformedFileError::MalformedFileError(Path file, std::string required_type)
: file_ {std::move(file)}
, required_type_ {std::move(required_type)}
{}

void MalformedFileError::set_reason(std::string reason) noexcept
{
    reason_ = std::move(reason);
}

void MalformedFileError::set_line_number(const std::size_t line) noexcept
{
    line_ = line;
}

std::string MalformedFileError::do_why() const
{
    std::ostringstream ss {};
    ss << "the file you specified " << file_ << " is not a valid " << required_type_ << " file";
    if (line_) {
        ss << " (line " << *line_ << ')';
    }
    if (reason_) {
        ss << ": " << *reason_;
    }
    return ss.str();
}

std::string MalformedFileError::do_help() const
{
    return "check the file has a header line and the same number of fields on every line";
}

} // namespace rangejoin
