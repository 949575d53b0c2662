// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef main_logging_hpp
#define main_logging_hpp

#include <string>

#include "logging.hpp"
#include "config/option_parser.hpp"
#include "core/join_options.hpp"

namespace rangejoin {

namespace detail {
    std::string make_banner();
}

void log_program_startup(); // Always uses InfoLogger

// Debug log only
void log_command_line(int argc, const char** argv, const options::OptionMap& option_map);

// One InfoLogger line naming the operation, join type, closure, and grouping
void log_run_configuration(options::Operation operation, const JoinOptions& join_options);

template <typename Log>
void log_program_end(Log& log)
{
    log << detail::make_banner();
}

inline void log_program_end()
{
    logging::InfoLogger log {};
    log_program_end(log);
}

} // namespace rangejoin

#endif
