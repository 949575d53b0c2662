// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "main_logging.hpp"

#include <sstream>
#include <vector>

#include "config/config.hpp"
#include "config/common.hpp"
#include "utils/string_utils.hpp"

namespace rangejoin {

namespace detail {

std::string make_banner()
{
    return std::string(config::CommandLineWidth, '-');
}

std::string make_command_line(const int argc, const char** argv)
{
    const std::vector<std::string> arguments {argv, argv + argc};
    return utils::join(arguments, ' ');
}

} // namespace detail

void log_program_startup()
{
    logging::InfoLogger log {};
    const auto banner = detail::make_banner();
    log << banner;
    std::ostringstream ss {};
    ss << "rangejoin v" << config::Version;
    log << ss.str();
    log << config::CopyrightNotice;
    log << banner;
}

void log_command_line(const int argc, const char** argv, const options::OptionMap& option_map)
{
    if (auto debug_log = logging::get_debug_log()) {
        stream(*debug_log) << "Command line: " << detail::make_command_line(argc, argv);
        stream(*debug_log) << "Options: " << options::to_string(option_map, true, true);
    }
}

void log_run_configuration(const options::Operation operation, const JoinOptions& join_options)
{
    logging::InfoLogger log {};
    auto line = stream(log);
    line << "Running " << operation << " (" << join_options.how << ", "
         << (join_options.closed ? "closed" : "half-open") << " intervals";
    if (join_options.by && !join_options.by->empty()) {
        line << ", grouped by " << utils::join(*join_options.by, ',');
    }
    if (!join_options.strict) line << ", skipping invalid intervals";
    line << ")";
}

} // namespace rangejoin
