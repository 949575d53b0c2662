// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef option_collation_hpp
#define option_collation_hpp

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "common.hpp"
#include "option_parser.hpp"
#include "core/join_options.hpp"

namespace fs = boost::filesystem;

namespace rangejoin { namespace options {

bool is_run_command(const OptionMap& options);

bool is_debug_mode(const OptionMap& options);
bool is_trace_mode(const OptionMap& options);

boost::optional<fs::path> get_debug_log_file_name(const OptionMap& options);
boost::optional<fs::path> get_trace_log_file_name(const OptionMap& options);

Operation get_operation(const OptionMap& options);

JoinOptions get_join_options(const OptionMap& options);

fs::path get_primary_path(const OptionMap& options);
fs::path get_secondary_path(const OptionMap& options);

// none means the result is written to stdout.
boost::optional<fs::path> get_output_path(const OptionMap& options);

char get_delimiter(const OptionMap& options);

} // namespace options
} // namespace rangejoin

#endif
