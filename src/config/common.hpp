// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef common_hpp
#define common_hpp

#include <boost/optional.hpp>

#include "logging/logging.hpp"

namespace rangejoin {

extern bool DEBUG_MODE;
extern bool TRACE_MODE;

namespace logging {
    boost::optional<DebugLogger> get_debug_log();
    boost::optional<TraceLogger> get_trace_log();
}

} // namespace rangejoin

#endif
