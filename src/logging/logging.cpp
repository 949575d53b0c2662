// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "logging.hpp"

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>

namespace rangejoin { namespace logging {

namespace sinks    = boost::log::sinks;
namespace keywords = boost::log::keywords;
namespace expr     = boost::log::expressions;

std::ostream& operator<<(std::ostream& os, const severity_level level)
{
    switch (level) {
        case severity_level::trace: os << "TRCE"; break;
        case severity_level::debug: os << "DEBG"; break;
        case severity_level::info: os << "INFO"; break;
        case severity_level::warning: os << "WARN"; break;
        case severity_level::error: os << "ERRR"; break;
        case severity_level::fatal: os << "FATL"; break;
    }
    return os;
}

namespace {

auto make_format()
{
    return expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "[%Y-%m-%d %H:%M:%S]")
            << " <" << severity
            << "> " << expr::smessage;
}

} // namespace

void init(boost::optional<boost::filesystem::path> debug_log,
          boost::optional<boost::filesystem::path> trace_log)
{
    boost::log::add_console_log(std::clog,
                                keywords::filter = severity >= severity_level::info,
                                keywords::format = make_format());
    if (debug_log) {
        boost::log::add_file_log(keywords::file_name = debug_log->string(),
                                 keywords::filter = severity >= severity_level::debug,
                                 keywords::format = make_format());
    }
    if (trace_log) {
        boost::log::add_file_log(keywords::file_name = trace_log->string(),
                                 keywords::format = make_format());
    }
    boost::log::add_common_attributes();
}

} // namespace logging
} // namespace rangejoin
