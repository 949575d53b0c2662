// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef logging_hpp
#define logging_hpp

#define BOOST_LOG_DYN_LINK 1

#include <iostream>
#include <functional>
#include <sstream>
#include <string>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/global_logger_storage.hpp>

namespace rangejoin { namespace logging {

namespace src = boost::log::sources;

enum class severity_level { trace, debug, info, warning, error, fatal };

std::ostream& operator<<(std::ostream& os, severity_level level);

BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(logger, src::severity_logger_mt<severity_level>)

BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)

void init(boost::optional<boost::filesystem::path> debug_log = boost::none,
          boost::optional<boost::filesystem::path> trace_log = boost::none);

template <severity_level L>
class Logger
{
public:
    Logger() : lg_ {logger::get()} {}
    
    template <typename T> void write(const T& msg) { BOOST_LOG_SEV(lg_.get(), L) << msg; }
    
private:
    std::reference_wrapper<src::severity_logger_mt<severity_level>> lg_;
};

template <severity_level L, typename T>
Logger<L>& operator<<(Logger<L>& lg, const T& msg)
{
    lg.write(msg);
    return lg;
}

class TraceLogger   : public Logger<severity_level::trace> {};
class DebugLogger   : public Logger<severity_level::debug> {};
class InfoLogger    : public Logger<severity_level::info> {};
class WarningLogger : public Logger<severity_level::warning> {};
class ErrorLogger   : public Logger<severity_level::error> {};

// Buffers a multi-line message and writes it as a single record when destroyed.
template <typename Log>
class LogStream
{
public:
    LogStream() = delete;
    
    LogStream(Log& log, const unsigned indent_size = 0) : log_ {log}, msg_ {}, newline_indent_ {}
    {
        if (indent_size > 0) {
            newline_indent_ = '\n' +  std::string(indent_size, ' ');
        }
    }
    
    LogStream(const LogStream&)            = delete;
    LogStream& operator=(const LogStream&) = delete;
    LogStream(LogStream&&)                 = default;
    LogStream& operator=(LogStream&&)      = default;
    
    ~LogStream()
    {
        auto str = msg_.str();
        if (!str.empty() && str.back() == '\n') {
            str.pop_back();
        }
        if (!newline_indent_.empty()) {
            boost::replace_all(str, "\n", newline_indent_);
        }
        log_.get() << str;
    }
    
    template <typename M> void write(const M& msg) { msg_ << msg; }
    
private:
    std::reference_wrapper<Log> log_;
    std::ostringstream msg_;
    std::string newline_indent_;
};

template <typename Log>
void log_empty_line(Log& log)
{
    log << "";
}

template <typename Log>
auto stream(Log& log, const unsigned newline_indent = 4)
{
    return LogStream<Log> {log, newline_indent};
}

template <typename T, typename M>
LogStream<T>& operator<<(LogStream<T>& lg, const M& msg)
{
    lg.write(msg);
    return lg;
}

template <typename T, typename M>
LogStream<T>& operator<<(LogStream<T>&& lg, const M& msg)
{
    lg.write(msg);
    return lg;
}

} // namespace logging
} // namespace rangejoin

#endif
