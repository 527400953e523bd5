//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the tagged log sink.  Error records carry an "error:" marker so
// that they stand out when the sink shares stderr with the live program.
//
//===----------------------------------------------------------------------===//

#include "support/log.hpp"

#include <iostream>

namespace hotswap::support
{

bool LogConfig::enabled(Level lvl) const
{
    return level != Off && lvl != Off && lvl <= level;
}

bool parseLogLevel(std::string_view text, LogConfig::Level &out)
{
    if (text == "off")
        out = LogConfig::Off;
    else if (text == "error")
        out = LogConfig::Error;
    else if (text == "info")
        out = LogConfig::Info;
    else if (text == "debug")
        out = LogConfig::Debug;
    else
        return false;
    return true;
}

LogSink::LogSink(LogConfig cfg) : cfg_(cfg) {}

void LogSink::error(std::string_view tag, std::string_view message)
{
    write(LogConfig::Error, tag, message);
}

void LogSink::info(std::string_view tag, std::string_view message)
{
    write(LogConfig::Info, tag, message);
}

void LogSink::debug(std::string_view tag, std::string_view message)
{
    write(LogConfig::Debug, tag, message);
}

void LogSink::write(LogConfig::Level lvl, std::string_view tag, std::string_view message)
{
    if (!cfg_.enabled(lvl))
        return;
    std::ostream &os = cfg_.stream ? *cfg_.stream : std::cerr;
    std::lock_guard<std::mutex> lock(mutex_);
    os << '[' << tag << "] ";
    if (lvl == LogConfig::Error)
        os << "error: ";
    os << message << '\n';
    os.flush();
}

} // namespace hotswap::support
