//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/log.hpp
// Purpose: Tagged, line-oriented log sink shared by the reload pipeline.
// Key invariants: Each record is emitted as one flushed line; records from
//                 concurrent threads never interleave within a line.
// Ownership/Lifetime: Borrows the output stream; the caller keeps it alive.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <mutex>
#include <ostream>
#include <string_view>

namespace hotswap::support
{

/// @brief Verbosity configuration for a LogSink.
struct LogConfig
{
    /// @brief Log levels, ordered from quietest to noisiest.
    enum Level
    {
        Off,   ///< Nothing is written
        Error, ///< Failures only
        Info,  ///< Cycle summaries and failures
        Debug  ///< Per-member decisions
    } level{Info};

    /// @brief Destination stream; std::cerr when null.
    std::ostream *stream = nullptr;

    /// @brief Check whether records of @p lvl are written.
    bool enabled(Level lvl) const;
};

/// @brief Parse a level name ("off", "error", "info", "debug").
/// @return True when @p text named a level.
bool parseLogLevel(std::string_view text, LogConfig::Level &out);

/// @brief Sink that formats and emits tagged log lines such as
///        "[hook] redirected int32 Game.Player::F()".
class LogSink
{
  public:
    explicit LogSink(LogConfig cfg = {});

    void error(std::string_view tag, std::string_view message);
    void info(std::string_view tag, std::string_view message);
    void debug(std::string_view tag, std::string_view message);

    /// @brief Emit @p message under @p tag when @p lvl is enabled.
    void write(LogConfig::Level lvl, std::string_view tag, std::string_view message);

    const LogConfig &config() const
    {
        return cfg_;
    }

  private:
    LogConfig cfg_;
    std::mutex mutex_;
};

} // namespace hotswap::support
