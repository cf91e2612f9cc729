//
//  logging.hpp
//  Restyle
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <cstddef>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace restyle {

struct RestyleConfig;

/// @brief Logging level policy for Restyle.
///
/// Usage contract:
/// - `Error`: hard failures that prevent the requested operation.
/// - `Warn`: degraded behavior, fallback, invalid/missing runtime inputs, or
///   any suspicious condition users should see in non-verbose mode.
/// - `Info`: high-level lifecycle/profiling summaries (e.g. per-segment timing).
/// - `Debug`: deep diagnostics, segment boundaries, device decisions, and length fixups.
///
/// Important:
/// - `Warn` and `Error` logs must never be additionally gated by local flags
///   such as ad-hoc local booleans; global logger level controls visibility.
/// - `Debug` may be frequent and verbose.
enum class LogVerbosity {
    /// @brief Hard failure; requested operation cannot be completed.
    Error = 0,
    /// @brief Recoverable issue, fallback, or suspicious condition.
    Warn = 1,
    /// @brief Operational summary and profiling information.
    Info = 2,
    /// @brief Detailed internal diagnostics and trace data.
    Debug = 3
};

/// @brief Set the current global Restyle log verbosity.
void set_log_verbosity(LogVerbosity level);

/// @brief Get the current global Restyle log verbosity.
LogVerbosity get_log_verbosity();

/// @brief Configure Restyle log verbosity from config flags.
void set_log_verbosity_from_config(const RestyleConfig& config);

} // namespace restyle

inline constexpr restyle::LogVerbosity restyle_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return restyle::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return restyle::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return restyle::LogVerbosity::Info;
    }
    return restyle::LogVerbosity::Debug;
}

inline bool restyle_should_log(const char* level) {
    const auto current = restyle::get_log_verbosity();
    const auto severity = restyle_severity_for_tag(level ? level : "");
    return static_cast<int>(severity) <= static_cast<int>(current);
}

inline void restyle_log_impl(const char* level,
                             const std::string& message,
                             const char* file,
                             int line,
                             const char* func) {
    const std::string label = level ? level : "";
    if (label == "error") {
        std::cerr << "[Restyle][" << label << "][" << file << ":" << line
                  << " " << func << "] " << message << "\n";
        return;
    }

    std::cerr << "[Restyle][" << label << "] " << message << "\n";
}

inline void restyle_log_multiline_impl(const char* level,
                                       const std::string& message,
                                       const char* file,
                                       int line,
                                       const char* func) {
    if (message.empty()) {
        restyle_log_impl(level, message, file, line, func);
        return;
    }

    std::size_t start = 0;
    while (start <= message.size()) {
        const std::size_t end = message.find('\n', start);
        const std::size_t len =
            (end == std::string::npos) ? (message.size() - start) : (end - start);
        const std::string line_msg = message.substr(start, len);
        if (!line_msg.empty()) {
            restyle_log_impl(level, line_msg, file, line, func);
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
}

#define RESTYLE_LOG(level, message)                                              \
    do {                                                                         \
        if (restyle_should_log(level)) {                                         \
            std::ostringstream _restyle_log_stream;                              \
            _restyle_log_stream << message;                                      \
            restyle_log_multiline_impl(level,                                    \
                                       _restyle_log_stream.str(),                \
                                       __FILE__,                                 \
                                       __LINE__,                                 \
                                       __func__);                                \
        }                                                                        \
    } while (0)

#define RESTYLE_LOG_ERROR(message) RESTYLE_LOG("error", message)
#define RESTYLE_LOG_WARN(message) RESTYLE_LOG("warn", message)
#define RESTYLE_LOG_INFO(message) RESTYLE_LOG("info", message)
#define RESTYLE_LOG_DEBUG(message) RESTYLE_LOG("debug", message)
