#pragma once
/* Copyright (c) 2025 The propstore authors */

#include <exception>
#include <functional>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Warray-bounds"
#   pragma GCC diagnostic ignored "-Wstringop-overflow"
#endif
#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <spdlog/spdlog.h>
#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic pop
#endif
#include "format.hpp"

namespace propstore::logger {
    using level = spdlog::level::level_enum;

    // Configured through the environment:
    // PROPSTORE_LOG - a path to a log file, no file logging when not set
    // PROPSTORE_LOG_NO_CONSOLE - disables the stderr output
    // PROPSTORE_DEBUG - enables the trace level
    extern std::optional<std::string> log_path();
    extern spdlog::logger create(const std::optional<std::string> &path);
    // the process-wide logger created from the environment on first use
    extern spdlog::logger &get();

    template<typename... Args>
    void log(const level lev, const std::string_view &fmt, Args&&... a)
    {
        get().log(lev, fmt::format(fmt::runtime(fmt), std::forward<Args>(a)...));
    }

    template<typename... Args>
    void trace(const std::string_view &fmt, Args&&... a)
    {
        log(level::trace, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void debug(const std::string_view &fmt, Args&&... a)
    {
        log(level::debug, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void info(const std::string_view &fmt, Args&&... a)
    {
        log(level::info, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void warn(const std::string_view &fmt, Args&&... a)
    {
        log(level::warn, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void error(const std::string_view &fmt, Args&&... a)
    {
        log(level::err, fmt, std::forward<Args>(a)...);
    }

    // Runs main and logs an exception escaping it together with the location of the call.
    // Returns the caught exception, or nullptr when main completed.
    extern std::exception_ptr run_log_errors(const std::function<void()> &main,
        const std::source_location &loc=std::source_location::current());
}
