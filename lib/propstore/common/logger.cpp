/* Copyright (c) 2025 The propstore authors */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <vector>

#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Warray-bounds"
#   pragma GCC diagnostic ignored "-Wstringop-overflow"
#endif
#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#if defined(__GNUC__) && !defined(__clang__)
#   pragma GCC diagnostic pop
#endif

#include "logger.hpp"

namespace propstore::logger {
    std::optional<std::string> log_path()
    {
        if (const char *env_log_path = std::getenv("PROPSTORE_LOG"); env_log_path && *env_log_path)
            return std::string { env_log_path };
        return {};
    }

    static bool env_flag(const char *name)
    {
        return std::getenv(name) != nullptr;
    }

    spdlog::logger create(const std::optional<std::string> &path)
    {
        std::vector<spdlog::sink_ptr> sinks {};
        if (path) {
            if (const auto dir = std::filesystem::path { *path }.parent_path(); !dir.empty())
                std::filesystem::create_directories(dir);
            {
                std::ofstream os { *path, std::ios_base::app };
                if (!os) {
                    std::cerr << fmt::format("INIT: Unable to write to the log file: {}; terminating.\n", *path);
                    std::terminate();
                }
            }
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*path);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
            sinks.emplace_back(std::move(file_sink));
        }
        if (!env_flag("PROPSTORE_LOG_NO_CONSOLE")) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
            sinks.emplace_back(std::move(console_sink));
        }
        spdlog::logger logger { "propstore", sinks.begin(), sinks.end() };
        logger.set_level(env_flag("PROPSTORE_DEBUG") ? spdlog::level::trace : spdlog::level::debug);
        logger.flush_on(spdlog::level::debug);
        if (path)
            logger.log(spdlog::level::debug, fmt::format("log path: {}", *path));
        return logger;
    }

    spdlog::logger &get()
    {
        static spdlog::logger logger = create(log_path());
        return logger;
    }

    std::exception_ptr run_log_errors(const std::function<void()> &main, const std::source_location &loc)
    {
        try {
            main();
        } catch (const std::exception &ex) {
            error("{}:{}: {}", loc.file_name(), loc.line(), ex.what());
            return std::current_exception();
        } catch (...) {
            error("{}:{}: a non-standard exception", loc.file_name(), loc.line());
            return std::current_exception();
        }
        return {};
    }
}
