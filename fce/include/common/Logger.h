// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-FCE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of FCE (FSM Core Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: see LICENSE

#pragma once

#include "common/ILoggerBackend.h"
#include <format>
#include <memory>
#include <source_location>
#include <string>

namespace FCE {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * Two usage patterns:
 *
 * 1. Default mode: spdlog backend created lazily on first use
 * 2. Custom mode: the host application injects its own ILoggerBackend
 *
 * Example: Using default logger
 * @code
 * FCE::Logger::initialize();
 * LOG_INFO("Order workflow loaded");
 * @endcode
 *
 * Example: Injecting custom logger
 * @code
 * FCE::Logger::setBackend(std::make_unique<MyCustomLogger>());
 * LOG_INFO("Order workflow loaded");  // Uses MyCustomLogger
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     *
     * Replaces the current backend with a user-provided implementation.
     *
     * @param backend User's logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (stdout, no file)
     *
     * Creates default backend if no custom backend was injected.
     */
    static void initialize();

    /**
     * @brief Initialize default logger with file output
     *
     * @param logDir Directory for log files
     * @param logToFile Enable file logging
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    /**
     * @brief Set minimum log level
     *
     * @param level Minimum level to log
     */
    static void setLevel(LogLevel level);

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    /**
     * @brief Flush log buffers
     */
    static void flush();

private:
    static std::unique_ptr<ILoggerBackend> backend_;
    static void ensureBackend();
    static void write(LogLevel level, const std::string &message, const std::source_location &loc);
    static std::string extractCleanFunctionName(const std::source_location &loc);
};

}  // namespace FCE

// std::format based macros capturing the caller's source_location
#define LOG_TRACE(...) FCE::Logger::trace(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) FCE::Logger::debug(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) FCE::Logger::info(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) FCE::Logger::warn(std::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) FCE::Logger::error(std::format(__VA_ARGS__), std::source_location::current())
