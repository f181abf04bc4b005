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

#include <source_location>
#include <string>

namespace FCE {

/// Severity of an engine diagnostic, lowest first. Off silences a backend.
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Destination for engine diagnostics
 *
 * Logger forwards every LOG_* record here. SpdlogBackend is installed when
 * nothing else is; a host that already owns a log pipeline hands its own
 * implementation to Logger::setBackend() before building definitions.
 *
 * @code
 * class WorkflowAuditLog : public FCE::ILoggerBackend {
 * public:
 *     explicit WorkflowAuditLog(AuditSink &sink) : sink_(sink) {}
 *
 *     void log(FCE::LogLevel level, const std::string &message, const std::source_location &loc) override {
 *         if (level >= minLevel_) {
 *             sink_.append(loc.file_name(), loc.line(), message);
 *         }
 *     }
 *
 *     void setLevel(FCE::LogLevel level) override { minLevel_ = level; }
 *     void flush() override { sink_.sync(); }
 *
 * private:
 *     AuditSink &sink_;
 *     FCE::LogLevel minLevel_ = FCE::LogLevel::Info;
 * };
 *
 * FCE::Logger::setBackend(std::make_unique<WorkflowAuditLog>(sink));
 * @endcode
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @param level Severity of the record
     * @param message Formatted text, already prefixed with the calling function
     * @param loc Call site captured by the LOG_* macro
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    /// Records below level are dropped by the backend.
    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

}  // namespace FCE
