#pragma once
/*
===========================================================
Fragment 1.1 — Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Minimal logging used by the solvers, frontier search and CLI.
  - The point evaluator itself never logs (pure function).

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation).
  - Every level goes to stderr; stdout carries JSON artifacts only.
===========================================================
*/

#include <optional>
#include <string>
#include <string_view>

namespace fusion {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Set global logging verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;

// Get global logging verbosity.
LogLevel get_log_level() noexcept;

// Parse "debug" / "info" / "warn" / "error" (case-sensitive, lower case).
std::optional<LogLevel> parse_log_level(std::string_view s) noexcept;

// Cheap guard so callers can skip building expensive DEBUG strings.
bool log_enabled(LogLevel lvl) noexcept;

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

}  // namespace fusion
