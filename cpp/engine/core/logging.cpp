/*
===========================================================
Fragment 1.1 — Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
*/

#include "engine/core/logging.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace fusion {

static std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
static std::mutex g_log_mu;

static const char* level_tag(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "INFO";
  }
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

std::optional<LogLevel> parse_log_level(std::string_view s) noexcept {
  if (s == "debug") return LogLevel::DEBUG;
  if (s == "info")  return LogLevel::INFO;
  if (s == "warn")  return LogLevel::WARN;
  if (s == "error") return LogLevel::ERROR;
  return std::nullopt;
}

bool log_enabled(LogLevel lvl) noexcept {
  return static_cast<int>(lvl) >= g_level.load(std::memory_order_relaxed);
}

static std::string utc_timestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  std::time_t tt = clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  if (!log_enabled(lvl)) return;
  try {
    std::lock_guard<std::mutex> lk(g_log_mu);

    // stdout is reserved for artifacts (fusion_cli --out -).
    std::cerr << "[" << utc_timestamp() << "]"
              << "[" << level_tag(lvl) << "] "
              << msg << "\n";
    std::cerr.flush();
  } catch (const std::exception& e) {
    // Stream or allocation failure: fall back to raw stdio, still noexcept.
    std::fputs("[log failure] ", stderr);
    std::fputs(e.what(), stderr);
    std::fputs("\n", stderr);
  } catch (...) {
    // Non-std exception from a stream facet; the message is lost.
    std::fputs("[log failure] non-standard exception\n", stderr);
  }
}

}  // namespace fusion
