/*
  Fragment 1.1t — Logging Selftest

  Objective
  ---------
  Framework-free checks for the logger:
    1) Level names parse; the level gate filters lower levels.
    2) Messages go to stderr with their level tag.
    3) A sink that throws, std or not, never escapes log().

  Expected use
  ------------
    ./logging_selftest     (non-zero exit on failure)
*/

#include <iostream>
#include <sstream>
#include <streambuf>
#include <string>
#include <string_view>

#include "engine/core/logging.hpp"

namespace fusion {
namespace {

static int g_fail_count = 0;

void expect_true(bool v, std::string_view msg) {
  if (!v) {
    ++g_fail_count;
    std::cerr << "[FAIL] " << msg << "\n";
  } else {
    std::cerr << "[ OK ] " << msg << "\n";
  }
}

// Throws a non-std type from every write.
class ThrowingBuf : public std::streambuf {
 protected:
  int_type overflow(int_type) override { throw 42; }
  std::streamsize xsputn(const char*, std::streamsize) override { throw 42; }
};

void test_levels() {
  expect_true(parse_log_level("debug") == LogLevel::DEBUG, "debug parses");
  expect_true(parse_log_level("error") == LogLevel::ERROR, "error parses");
  expect_true(!parse_log_level("INFO").has_value(), "level names are lower case");

  const LogLevel saved = get_log_level();
  set_log_level(LogLevel::WARN);
  expect_true(!log_enabled(LogLevel::INFO) && log_enabled(LogLevel::ERROR), "WARN gate filters INFO");
  set_log_level(saved);
}

void test_stderr_sink() {
  const LogLevel saved = get_log_level();
  set_log_level(LogLevel::INFO);

  std::ostringstream captured;
  std::streambuf* old = std::cerr.rdbuf(captured.rdbuf());
  log(LogLevel::INFO, "point evaluated");
  log(LogLevel::DEBUG, "hidden detail");
  std::cerr.rdbuf(old);
  set_log_level(saved);

  const std::string text = captured.str();
  expect_true(text.find("[INFO] point evaluated") != std::string::npos, "INFO line written to stderr");
  expect_true(text.find("hidden detail") == std::string::npos, "DEBUG below the gate is dropped");
}

void test_throwing_sink() {
  ThrowingBuf buf;
  std::streambuf* old = std::cerr.rdbuf(&buf);
  std::cerr.exceptions(std::ios_base::badbit);
  log(LogLevel::ERROR, "sink throws an int");
  std::cerr.exceptions(std::ios_base::goodbit);
  std::cerr.clear();
  std::cerr.rdbuf(old);

  expect_true(true, "non-std exception from the sink does not escape log()");
  log(LogLevel::WARN, "logger usable after a sink failure");
  expect_true(std::cerr.good(), "stderr usable after a sink failure");
}

}  // namespace
}  // namespace fusion

int main() {
  using namespace fusion;

  test_levels();
  test_stderr_sink();
  test_throwing_sink();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
