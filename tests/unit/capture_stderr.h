#pragma once

#include "server/logging/logger.h"

#include <iostream>
#include <sstream>
#include <string>

namespace promptgw {
namespace testing {

// Redirects std::cerr for the lifetime of the object.
class CaptureStderr {
public:
  CaptureStderr() : previous_(std::cerr.rdbuf(buffer_.rdbuf())) {}
  ~CaptureStderr() { std::cerr.rdbuf(previous_); }
  std::string Text() const { return buffer_.str(); }

private:
  std::ostringstream buffer_;
  std::streambuf *previous_;
};

// Restores global logger settings on scope exit.
struct LoggerReset {
  ~LoggerReset() {
    log::SetJsonMode(false);
    log::SetMinLevel(log::Level::INFO);
  }
};

} // namespace testing
} // namespace promptgw
