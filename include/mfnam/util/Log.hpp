#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace mfnam {

// Console logger used by the loader and the model. info() is gated on
// verbosity, warn() always prints.
class Log {
public:
  explicit Log(bool verbose = false, std::ostream* os = &std::cerr)
  : verbose_(verbose), os_(os ? os : &std::cerr) {}

  bool verbose() const { return verbose_; }
  void set_verbose(bool v) { verbose_ = v; }

  void info(const std::string& msg) const {
    if (verbose_) *os_ << "[mfnam] " << msg << "\n";
  }

  void warn(const std::string& msg) const {
    *os_ << "[mfnam] warning: " << msg << "\n";
  }

private:
  bool verbose_ = false;
  std::ostream* os_ = &std::cerr;
};

} // namespace mfnam
