#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mfnam {

// Base of every error the library raises on purpose.
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Name file (or other input) could not be parsed.
class FormatError : public Error {
public:
  FormatError(const std::filesystem::path& file, std::size_t line, const std::string& msg)
  : Error("name file " + file.string() + " line " + std::to_string(line) + ": " + msg),
    file_(file), line_(line) {}

  const std::filesystem::path& file() const { return file_; }
  std::size_t line() const { return line_; }

private:
  std::filesystem::path file_;
  std::size_t line_ = 0;
};

class MissingDiscretizationError : public Error {
public:
  explicit MissingDiscretizationError(const std::string& msg) : Error(msg) {}
};

class InvalidLoadOnlyError : public Error {
public:
  explicit InvalidLoadOnlyError(std::vector<std::string> missing)
  : Error(make_message_(missing)), missing_(std::move(missing)) {}

  const std::vector<std::string>& missing() const { return missing_; }

private:
  std::vector<std::string> missing_;

  static std::string make_message_(const std::vector<std::string>& missing) {
    std::string msg = "the following load_only entries were not found in the name file:";
    for (std::size_t i = 0; i < missing.size(); ++i) {
      msg += (i == 0 ? " " : ",") + missing[i];
    }
    return msg;
  }
};

// Raised by an individual package loader. The load orchestrator recovers from
// it for every package except DIS.
class PackageLoadError : public Error {
public:
  PackageLoadError(const std::string& filetype, const std::filesystem::path& file, const std::string& msg)
  : Error(filetype + " package (" + file.string() + "): " + msg), filetype_(filetype) {}

  const std::string& filetype() const { return filetype_; }

private:
  std::string filetype_;
};

class IoError : public Error {
public:
  explicit IoError(const std::string& msg) : Error(msg) {}
};

class ConfigError : public Error {
public:
  explicit ConfigError(const std::string& msg) : Error(msg) {}
};

} // namespace mfnam
