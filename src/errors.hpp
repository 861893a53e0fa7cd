#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>

// Invalid combination of options or an unusable target; raised before any work.
class ConfigurationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A record that should have been complete was not (recalculate precondition).
class IncompleteRecordError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class RecordFormatError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// I/O failure while scanning one directory. The branch at `path` and every
// ancestor up to the starting record are left without an aggregate checksum.
class BranchError : public std::runtime_error {
public:
  BranchError(std::filesystem::path path, const std::string& reason)
    : std::runtime_error(reason + ": " + path.string()),
      path_(std::move(path)) {}

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};
