#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct DirectoryListing {
  std::vector<std::string> files;          // sorted, byte-wise
  std::vector<std::string> subdirectories; // sorted, byte-wise
};

struct FileStat {
  uint64_t size = 0;
  double last_modified = 0.0; // seconds since the epoch
};

// Immediate entries of `dir`. Symbolic links to directories are left out so
// a link cycle cannot make the walk recurse forever; links to regular files
// count as files. Returns nullopt when the directory cannot be read.
std::optional<DirectoryListing> enumerate_directory(const std::filesystem::path& dir,
                                                    std::string& error);

std::optional<FileStat> stat_file(const std::filesystem::path& file);
