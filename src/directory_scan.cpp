#include "directory_scan.hpp"

#include <algorithm>
#include <system_error>

#include <sys/stat.h>

std::optional<DirectoryListing> enumerate_directory(const std::filesystem::path& dir,
                                                    std::string& error) {
  namespace fs = std::filesystem;
  DirectoryListing listing;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if(ec) {
    error = ec.message();
    return std::nullopt;
  }
  for(fs::directory_iterator end; it != end; it.increment(ec)) {
    const auto& entry = *it;
    std::error_code status_ec;
    auto link_status = entry.symlink_status(status_ec);
    if(status_ec) continue;
    auto name = entry.path().filename().string();
    if(fs::is_symlink(link_status)) {
      auto target = entry.status(status_ec);
      if(!status_ec && fs::is_regular_file(target)) {
        listing.files.push_back(std::move(name));
      }
      continue;
    }
    if(fs::is_directory(link_status)) {
      listing.subdirectories.push_back(std::move(name));
    } else if(fs::is_regular_file(link_status)) {
      listing.files.push_back(std::move(name));
    }
  }
  if(ec) {
    error = ec.message();
    return std::nullopt;
  }
  std::sort(listing.files.begin(), listing.files.end());
  std::sort(listing.subdirectories.begin(), listing.subdirectories.end());
  return listing;
}

std::optional<FileStat> stat_file(const std::filesystem::path& file) {
  struct stat st{};
  if(::stat(file.c_str(), &st) != 0) return std::nullopt;
  FileStat out;
  out.size = static_cast<uint64_t>(st.st_size);
  out.last_modified = static_cast<double>(st.st_mtim.tv_sec) +
                      static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
  return out;
}
