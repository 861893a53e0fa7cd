#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "branch_calculator.hpp"
#include "log.hpp"
#include "occasion_throttle.hpp"
#include "record_tree.hpp"

using ProgressHook = std::function<void(uint64_t total_files, uint64_t files_done)>;

struct TreeOptions {
  std::filesystem::path target;
  bool continue_previous = false;
  bool start_new = false;
  bool detail_files = false;
  std::size_t parallelism = 1;
  std::chrono::duration<double> new_record_pause{5.0};
  std::string record_file_name = kRecordFileName;
  OccasionThrottle::Options occasions;
  ProgressHook on_progress;
  FileDigest file_digest = compute_file_md5;
};

// Computes (or resumes) the checksum tree for options.target and persists it
// in the nearest record file at or above the target. Throws ConfigurationError
// before doing any work when the options conflict, BranchError after saving
// partial results when part of the tree could not be read, and
// IncompleteRecordError when an ancestor cannot be recombined.
void compute_tree(const TreeOptions& options, std::shared_ptr<Logger> logger = nullptr);
