#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "occasion_throttle.hpp"
#include "record_tree.hpp"
#include "utils.hpp"
#include "worker_pool.hpp"

// Content digest of one file, or nullopt when it cannot be read.
using FileDigest = std::function<std::optional<std::string>(const std::filesystem::path&)>;

class BranchCalculator {
public:
  struct Options {
    bool continue_previous = false;
    bool detail_files = false;
    std::size_t n_parallel = 1;
    std::string record_file_name = kRecordFileName;
    OccasionThrottle::Options occasions;
    FileDigest file_digest = compute_file_md5;
  };

  explicit BranchCalculator(Options options, std::shared_ptr<Logger> logger = nullptr);
  ~BranchCalculator();

  BranchCalculator(const BranchCalculator&) = delete;
  BranchCalculator& operator=(const BranchCalculator&) = delete;

  // Fills `record` for `dir` and leaves record.md5 set. `depth` is the
  // distance from the directory holding the record file; the record file is
  // only excluded from hashing at depth 0. Throws BranchError when part of the
  // subtree could not be read; completed sub-records keep their checksums.
  void compute_branch(Record& record, const std::filesystem::path& dir, std::size_t depth);

  // Recombines `record.md5` from its stored children and files-only checksum
  // without touching the filesystem. Throws IncompleteRecordError when a
  // child lacks a checksum; otherwise a no-op for a record never scanned.
  void recalculate(Record& record) const;

  // Serialises the tree while no branch is mid-update.
  nlohmann::json snapshot(const Record& root) const;

  OccasionThrottle& throttle() { return throttle_; }

  uint64_t total_files() const { return total_files_.load(); }
  uint64_t files_done() const { return files_done_.load(); }
  std::size_t in_flight() const { return in_flight_.load(); }
  std::size_t peak_in_flight() const { return peak_in_flight_.load(); }

private:
  struct SlotGuard {
    explicit SlotGuard(BranchCalculator& owner) : owner_(owner) {}
    ~SlotGuard() { owner_.release_slot(); }
    BranchCalculator& owner_;
  };

  bool try_reserve_slot();
  void release_slot();
  void poll_occasion();
  bool is_own_record_file(const std::string& name, std::size_t depth) const;

  Options options_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<WorkerPool> pool_;
  OccasionThrottle throttle_;
  mutable std::shared_mutex tree_mutex_;
  std::atomic<uint64_t> total_files_{0};
  std::atomic<uint64_t> files_done_{0};
  std::atomic<std::size_t> in_flight_{0};
  std::atomic<std::size_t> peak_in_flight_{0};
};
