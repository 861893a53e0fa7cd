#include "branch_calculator.hpp"

#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <vector>

#include "directory_scan.hpp"
#include "errors.hpp"
#include "utils.hpp"

BranchCalculator::BranchCalculator(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(std::move(logger)),
    throttle_(options_.occasions) {
  if(options_.n_parallel == 0) options_.n_parallel = 1;
  if(!options_.file_digest) options_.file_digest = compute_file_md5;
  if(options_.n_parallel > 1) {
    pool_ = std::make_unique<WorkerPool>(options_.n_parallel);
  }
  log_debug(logger_.get(), "Using {} threads in parallel.", options_.n_parallel);
}

BranchCalculator::~BranchCalculator() = default;

bool BranchCalculator::try_reserve_slot() {
  auto current = in_flight_.load();
  do {
    if(current >= options_.n_parallel) return false;
  } while(!in_flight_.compare_exchange_weak(current, current + 1));

  auto reserved = current + 1;
  auto peak = peak_in_flight_.load();
  while(reserved > peak && !peak_in_flight_.compare_exchange_weak(peak, reserved)) {}
  return true;
}

void BranchCalculator::release_slot() {
  in_flight_.fetch_sub(1);
}

void BranchCalculator::poll_occasion() {
  throttle_.poll();
}

bool BranchCalculator::is_own_record_file(const std::string& name, std::size_t depth) const {
  if(depth != 0) return false;
  return name == options_.record_file_name ||
         name == options_.record_file_name + ".tmp";
}

void BranchCalculator::compute_branch(Record& record,
                                      const std::filesystem::path& dir,
                                      std::size_t depth) {
  poll_occasion();

  std::string error;
  auto listing = enumerate_directory(dir, error);
  if(!listing) {
    throw BranchError(dir, "Unable to enumerate directory (" + error + ")");
  }
  const auto& subdir_names = listing->subdirectories;
  const auto& file_names = listing->files;
  total_files_ += file_names.size() + subdir_names.size();

  std::vector<std::shared_ptr<Record>> children;
  children.reserve(subdir_names.size());
  {
    std::shared_lock<std::shared_mutex> lock(tree_mutex_);
    std::map<std::string, std::shared_ptr<Record>> next;
    for(const auto& name : subdir_names) {
      std::shared_ptr<Record> child;
      if(options_.continue_previous) {
        auto it = record.subdirectories.find(name);
        if(it != record.subdirectories.end()) child = it->second;
      }
      if(!child) child = std::make_shared<Record>();
      next.emplace(name, child);
      children.push_back(std::move(child));
    }
    record.subdirectories.swap(next);
    record.md5.reset();
  }

  std::vector<std::future<void>> pending;
  std::size_t were_parallel = 0;
  std::size_t failed = 0;
  std::exception_ptr fatal;

  for(std::size_t i = 0; i < children.size() && !fatal; ++i) {
    auto child = children[i];
    if(child->complete()) continue;
    auto sub_dir = dir / subdir_names[i];
    if(pool_ && try_reserve_slot()) {
      try {
        pending.push_back(pool_->submit([this, child, sub_dir, depth](){
          SlotGuard guard(*this);
          compute_branch(*child, sub_dir, depth + 1);
        }));
      } catch(...) {
        release_slot();
        fatal = std::current_exception();
        break;
      }
      ++were_parallel;
      continue;
    }
    try {
      compute_branch(*child, sub_dir, depth + 1);
    } catch(const BranchError& e) {
      ++failed;
      log_warn(logger_.get(), "Skipping incomplete branch: {}", e.what());
    } catch(...) {
      fatal = std::current_exception();
    }
  }

  for(auto& job : pending) {
    try {
      job.get();
    } catch(const BranchError& e) {
      ++failed;
      log_warn(logger_.get(), "Skipping incomplete branch: {}", e.what());
    } catch(...) {
      if(!fatal) fatal = std::current_exception();
    }
  }
  if(fatal) std::rethrow_exception(fatal);
  if(failed > 0) {
    throw BranchError(dir, std::to_string(failed) + " subdirectories could not be completed");
  }
  if(were_parallel > 0) {
    log_debug(logger_.get(), "{} subdirectories were analyzed in parallel.", were_parallel);
  }

  Md5Accumulator checksum;
  uint64_t total_size = 0;
  for(std::size_t i = 0; i < children.size(); ++i) {
    checksum.update(subdir_names[i]);
    checksum.update(*children[i]->md5);
    total_size += children[i]->size;
    ++files_done_;
    poll_occasion();
  }
  log_debug(logger_.get(), "After subdirectories, MD5 is: {}", checksum.hex_digest());

  Md5Accumulator files_md5;
  uint64_t n_files = 0;
  uint64_t files_size = 0;
  std::map<std::string, FileDetail> file_listing;
  for(const auto& name : file_names) {
    if(is_own_record_file(name, depth)) {
      ++files_done_;
      continue;
    }
    auto path = dir / name;
    auto stat = stat_file(path);
    if(!stat) throw BranchError(path, "Unable to stat file");
    auto digest = options_.file_digest(path);
    if(!digest) throw BranchError(path, "Unable to read file");

    files_md5.update(name);
    files_md5.update(*digest);
    log_trace(logger_.get(), "After file '{}', MD5-files_only is: {}", name, files_md5.hex_digest());
    ++n_files;
    files_size += stat->size;
    if(options_.detail_files) {
      file_listing[name] = FileDetail{*digest, stat->size, stat->last_modified};
    }
    ++files_done_;
    poll_occasion();
  }
  auto files_hex = files_md5.hex_digest();
  checksum.update(files_hex);
  auto aggregate = checksum.hex_digest();
  log_debug(logger_.get(), "After files, MD5 is: {}", aggregate);

  std::shared_lock<std::shared_mutex> lock(tree_mutex_);
  record.size = total_size + files_size;
  record.n_files = n_files;
  record.files_size = files_size;
  if(options_.detail_files) {
    record.file_listing = std::move(file_listing);
  } else {
    record.file_listing.reset();
  }
  record.md5_files_only = files_hex;
  record.md5 = aggregate;
}

void BranchCalculator::recalculate(Record& record) const {
  Md5Accumulator checksum;
  for(const auto& [name, child] : record.subdirectories) {
    if(!child || !child->complete()) {
      throw IncompleteRecordError("Cannot recalculate this record because sub-record '" + name +
                                  "' does not have a completed checksum.");
    }
    checksum.update(name);
    checksum.update(*child->md5);
  }
  // never scanned itself; stays incomplete until a --continue run reaches it
  if(!record.md5_files_only && !record.md5) return;
  if(!record.md5_files_only) {
    throw IncompleteRecordError("Cannot recalculate a record without a files-only checksum.");
  }
  checksum.update(*record.md5_files_only);

  std::shared_lock<std::shared_mutex> lock(tree_mutex_);
  record.md5 = checksum.hex_digest();
}

nlohmann::json BranchCalculator::snapshot(const Record& root) const {
  std::unique_lock<std::shared_mutex> lock(tree_mutex_);
  return nlohmann::json(root);
}
