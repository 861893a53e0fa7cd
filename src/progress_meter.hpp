#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

std::string format_progress_meter(uint64_t files_done, uint64_t total_files, std::size_t slots);

// Single-line meter redrawn in place with '\r'.
class ProgressDisplay {
public:
  ProgressDisplay(std::ostream& out, std::size_t slots);

  void update(uint64_t total_files, uint64_t files_done);
  void finish();

private:
  std::ostream& out_;
  std::size_t slots_;
  std::size_t line_width_ = 0;
  std::mutex mutex_;
};
