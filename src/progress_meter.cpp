#include "progress_meter.hpp"

#include <algorithm>
#include <sstream>

std::string format_progress_meter(uint64_t files_done, uint64_t total_files, std::size_t slots) {
  slots = std::max<std::size_t>(1, slots);
  std::size_t filled = 0;
  if(total_files > 0) {
    auto clamped = std::min(files_done, total_files);
    filled = static_cast<std::size_t>((clamped * slots) / total_files);
  }
  std::string bar(filled, '#');
  bar.append(slots - filled, '_');

  std::ostringstream line;
  line << '[' << bar << "]  " << files_done << '/' << total_files;
  if(total_files > 0) {
    line << "  (" << (std::min(files_done, total_files) * 100 / total_files) << "%)";
  }
  return line.str();
}

ProgressDisplay::ProgressDisplay(std::ostream& out, std::size_t slots)
  : out_(out), slots_(slots) {}

void ProgressDisplay::update(uint64_t total_files, uint64_t files_done) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto rendered = format_progress_meter(files_done, total_files, slots_);
  out_ << '\r' << rendered;
  if(rendered.size() < line_width_) {
    out_ << std::string(line_width_ - rendered.size(), ' ');
  } else {
    line_width_ = rendered.size();
  }
  out_.flush();
}

void ProgressDisplay::finish() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(line_width_ > 0) {
    out_ << '\n';
    out_.flush();
    line_width_ = 0;
  }
}
