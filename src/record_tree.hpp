#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

inline constexpr const char* kRecordFileName = "tree_checksum.json";

struct FileDetail {
  std::string md5;
  uint64_t size = 0;
  double last_modified = 0.0;
};

// One directory. Children are held by shared_ptr so a node keeps its identity
// when it is cleared and refilled in place while its parent still points to it.
struct Record {
  std::optional<std::string> md5;
  std::optional<std::string> md5_files_only;
  uint64_t size = 0;
  uint64_t n_files = 0;
  uint64_t files_size = 0;
  std::map<std::string, std::shared_ptr<Record>> subdirectories;
  std::optional<std::map<std::string, FileDetail>> file_listing;
  std::optional<std::string> calculated_at;

  bool complete() const { return md5.has_value(); }
  bool scanned() const { return md5_files_only.has_value(); }
  void clear();
};

void to_json(nlohmann::json& j, const Record& record);
void from_json(const nlohmann::json& j, Record& record);

struct NodeLocation {
  std::shared_ptr<Record> target;
  std::vector<std::shared_ptr<Record>> ancestors; // root first, target's parent last
  std::vector<std::string> names;                 // names of ancestors[1..] and target
};

// Nearest directory at or above `start` that holds a record file.
std::optional<std::filesystem::path> find_record_file(const std::filesystem::path& start,
                                                      const std::string& file_name = kRecordFileName);

// Record file above `target` that would keep owning it. A record held by
// `target` itself does not count.
std::optional<std::filesystem::path> find_enclosing_record_file(const std::filesystem::path& target,
                                                                const std::string& file_name = kRecordFileName);

std::shared_ptr<Record> load_record_tree(const std::filesystem::path& record_file);

// Walks from `root` (the record stored in `record_file`) down to `target`,
// creating empty records for path components that were never scanned.
NodeLocation locate_node(const std::shared_ptr<Record>& root,
                         const std::filesystem::path& record_file,
                         const std::filesystem::path& target);

// Writes to "<record_file>.tmp" and renames over the destination.
bool write_record_file(const nlohmann::json& doc,
                       const std::filesystem::path& record_file,
                       std::string& error);

std::filesystem::path temporary_record_path(const std::filesystem::path& record_file);
