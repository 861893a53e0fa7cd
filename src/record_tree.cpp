#include "record_tree.hpp"

#include <fstream>
#include <system_error>

#include "errors.hpp"

namespace {

std::filesystem::path normalized(const std::filesystem::path& path) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(path, ec);
  if(ec) absolute = path;
  auto canonical = std::filesystem::weakly_canonical(absolute, ec);
  return ec ? absolute.lexically_normal() : canonical;
}

// what nlohmann writes in place of bytes that are not valid UTF-8
constexpr const char* kReplacementCharacter = "\xEF\xBF\xBD";

} // namespace

void Record::clear() {
  md5.reset();
  md5_files_only.reset();
  size = 0;
  n_files = 0;
  files_size = 0;
  subdirectories.clear();
  file_listing.reset();
  calculated_at.reset();
}

void to_json(nlohmann::json& j, const Record& record) {
  j = nlohmann::json::object();
  if(record.calculated_at) j["calculated_at"] = *record.calculated_at;
  if(!record.subdirectories.empty()) {
    auto& subs = j["subdirectories"];
    subs = nlohmann::json::object();
    for(const auto& [name, child] : record.subdirectories) {
      subs[name] = child ? nlohmann::json(*child) : nlohmann::json::object();
    }
  }
  if(record.file_listing) {
    auto& listing = j["file-listing"];
    listing = nlohmann::json::object();
    for(const auto& [name, detail] : *record.file_listing) {
      listing[name] = {
        {"MD5", detail.md5},
        {"size", detail.size},
        {"last-modified-at", detail.last_modified}
      };
    }
  }
  if(record.scanned()) {
    j["size"] = record.size;
    j["n_files"] = record.n_files;
    j["files-size"] = record.files_size;
    j["MD5-files_only"] = *record.md5_files_only;
  }
  if(record.md5) j["MD5"] = *record.md5;
}

void from_json(const nlohmann::json& j, Record& record) {
  if(!j.is_object()) {
    throw RecordFormatError("record entry is not an object");
  }
  record.clear();
  if(j.contains("calculated_at")) record.calculated_at = j.at("calculated_at").get<std::string>();
  if(j.contains("MD5")) record.md5 = j.at("MD5").get<std::string>();
  if(j.contains("MD5-files_only")) record.md5_files_only = j.at("MD5-files_only").get<std::string>();
  record.size = j.value("size", uint64_t{0});
  record.n_files = j.value("n_files", uint64_t{0});
  record.files_size = j.value("files-size", uint64_t{0});
  if(j.contains("subdirectories")) {
    for(const auto& item : j.at("subdirectories").items()) {
      auto child = std::make_shared<Record>();
      from_json(item.value(), *child);
      if(item.key().find(kReplacementCharacter) != std::string::npos) {
        // the on-disk name no longer matches the directory, so its checksum
        // cannot be recombined into the parent
        child->md5.reset();
      }
      record.subdirectories.emplace(item.key(), std::move(child));
    }
  }
  if(j.contains("file-listing")) {
    std::map<std::string, FileDetail> listing;
    for(const auto& item : j.at("file-listing").items()) {
      FileDetail detail;
      detail.md5 = item.value().at("MD5").get<std::string>();
      detail.size = item.value().value("size", uint64_t{0});
      detail.last_modified = item.value().value("last-modified-at", 0.0);
      listing.emplace(item.key(), std::move(detail));
    }
    record.file_listing = std::move(listing);
  }
}

std::optional<std::filesystem::path> find_record_file(const std::filesystem::path& start,
                                                      const std::string& file_name) {
  auto dir = normalized(start);
  while(true) {
    auto candidate = dir / file_name;
    std::error_code ec;
    if(std::filesystem::is_regular_file(candidate, ec)) {
      return candidate;
    }
    auto parent = dir.parent_path();
    if(parent.empty() || parent == dir) break;
    dir = parent;
  }
  return std::nullopt;
}

std::optional<std::filesystem::path> find_enclosing_record_file(const std::filesystem::path& target,
                                                                const std::string& file_name) {
  auto dir = normalized(target);
  auto found = find_record_file(dir.parent_path(), file_name);
  if(!found) return std::nullopt;
  std::error_code ec;
  if(std::filesystem::equivalent(*found, dir / file_name, ec)) return std::nullopt;
  return found;
}

std::shared_ptr<Record> load_record_tree(const std::filesystem::path& record_file) {
  std::ifstream in(record_file);
  if(!in) {
    throw RecordFormatError("Unable to open record file " + record_file.string());
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw RecordFormatError("Failed to parse " + record_file.string() + ": " + e.what());
  }
  auto root = std::make_shared<Record>();
  try {
    from_json(doc, *root);
  } catch(const nlohmann::json::exception& e) {
    throw RecordFormatError("Malformed record in " + record_file.string() + ": " + e.what());
  }
  return root;
}

NodeLocation locate_node(const std::shared_ptr<Record>& root,
                         const std::filesystem::path& record_file,
                         const std::filesystem::path& target) {
  auto base = normalized(record_file).parent_path();
  auto relative = normalized(target).lexically_relative(base);
  if(relative.empty() || *relative.begin() == "..") {
    throw ConfigurationError("Target " + target.string() +
                             " is not inside the tree recorded at " + record_file.string());
  }

  NodeLocation location;
  auto node = root;
  for(const auto& component : relative) {
    auto name = component.string();
    if(name.empty() || name == ".") continue;
    location.ancestors.push_back(node);
    location.names.push_back(name);
    auto& slot = node->subdirectories[name];
    if(!slot) slot = std::make_shared<Record>();
    node = slot;
  }
  location.target = node;
  return location;
}

std::filesystem::path temporary_record_path(const std::filesystem::path& record_file) {
  auto tmp = record_file;
  tmp += ".tmp";
  return tmp;
}

bool write_record_file(const nlohmann::json& doc,
                       const std::filesystem::path& record_file,
                       std::string& error) {
  auto tmp = temporary_record_path(record_file);
  std::string text;
  try {
    text = doc.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
  } catch(const nlohmann::json::exception& e) {
    error = std::string("unable to serialise record: ") + e.what();
    return false;
  }
  std::error_code ec;
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) {
      error = "unable to open " + tmp.string() + " for writing";
      return false;
    }
    out << text << '\n';
    out.flush();
    if(!out) {
      error = "write to " + tmp.string() + " failed";
      out.close();
      std::filesystem::remove(tmp, ec);
      return false;
    }
  }
  std::filesystem::rename(tmp, record_file, ec);
  if(ec) {
    error = "rename to " + record_file.string() + " failed: " + ec.message();
    std::filesystem::remove(tmp, ec);
    return false;
  }
  return true;
}
