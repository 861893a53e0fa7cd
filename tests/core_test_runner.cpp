#include "command_line_parser.hpp"
#include "directory_scan.hpp"
#include "errors.hpp"
#include "occasion_throttle.hpp"
#include "progress_meter.hpp"
#include "record_tree.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <sstream>
#include <thread>

using namespace tree::test;

namespace {

bool test_md5_known_values(TestContext&) {
  check_eq(md5_hex(""), std::string("d41d8cd98f00b204e9800998ecf8427e"), "md5 of empty string");
  check_eq(md5_hex("hello"), std::string("5d41402abc4b2a76b9719d911017c592"), "md5 of hello");

  Md5Accumulator acc;
  acc.update("hel");
  auto partial = acc.hex_digest();
  acc.update("lo");
  check_eq(partial, md5_hex("hel"), "digest of prefix");
  check_eq(acc.hex_digest(), md5_hex("hello"), "digest keeps accepting input");
  check_eq(acc.hex_digest(), md5_hex("hello"), "digest is repeatable");
  return true;
}

bool test_file_md5(TestContext&) {
  TempTree tree("file_md5");
  tree.write("a.txt", "hello");
  tree.write("empty", "");
  check_eq(compute_file_md5(tree / "a.txt"), md5_hex("hello"), "file digest");
  check_eq(compute_file_md5(tree / "empty"), md5_hex(""), "empty file digest");
  check(!compute_file_md5(tree / "missing").has_value(), "missing file has no digest");
  return true;
}

bool test_enumerate_sorted(TestContext&) {
  TempTree tree("enumerate");
  tree.write("b", "1");
  tree.write("a", "2");
  tree.write("B", "3");
  tree.mkdir("z");
  tree.mkdir("c");
  std::filesystem::create_directory_symlink(tree / "c", tree / "link_dir");
  std::filesystem::create_symlink(tree / "a", tree / "link_file");

  std::string error;
  auto listing = enumerate_directory(tree.root(), error);
  check(listing.has_value(), "listing produced");
  check_eq(listing->files, std::vector<std::string>{"B", "a", "b", "link_file"}, "files sorted byte-wise");
  check_eq(listing->subdirectories, std::vector<std::string>{"c", "z"}, "directory links skipped");

  auto missing = enumerate_directory(tree / "nope", error);
  check(!missing.has_value(), "missing directory fails");
  check(!error.empty(), "error text reported");
  return true;
}

bool test_throttle_fires_then_backs_off(TestContext&) {
  OccasionThrottle::Options options;
  options.initial_interval = std::chrono::duration<double>(0.0);
  OccasionThrottle throttle(options);
  int fired = 0;
  throttle.set_callback([&](){ ++fired; });

  check(throttle.poll(), "first poll fires");
  check_eq(fired, 1, "callback ran once");
  check(throttle.interval().count() == 60.0, "cheap callback backs off to a minute");
  check(!throttle.poll(), "second poll within interval does nothing");
  check_eq(throttle.occasions(), std::size_t{1}, "one occasion counted");
  return true;
}

bool test_throttle_scales_with_cost(TestContext&) {
  OccasionThrottle::Options options;
  options.initial_interval = std::chrono::duration<double>(0.0);
  options.cheap_threshold = std::chrono::duration<double>(0.01);
  OccasionThrottle throttle(options);
  throttle.set_callback([](){
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
  });
  check(throttle.poll(), "fires");
  auto interval = throttle.interval().count();
  check(interval >= 0.9 && interval < 60.0, "expensive callback interval is 25x its cost");
  return true;
}

bool test_throttle_never_blocks(TestContext&) {
  OccasionThrottle::Options options;
  options.initial_interval = std::chrono::duration<double>(0.0);
  OccasionThrottle throttle(options);
  std::atomic<bool> entered{false};
  std::atomic<bool> release{false};
  throttle.set_callback([&](){
    entered = true;
    while(!release) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  });

  std::thread firing([&](){ throttle.poll(); });
  while(!entered) std::this_thread::sleep_for(std::chrono::milliseconds(1));

  auto start = std::chrono::steady_clock::now();
  bool fired = throttle.poll();
  auto waited = std::chrono::steady_clock::now() - start;
  release = true;
  firing.join();

  check(!fired, "busy throttle is skipped");
  check(waited < std::chrono::milliseconds(500), "poll returned without waiting");
  check_eq(throttle.occasions(), std::size_t{1}, "only the first poll fired");
  return true;
}

bool test_worker_pool(TestContext&) {
  WorkerPool pool(3);
  check_eq(pool.size(), std::size_t{3}, "pool size");
  std::atomic<int> sum{0};
  std::vector<std::future<void>> results;
  for(int i = 1; i <= 10; ++i) {
    results.push_back(pool.submit([&sum, i](){ sum += i; }));
  }
  for(auto& result : results) result.get();
  check_eq(sum.load(), 55, "all tasks ran");

  auto failing = pool.submit([](){ throw std::runtime_error("boom"); });
  bool threw = false;
  try {
    failing.get();
  } catch(const std::runtime_error& e) {
    threw = std::string(e.what()) == "boom";
  }
  check(threw, "task exception reaches the future");
  return true;
}

bool test_find_record_file_nearest(TestContext&) {
  TempTree tree("find_record");
  tree.write("tree_checksum.json", "{}");
  tree.write("a/tree_checksum.json", "{}");
  tree.mkdir("a/b");
  tree.mkdir("c");

  auto from_b = find_record_file(tree / "a/b");
  check(from_b.has_value(), "found from a/b");
  check(std::filesystem::equivalent(*from_b, tree / "a/tree_checksum.json"), "nearest record wins");

  auto from_c = find_record_file(tree / "c");
  check(from_c.has_value() && std::filesystem::equivalent(*from_c, tree / "tree_checksum.json"),
        "falls back to the top record");
  return true;
}

bool test_find_enclosing_record_file(TestContext&) {
  TempTree tree("enclosing");
  tree.write("tree_checksum.json", "{}");
  tree.write("a/tree_checksum.json", "{}");
  tree.mkdir("a/b");

  auto above_a = find_enclosing_record_file(tree / "a");
  check(above_a.has_value() && std::filesystem::equivalent(*above_a, tree / "tree_checksum.json"),
        "own record skipped, parent record found");
  auto above_b = find_enclosing_record_file(tree / "a/b");
  check(above_b.has_value() && std::filesystem::equivalent(*above_b, tree / "a/tree_checksum.json"),
        "nearest record above");

  // a record reachable from both the target and its parent is the target's own
  tree.mkdir("shared/inner");
  tree.write("shared/inner/tree_checksum.json", "{}");
  std::filesystem::create_symlink(tree / "shared/inner/tree_checksum.json",
                                  tree / "shared/tree_checksum.json");
  auto above_inner = find_enclosing_record_file(tree / "shared/inner");
  check(!above_inner.has_value(), "same file as the target's record is not an enclosing record");
  return true;
}

bool test_locate_node(TestContext&) {
  TempTree tree("locate");
  tree.mkdir("a/b/c");
  auto root = std::make_shared<Record>();
  auto a = std::make_shared<Record>();
  a->md5 = "aaaa";
  root->subdirectories["a"] = a;
  auto record_file = tree / "tree_checksum.json";

  auto location = locate_node(root, record_file, tree / "a/b/c");
  check_eq(location.ancestors.size(), std::size_t{3}, "root, a and b are ancestors");
  check(location.ancestors[0] == root, "chain starts at root");
  check(location.ancestors[1] == a, "existing node keeps its identity");
  check(root->subdirectories.at("a") == a, "parent link untouched");
  check(location.ancestors[2] == a->subdirectories.at("b"), "intermediate created");
  check(location.target == location.ancestors[2]->subdirectories.at("c"), "target linked from parent");
  check_eq(location.names, std::vector<std::string>{"a", "b", "c"}, "names along the chain");

  auto self = locate_node(root, record_file, tree.root());
  check(self.target == root && self.ancestors.empty(), "record directory maps to root");

  bool rejected = false;
  try {
    locate_node(root, record_file, tree.root().parent_path());
  } catch(const ConfigurationError&) {
    rejected = true;
  }
  check(rejected, "target outside the recorded tree rejected");
  return true;
}

bool test_record_json_layout(TestContext&) {
  Record record;
  record.calculated_at = "2024-01-01T00:00:00.000000";
  record.md5 = "m";
  record.md5_files_only = "f";
  record.size = 12;
  record.n_files = 2;
  record.files_size = 7;
  auto child = std::make_shared<Record>();
  record.subdirectories["sub"] = child;
  record.file_listing = std::map<std::string, FileDetail>{{"x", FileDetail{"d", 7, 1.5}}};

  nlohmann::json j = record;
  check_eq(j.at("MD5"), std::string("m"), "aggregate key");
  check_eq(j.at("MD5-files_only"), std::string("f"), "files-only key");
  check_eq(j.at("files-size"), 7, "files-size key");
  check_eq(j.at("n_files"), 2, "n_files key");
  check_eq(j.at("size"), 12, "size key");
  check_eq(j.at("file-listing").at("x").at("last-modified-at"), 1.5, "listing mtime key");
  check(j.at("subdirectories").at("sub").empty(), "unscanned child serialises empty");

  Record back;
  from_json(j, back);
  check_eq(back.md5, std::string("m"), "aggregate restored");
  check(back.subdirectories.count("sub") == 1 && !back.subdirectories.at("sub")->complete(),
        "child restored as incomplete");
  check(back.file_listing && back.file_listing->at("x").size == 7, "listing restored");
  return true;
}

bool test_write_and_load_record_file(TestContext&) {
  TempTree tree("write_record");
  auto path = tree / "tree_checksum.json";
  tree.write("tree_checksum.json", "stale");
  std::string error;
  check(write_record_file(nlohmann::json{{"MD5", "abc"}}, path, error), "write succeeds");
  check(!std::filesystem::exists(temporary_record_path(path)), "temporary file renamed away");
  auto root = load_record_tree(path);
  check_eq(root->md5, std::string("abc"), "content replaced");

  tree.write("broken.json", "{ not json");
  bool rejected = false;
  try {
    load_record_tree(tree / "broken.json");
  } catch(const RecordFormatError&) {
    rejected = true;
  }
  check(rejected, "malformed record file rejected");

  // directory names are raw bytes and need not be valid UTF-8
  Record odd;
  odd.md5 = "root";
  odd.md5_files_only = md5_hex("");
  auto child = std::make_shared<Record>();
  child->md5 = "child";
  child->md5_files_only = md5_hex("");
  odd.subdirectories["bad\xff"] = child;
  check(write_record_file(nlohmann::json(odd), path, error), "non-UTF-8 name written");
  check(!std::filesystem::exists(temporary_record_path(path)), "no temporary file left behind");
  auto reloaded = load_record_tree(path);
  check_eq(reloaded->subdirectories.size(), std::size_t{1}, "child kept");
  check(!reloaded->subdirectories.begin()->second->md5.has_value(), "mangled child not trusted");
  return true;
}

bool test_command_line(TestContext&) {
  CommandLineParser parser;
  SettingsManager settings;
  parser.parse({"--new", "-j", "4", "--detail", "-vv", "/data/photos"}, settings);
  check_eq(settings.get<std::string>("target"), std::string("/data/photos"), "positional target");
  check(settings.get<bool>("new"), "--new flag");
  check(!settings.get<bool>("continue"), "continue untouched");
  check_eq(settings.get<int>("parallel"), 4, "alias with value");
  check(settings.get<bool>("detail_files"), "detail alias");
  check(settings.get<bool>("very_verbose"), "very verbose alias");

  SettingsManager other;
  parser.parse({"--parallel=3", "--progress", "false", "--very-verbose"}, other);
  check_eq(other.get<int>("parallel"), 3, "key=value form");
  check(!other.get<bool>("progress"), "explicit bool literal");
  check(other.get<bool>("very_verbose"), "dashes accepted in keys");

  auto rejects = [&](std::vector<std::string> args){
    SettingsManager scratch;
    try {
      parser.parse(args, scratch);
    } catch(const UsageError&) {
      return true;
    }
    return false;
  };
  check(rejects({"--bogus"}), "unknown option");
  check(rejects({"--parallel"}), "missing value");
  check(rejects({"--parallel", "four"}), "non-numeric value");
  check(rejects({"a", "b"}), "extra positional");
  return true;
}

bool test_settings_persistence(TestContext&) {
  TempTree tree("settings");
  SettingsManager settings;
  settings.set_settings_path(tree / ".config" / "tree_inventory.json");
  std::string error;
  check(settings.set_from_json("parallel", 6, error), "set parallel");
  check(settings.set_from_json("new", true, error), "set new");
  check(settings.save(), "save");

  auto stored = read_json(tree / ".config" / "tree_inventory.json");
  check_eq(stored.at("parallel"), 6, "persistent value written");
  check(!stored.contains("new"), "per-run flags are not persisted");

  SettingsManager reloaded;
  reloaded.set_settings_path(tree / ".config" / "tree_inventory.json");
  check(reloaded.load(), "load");
  check_eq(reloaded.get<int>("parallel"), 6, "value reloaded");
  check(!reloaded.set_from_json("parallel", "six", error), "type mismatch rejected");
  return true;
}

bool test_progress_meter(TestContext&) {
  check_eq(format_progress_meter(5, 10, 10), std::string("[#####_____]  5/10  (50%)"), "half way");
  check_eq(format_progress_meter(0, 0, 4), std::string("[____]  0/0"), "nothing known yet");
  check_eq(format_progress_meter(12, 10, 4), std::string("[####]  12/10  (100%)"), "overshoot clamps");

  std::ostringstream out;
  ProgressDisplay display(out, 4);
  display.update(4, 1);
  display.update(4, 4);
  display.finish();
  check(out.str().find("\r[####]  4/4  (100%)") != std::string::npos, "redraws in place");
  check(out.str().back() == '\n', "finish ends the line");
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"md5_known_values", test_md5_known_values},
    {"file_md5", test_file_md5},
    {"enumerate_sorted", test_enumerate_sorted},
    {"throttle_fires_then_backs_off", test_throttle_fires_then_backs_off},
    {"throttle_scales_with_cost", test_throttle_scales_with_cost},
    {"throttle_never_blocks", test_throttle_never_blocks},
    {"worker_pool", test_worker_pool},
    {"find_record_file_nearest", test_find_record_file_nearest},
    {"find_enclosing_record_file", test_find_enclosing_record_file},
    {"locate_node", test_locate_node},
    {"record_json_layout", test_record_json_layout},
    {"write_and_load_record_file", test_write_and_load_record_file},
    {"command_line", test_command_line},
    {"settings_persistence", test_settings_persistence},
    {"progress_meter", test_progress_meter}
  };
  return run_test_cases("core", tests, argc, argv);
}
