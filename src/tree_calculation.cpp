#include "tree_calculation.hpp"

#include <system_error>
#include <thread>
#include <vector>

#include "branch_calculator.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace {

std::filesystem::path absolute_target(const std::filesystem::path& target) {
  std::error_code ec;
  auto path = std::filesystem::weakly_canonical(std::filesystem::absolute(target), ec);
  if(ec) {
    throw ConfigurationError("Cannot resolve target path '" + target.string() + "': " + ec.message());
  }
  if(!std::filesystem::is_directory(path, ec)) {
    throw ConfigurationError("Target '" + target.string() + "' is not a directory");
  }
  return path;
}

std::string describe_chain(const std::vector<std::string>& names, std::size_t ancestor_count) {
  std::string out = "root";
  for(std::size_t i = 0; i + 1 < ancestor_count && i < names.size(); ++i) {
    out += " / " + names[i];
  }
  return out;
}

void warn_about_shadowed_record(Logger* logger,
                                const std::filesystem::path& record_file,
                                const std::filesystem::path& higher,
                                std::chrono::duration<double> pause) {
  log_warn(logger, "Starting a new record file at: {}", record_file.string());
  log_warn(logger, "However a higher-level record file was found at: {}", higher.string());
  log_warn(logger, "Note that runs started from outside this directory keep using the higher-level record.");
  log_warn(logger, "Consider removing --new from your command or deleting the higher-level record if not intentional.");
  if(pause.count() > 0) {
    std::this_thread::sleep_for(pause);
  }
  log_warn(logger, "Proceeding as requested.");
}

} // namespace

void compute_tree(const TreeOptions& options, std::shared_ptr<Logger> logger) {
  if(options.start_new && options.continue_previous) {
    throw ConfigurationError("Cannot specify both --new and --continue at the same time.");
  }
  auto target = absolute_target(options.target);
  auto* log = logger.get();
  log_info(log, "Calculating checksum for path '{}'...", target.string());

  std::filesystem::path record_file;
  std::shared_ptr<Record> root;
  std::shared_ptr<Record> target_record;
  std::vector<std::shared_ptr<Record>> ancestors;
  std::vector<std::string> names;

  auto start_fresh = [&](){
    record_file = target / options.record_file_name;
    root = target_record = std::make_shared<Record>();
    target_record->calculated_at = iso_timestamp_now();
  };

  if(options.start_new) {
    auto higher = find_enclosing_record_file(target, options.record_file_name);
    if(higher) {
      warn_about_shadowed_record(log, target / options.record_file_name, *higher,
                                 options.new_record_pause);
    }
    start_fresh();
    std::error_code ec;
    std::filesystem::remove(record_file, ec);
    if(ec) {
      throw ConfigurationError("Unable to remove existing record " + record_file.string() +
                               ": " + ec.message());
    }
  } else {
    auto found = find_record_file(target, options.record_file_name);
    if(!found) {
      start_fresh();
    } else {
      log_info(log, "Updating existing checksum file found at: {}", found->string());
      record_file = *found;
      root = load_record_tree(record_file);
      auto location = locate_node(root, record_file, target);
      target_record = location.target;
      ancestors = std::move(location.ancestors);
      names = std::move(location.names);
      if(!options.continue_previous) {
        // the parent still points at this node, so wipe it rather than replace it
        target_record->clear();
        target_record->calculated_at = iso_timestamp_now();
      }
    }
  }

  // A redo of one subdirectory may happen before the full tree was ever
  // completed, so ancestors without a checksum are fine here.
  for(auto& ancestor : ancestors) {
    ancestor->md5.reset();
  }
  log_debug(log, "parent records = {}", describe_chain(names, ancestors.size()));

  BranchCalculator::Options calc_options;
  calc_options.continue_previous = options.continue_previous;
  calc_options.detail_files = options.detail_files;
  calc_options.n_parallel = options.parallelism;
  calc_options.record_file_name = options.record_file_name;
  calc_options.occasions = options.occasions;
  calc_options.file_digest = options.file_digest;
  BranchCalculator calc(calc_options, logger);

  auto save_record = [&](bool final){
    if(final) {
      for(auto it = ancestors.rbegin(); it != ancestors.rend(); ++it) {
        calc.recalculate(**it);
      }
    }
    log_info(log, "Saving checksum to file: {}", record_file.string());
    auto doc = calc.snapshot(*root);
    std::string error;
    if(write_record_file(doc, record_file, error)) return;
    if(final) {
      throw std::runtime_error("Unable to save checksum file: " + error);
    }
    log_error(log, "Checkpoint failed: {}", error);
  };

  // persist the invalidated ancestors before any branch work starts
  save_record(false);

  calc.throttle().set_callback([&](){
    if(options.on_progress) {
      options.on_progress(calc.total_files(), calc.files_done());
    }
    save_record(false);
  });

  try {
    calc.compute_branch(*target_record, target, ancestors.size());
  } catch(const BranchError& e) {
    log_error(log, "Checksum incomplete: {}", e.what());
    save_record(false);
    log_warn(log, "Partial results saved; rerun with --continue once the problem is fixed.");
    throw;
  }
  if(options.on_progress) {
    options.on_progress(calc.total_files(), calc.files_done());
  }

  try {
    save_record(true);
  } catch(const IncompleteRecordError& e) {
    log_error(log, "{}", e.what());
    save_record(false);
    throw;
  }
  log_info(log, "Done.");
}
