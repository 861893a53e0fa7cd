#include <cpptrace/cpptrace.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>

#include "command_line_parser.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "progress_meter.hpp"
#include "settings_manager.hpp"
#include "tree_calculation.hpp"

namespace {

Verbosity verbosity_from(const SettingsManager& settings) {
  if(settings.get<bool>("very_verbose")) return Verbosity::VeryVerbose;
  if(settings.get<bool>("verbose")) return Verbosity::Verbose;
  return Verbosity::Normal;
}

} // namespace

int main(int argc, char** argv){
  auto settings = std::make_shared<SettingsManager>();
  CommandLineParser parser((argc > 0 && argv && argv[0])
                             ? std::filesystem::path(argv[0]).filename().string()
                             : "tree_inventory");
  try {
    settings->load();
    parser.parse(argc, argv, *settings);
  } catch(const UsageError& e) {
    print_err(nullptr, "{}", e.what());
    parser.usage();
    return 2;
  }
  if(settings->help_requested()) {
    parser.usage();
    return 0;
  }

  init(verbosity_from(*settings));
  auto logger = std::make_shared<Logger>();

  if(settings->save_requested()) {
    if(!settings->save()) {
      logger->error("Unable to persist settings to {}", settings->settings_path().string());
    }
  }

  std::unique_ptr<ProgressDisplay> display;
  auto end_meter = [&display](){
    if(display) display->finish();
  };
  try {
    TreeOptions options;
    options.target = settings->get<std::string>("target");
    options.start_new = settings->get<bool>("new");
    options.continue_previous = settings->get<bool>("continue");
    options.detail_files = settings->get<bool>("detail_files");
    int parallel = settings->get<int>("parallel");
    if(parallel < 1) {
      throw ConfigurationError("--parallel must be at least 1 (got " + std::to_string(parallel) + ")");
    }
    options.parallelism = static_cast<std::size_t>(parallel);
    options.new_record_pause = std::chrono::seconds(
      std::max(0, settings->get<int>("new_record_pause_seconds")));

    if(settings->get<bool>("progress")) {
      display = std::make_unique<ProgressDisplay>(
        std::cerr, static_cast<std::size_t>(std::max(1, settings->get<int>("progress_meter_size"))));
      options.on_progress = [&display](uint64_t total, uint64_t done){
        display->update(total, done);
      };
    }

    compute_tree(options, logger);
    end_meter();
    return 0;
  } catch(const ConfigurationError& e) {
    end_meter();
    logger->error("{}", e.what());
    return 2;
  } catch(const BranchError& e) {
    end_meter();
    logger->error("Checksum incomplete: {}", e.what());
    return 1;
  } catch(const IncompleteRecordError& e) {
    end_meter();
    logger->error("Checksum incomplete: {}", e.what());
    return 1;
  } catch(const std::exception& e) {
    end_meter();
    logger->error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
