#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr sink,
                                            const std::string& pattern,
                                            spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  spdlog::register_logger(logger);
  return logger;
}

void ensure_loggers() {
  std::call_once(g_create_once, [](){
    const std::string stamped = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    g_info_logger = make_logger("tree.info",
                                std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                stamped, spdlog::level::warn);
    g_error_logger = make_logger("tree.error",
                                 std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                 stamped, spdlog::level::err);
    g_print_logger = make_logger("tree.print",
                                 std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                 "%v", spdlog::level::info);
    g_print_err_logger = make_logger("tree.print_err",
                                     std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                     "%v", spdlog::level::err);
    g_info_logger->set_level(spdlog::level::info);
  });
}

spdlog::logger* sink_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Print: return g_print_logger.get();
    case LogChannel::PrintErr: return g_print_err_logger.get();
    case LogChannel::Error: return g_error_logger.get();
    default: return g_info_logger.get();
  }
}

} // namespace

const char* channel_label(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Trace: return "trace";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  listener_count_ = listeners_.size();
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
  listener_count_ = listeners_.size();
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
  listener_count_ = 0;
}

bool Logger::wants(spdlog::level::level_enum level) const {
  return listener_count_.load() > 0 || detail::default_wants(level);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
      handled = true;
    }
  }
  return handled;
}

void Logger::fallback(LogChannel channel,
                      const std::string& channel_name,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  detail::emit_to_default(channel, channel_name, level, message);
}

void init(Verbosity verbosity) {
  ensure_loggers();
  auto level = spdlog::level::info;
  if(verbosity == Verbosity::Verbose) level = spdlog::level::debug;
  if(verbosity == Verbosity::VeryVerbose) level = spdlog::level::trace;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

namespace detail {

bool default_wants(spdlog::level::level_enum level) {
  ensure_loggers();
  if(!log_passthrough()) return false;
  return level >= spdlog::level::err || g_info_logger->should_log(level);
}

void emit_to_default(LogChannel channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = sink_for(channel);
  if(!sink) return;
  const char* base = channel_label(channel);
  if(!channel_name.empty() && channel_name != base) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
