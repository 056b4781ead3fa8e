#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace {

struct SinkSet {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
  std::shared_ptr<spdlog::logger> action;
};

SinkSet g_sinks;
std::once_flag g_sinks_once;
std::atomic<bool> g_log_passthrough{true};

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr sink,
                                            const char* pattern,
                                            spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  // Several engines in one process (tests) share these; registering twice throws.
  if(!spdlog::get(name)) {
    spdlog::register_logger(logger);
  }
  return logger;
}

const SinkSet& sinks() {
  std::call_once(g_sinks_once, [](){
    g_sinks.info = make_logger("songmesh.info",
                               std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                               kStampedPattern, spdlog::level::warn);
    g_sinks.error = make_logger("songmesh.error",
                                std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                kStampedPattern, spdlog::level::err);
    g_sinks.print = make_logger("songmesh.print",
                                std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                "%v", spdlog::level::info);
    g_sinks.print_err = make_logger("songmesh.print_err",
                                    std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                    "%v", spdlog::level::err);
    g_sinks.action = make_logger("songmesh.action",
                                 std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                                 "[%Y-%m-%d %H:%M:%S.%e] [action] %v", spdlog::level::warn);
  });
  return g_sinks;
}

} // namespace

const char* log_channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
    case LogChannel::Action: return "action";
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

void Logger::set_name(std::string name) {
  std::lock_guard<std::mutex> lock(name_mutex_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::lock_guard<std::mutex> lock(name_mutex_);
  return name_;
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::action(const std::string& action,
                    const std::string& phase,
                    const nlohmann::json& context) {
  nlohmann::json line = nlohmann::json::object();
  line["action"] = action;
  line["phase"] = phase;
  if(!context.is_null() && !context.empty()) {
    line["context"] = context;
  }
  auto level = (phase == "error") ? spdlog::level::warn : spdlog::level::info;
  emit(LogChannel::Action, level, line.dump());
}

void log_action(Logger* logger,
                const std::string& action,
                const std::string& phase,
                const nlohmann::json& context) {
  if(logger) {
    logger->action(action, phase, context);
    return;
  }
  Logger fallback;
  fallback.action(action, phase, context);
}

void Logger::emit(LogChannel channel,
                  spdlog::level::level_enum level,
                  const std::string& message) {
  const std::string logger_name = name();
  const char* base = log_channel_name(channel);
  std::string channel_name = logger_name.empty()
    ? std::string(base)
    : logger_name + ":" + base;
  if(dispatch(channel_name, level, message)) return;
  detail::emit_to_default(channel, channel_name, level, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default(LogChannel::Error, "log", spdlog::level::err,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void init(bool verbose) {
  const auto& s = sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.info->set_level(level);
  s.error->set_level(spdlog::level::info);
  s.print->set_level(spdlog::level::info);
  s.print_err->set_level(spdlog::level::info);
  s.action->set_level(level);

  spdlog::set_default_logger(s.info);
  spdlog::set_level(level);
}

namespace detail {

void emit_to_default(LogChannel channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  const auto& s = sinks();
  if(!log_passthrough()) return;

  spdlog::logger* sink = nullptr;
  switch(channel) {
    case LogChannel::Print: sink = s.print.get(); break;
    case LogChannel::PrintErr: sink = s.print_err.get(); break;
    case LogChannel::Error: sink = s.error.get(); break;
    case LogChannel::Action: sink = s.action.get(); break;
    default: sink = s.info.get(); break;
  }
  if(!sink) return;

  const bool plain = (channel == LogChannel::Print || channel == LogChannel::PrintErr);
  if(!plain && channel_name != log_channel_name(channel)) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
