#include "common/logging/log.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "common/logging/flags.hpp"

namespace relay::log {

namespace {

constexpr std::size_t kQueueSize = 8192;
constexpr std::size_t kMinFileSize = 1024;

std::mutex g_mutex;
std::shared_ptr<spdlog::async_logger> g_logger;

auto make_sinks(spdlog::level::level_enum level) -> std::vector<spdlog::sink_ptr> {
  std::vector<spdlog::sink_ptr> sinks;
  if (!FLAGS_log_file.empty()) {
    const auto max_size = std::max(static_cast<std::size_t>(std::max(FLAGS_log_max_size, 0)), kMinFileSize);
    const auto max_files = static_cast<std::size_t>(std::max(FLAGS_log_max_files, 1));
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(FLAGS_log_file, max_size, max_files));
  }
  if (FLAGS_log_to_stderr) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  for (auto& sink : sinks) {
    sink->set_level(level);
  }
  return sinks;
}

}  // namespace

void init() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_logger) {
    return;
  }

  // from_str maps unknown names to off; fall back to info for those.
  auto level = spdlog::level::from_str(FLAGS_log_level);
  const bool known_level = level != spdlog::level::off || FLAGS_log_level == "off";
  if (!known_level) {
    level = spdlog::level::info;
  }

  spdlog::init_thread_pool(kQueueSize, 1);
  auto sinks = make_sinks(level);
  g_logger = std::make_shared<spdlog::async_logger>("relay", sinks.begin(), sinks.end(), spdlog::thread_pool(),
                                                    spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(g_logger);
  spdlog::set_level(level);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

  if (!known_level) {
    spdlog::warn("unknown --log_level '{}', using info", FLAGS_log_level);
  }
  spdlog::debug("logger ready: file='{}' level={} stderr={}", FLAGS_log_file, spdlog::level::to_string_view(level),
                FLAGS_log_to_stderr);
}

void shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_logger) {
    return;
  }
  g_logger->flush();
  g_logger.reset();
  spdlog::shutdown();
}

}  // namespace relay::log
