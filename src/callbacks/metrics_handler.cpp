#include "callbacks/metrics_handler.hpp"

#include <format>
#include <map>
#include <utility>

#include "common/logging/log.hpp"

namespace relay::callbacks {

namespace {

constexpr const char* kStartKey = "_metrics_start_ns";

auto to_ms(std::chrono::nanoseconds value) -> double {
  return std::chrono::duration<double, std::milli>(value).count();
}

}  // namespace

auto ExecutionMetrics::to_string() const -> std::string {
  std::string out = std::format("{} ({})", component_name, component_type);
  if (auto elapsed = duration()) {
    out += std::format(" {:.3f}ms", to_ms(*elapsed));
  }
  if (error) {
    out += " error=" + engine::describe(*error);
  }
  out += succeeded() ? " ok" : " failed";
  return out;
}

MetricsHandler::MetricsHandler(bool auto_log) : auto_log_(auto_log) {}

auto MetricsHandler::begin(Context context) const -> Context {
  if (!context.is_object()) {
    context = Json::object();
  }
  context[kStartKey] = ExecutionMetrics::Clock::now().time_since_epoch().count();
  return context;
}

auto MetricsHandler::on_start(Context context, const RunInfo& /*info*/, const Payload& /*input*/) -> Context {
  return begin(std::move(context));
}

auto MetricsHandler::on_start_with_stream_input(Context context, const RunInfo& /*info*/,
                                                const StreamPayload& /*input*/) -> Context {
  return begin(std::move(context));
}

auto MetricsHandler::on_end(Context context, const RunInfo& info, const Payload& /*output*/) -> Context {
  record(context, info, std::nullopt);
  return context;
}

auto MetricsHandler::on_error(Context context, const RunInfo& info, const engine::Error& error) -> Context {
  record(context, info, error);
  return context;
}

auto MetricsHandler::record(const Context& context, const RunInfo& info,
                            std::optional<engine::Error> error) -> void {
  if (!context.is_object() || !context.contains(kStartKey)) {
    return;
  }
  const auto start_ticks = context.at(kStartKey).get<ExecutionMetrics::Clock::rep>();
  ExecutionMetrics metric;
  metric.component_name = info.name;
  metric.component_type = info.type;
  metric.start = ExecutionMetrics::Clock::time_point(ExecutionMetrics::Clock::duration(start_ticks));
  metric.end = ExecutionMetrics::Clock::now();
  metric.error = std::move(error);
  metric.metadata = info.metadata;

  if (auto_log_) {
    log::info("[metrics] {}", metric.to_string());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(std::move(metric));
}

auto MetricsHandler::metrics() const -> std::vector<ExecutionMetrics> {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

auto MetricsHandler::metrics_for(const std::string& component_name) const -> std::vector<ExecutionMetrics> {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ExecutionMetrics> matching;
  for (const auto& metric : metrics_) {
    if (metric.component_name == component_name) {
      matching.push_back(metric);
    }
  }
  return matching;
}

auto MetricsHandler::average_duration(const std::string& component_name) const
    -> std::optional<std::chrono::nanoseconds> {
  std::chrono::nanoseconds total{0};
  std::size_t count = 0;
  for (const auto& metric : metrics_for(component_name)) {
    if (auto elapsed = metric.duration()) {
      total += *elapsed;
      ++count;
    }
  }
  if (count == 0) {
    return std::nullopt;
  }
  return total / static_cast<std::int64_t>(count);
}

auto MetricsHandler::summary() const -> std::string {
  auto all = metrics();
  std::size_t succeeded = 0;
  std::size_t failed = 0;
  std::map<std::string, std::size_t> calls;
  for (const auto& metric : all) {
    succeeded += metric.succeeded() ? 1 : 0;
    failed += metric.failed() ? 1 : 0;
    ++calls[metric.component_name];
  }

  std::string out = std::format("executions={} succeeded={} failed={}\n", all.size(), succeeded, failed);
  for (const auto& [name, count] : calls) {
    const auto average = average_duration(name).value_or(std::chrono::nanoseconds{0});
    out += std::format("  {}: {} calls, avg {:.3f}ms\n", name, count, to_ms(average));
  }
  return out;
}

auto MetricsHandler::clear() -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.clear();
}

}  // namespace relay::callbacks
