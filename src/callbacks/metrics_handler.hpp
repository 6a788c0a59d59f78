#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "callbacks/callback_handler.hpp"

namespace relay::callbacks {

struct ExecutionMetrics {
  using Clock = std::chrono::steady_clock;

  std::string component_name;
  std::string component_type;
  Clock::time_point start;
  std::optional<Clock::time_point> end;
  std::optional<engine::Error> error;
  Json metadata = Json::object();

  auto duration() const -> std::optional<std::chrono::nanoseconds> {
    if (!end) {
      return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(*end - start);
  }

  auto succeeded() const -> bool { return !error && end.has_value(); }
  auto failed() const -> bool { return error.has_value(); }

  auto to_string() const -> std::string;
};

/// Records one ExecutionMetrics entry per observed run. The start time travels in
/// the context, so nested runs are measured independently.
class MetricsHandler : public CallbackHandler {
 public:
  explicit MetricsHandler(bool auto_log = false);

  auto on_start(Context context, const RunInfo& info, const Payload& input) -> Context override;
  auto on_end(Context context, const RunInfo& info, const Payload& output) -> Context override;
  auto on_error(Context context, const RunInfo& info, const engine::Error& error) -> Context override;
  auto on_start_with_stream_input(Context context, const RunInfo& info, const StreamPayload& input)
      -> Context override;

  auto metrics() const -> std::vector<ExecutionMetrics>;
  auto metrics_for(const std::string& component_name) const -> std::vector<ExecutionMetrics>;
  auto average_duration(const std::string& component_name) const -> std::optional<std::chrono::nanoseconds>;
  auto summary() const -> std::string;
  auto clear() -> void;

 private:
  auto begin(Context context) const -> Context;
  auto record(const Context& context, const RunInfo& info, std::optional<engine::Error> error) -> void;

  bool auto_log_;
  mutable std::mutex mutex_;
  std::vector<ExecutionMetrics> metrics_;
};

}  // namespace relay::callbacks
