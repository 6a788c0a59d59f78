#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "callbacks/callback_handler.hpp"
#include "callbacks/trace.hpp"

namespace relay::callbacks {

enum class TraceEventType {
  Start,
  End,
  Error,
  StreamStart,
  StreamEnd,
};

struct TraceEvent {
  std::chrono::system_clock::time_point timestamp;
  TraceEventType type = TraceEventType::Start;
  std::string component_name;
  std::string component_type;
  std::optional<Json> data;
  std::optional<std::string> error;
  int depth = 0;

  auto to_string() const -> std::string;
};

struct TracingOptions {
  bool capture_data = false;
  /// Events nested deeper than this are not recorded; depth is still tracked.
  int max_depth = 10;
  trace::TraceFlags flags = trace::kAllFlags;
};

/// Builds an indented timeline of nested runs. Nesting depth and the current span
/// travel in the context; span events are also forwarded to an optional sink.
class TracingHandler : public CallbackHandler {
 public:
  explicit TracingHandler(TracingOptions options = {}, trace::TraceSinkRef sink = {});

  auto on_start(Context context, const RunInfo& info, const Payload& input) -> Context override;
  auto on_end(Context context, const RunInfo& info, const Payload& output) -> Context override;
  auto on_error(Context context, const RunInfo& info, const engine::Error& error) -> Context override;
  auto on_start_with_stream_input(Context context, const RunInfo& info, const StreamPayload& input)
      -> Context override;
  auto on_end_with_stream_output(Context context, const RunInfo& info, const StreamPayload& output)
      -> Context override;

  auto events() const -> std::vector<TraceEvent>;
  auto events_for(const std::string& component_name) const -> std::vector<TraceEvent>;
  auto render() const -> std::string;
  auto clear() -> void;

 private:
  auto open_span(Context context, const RunInfo& info, TraceEventType type, std::optional<Json> data) -> Context;
  auto close_span(const Context& context, const RunInfo& info, trace::SpanStatus status) -> void;
  auto push(TraceEvent event) -> void;

  TracingOptions options_;
  trace::TraceSinkRef sink_;
  std::atomic<trace::SpanId> next_span_{1};
  mutable std::mutex mutex_;
  std::vector<TraceEvent> events_;
};

}  // namespace relay::callbacks
