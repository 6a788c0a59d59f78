#include "callbacks/tracing_handler.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace relay::callbacks {

namespace {

constexpr const char* kDepthKey = "_trace_depth";
constexpr const char* kSpanKey = "_trace_span";
constexpr const char* kSpanStartKey = "_trace_span_start";
constexpr const char* kStreamKey = "_trace_stream";

template <typename T>
auto read_or(const Context& context, const char* key, T fallback) -> T {
  if (!context.is_object()) {
    return fallback;
  }
  auto it = context.find(key);
  if (it == context.end()) {
    return fallback;
  }
  return it->get<T>();
}

auto event_label(TraceEventType type) -> const char* {
  switch (type) {
    case TraceEventType::Start: return "[START]";
    case TraceEventType::End: return "[END]  ";
    case TraceEventType::Error: return "[ERROR]";
    case TraceEventType::StreamStart: return "[STREAM START]";
    case TraceEventType::StreamEnd: return "[STREAM END]  ";
  }
  return "[?]";
}

}  // namespace

auto TraceEvent::to_string() const -> std::string {
  const std::string indent(static_cast<std::size_t>(depth) * 2, ' ');
  std::string line = std::format("{}{} {}", indent, event_label(type), component_name);
  if (type == TraceEventType::Start || type == TraceEventType::StreamStart) {
    line += " (" + component_type + ")";
  }
  if (error) {
    line += ": " + *error;
  }
  return line;
}

TracingHandler::TracingHandler(TracingOptions options, trace::TraceSinkRef sink)
    : options_(std::move(options)), sink_(sink) {}

auto TracingHandler::push(TraceEvent event) -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(std::move(event));
}

auto TracingHandler::open_span(Context context, const RunInfo& info, TraceEventType type,
                               std::optional<Json> data) -> Context {
  const int depth = read_or<int>(context, kDepthKey, 0);
  const auto parent = read_or<trace::SpanId>(context, kSpanKey, 0);
  const auto span = next_span_.fetch_add(1, std::memory_order_relaxed);
  const auto now = trace::steady_tick();

  if (depth < options_.max_depth) {
    push(TraceEvent{std::chrono::system_clock::now(), type, info.name, info.type,
                    options_.capture_data ? std::move(data) : std::nullopt, std::nullopt, depth});
  }
  if constexpr (trace::kTraceEnabled) {
    if (trace::has_flag(options_.flags, trace::TraceFlag::Spans)) {
      trace::emit(sink_, trace::SpanStart{span, parent, info.name, info.component, depth, now});
    }
  }

  if (!context.is_object()) {
    context = Json::object();
  }
  context[kDepthKey] = depth + 1;
  context[kSpanKey] = span;
  context[kSpanStartKey] = now;
  context.erase(kStreamKey);
  return context;
}

auto TracingHandler::close_span(const Context& context, const RunInfo& info, trace::SpanStatus status) -> void {
  if constexpr (trace::kTraceEnabled) {
    if (!trace::has_flag(options_.flags, trace::TraceFlag::Spans)) {
      return;
    }
    const auto now = trace::steady_tick();
    const auto started = read_or<trace::Tick>(context, kSpanStartKey, now);
    trace::emit(sink_, trace::SpanEnd{read_or<trace::SpanId>(context, kSpanKey, 0), info.name, now,
                                      now - started, status});
  }
}

auto TracingHandler::on_start(Context context, const RunInfo& info, const Payload& input) -> Context {
  return open_span(std::move(context), info, TraceEventType::Start, input.to_json());
}

auto TracingHandler::on_start_with_stream_input(Context context, const RunInfo& info,
                                                const StreamPayload& /*input*/) -> Context {
  return open_span(std::move(context), info, TraceEventType::StreamStart, std::nullopt);
}

auto TracingHandler::on_end(Context context, const RunInfo& info, const Payload& output) -> Context {
  const int depth = std::max(0, read_or<int>(context, kDepthKey, 1) - 1);
  if (depth < options_.max_depth) {
    auto data = options_.capture_data ? output.to_json() : std::nullopt;
    if (options_.capture_data && !data && !output.metadata.empty()) {
      data = output.metadata;
    }
    push(TraceEvent{std::chrono::system_clock::now(), TraceEventType::End, info.name, info.type,
                    std::move(data), std::nullopt, depth});
  }
  const bool abandoned = output.metadata.is_object() && output.metadata.value("stream_completed", true) == false;
  close_span(context, info, abandoned ? trace::SpanStatus::Abandoned : trace::SpanStatus::Ok);

  context[kDepthKey] = depth;
  return context;
}

auto TracingHandler::on_error(Context context, const RunInfo& info, const engine::Error& error) -> Context {
  const int depth = std::max(0, read_or<int>(context, kDepthKey, 1) - 1);
  const auto message = engine::describe(error);
  if (depth < options_.max_depth) {
    push(TraceEvent{std::chrono::system_clock::now(), TraceEventType::Error, info.name, info.type,
                    std::nullopt, message, depth});
  }
  if constexpr (trace::kTraceEnabled) {
    if (trace::has_flag(options_.flags, trace::TraceFlag::ErrorDetail)) {
      trace::emit(sink_, trace::SpanError{read_or<trace::SpanId>(context, kSpanKey, 0), info.name, message});
    }
  }
  // In-band stream errors leave the span open; on_end closes it once the stream drains.
  if (!read_or<bool>(context, kStreamKey, false)) {
    close_span(context, info, trace::SpanStatus::Error);
    context[kDepthKey] = depth;
  }
  return context;
}

auto TracingHandler::on_end_with_stream_output(Context context, const RunInfo& info,
                                               const StreamPayload& /*output*/) -> Context {
  const int depth = std::max(0, read_or<int>(context, kDepthKey, 1) - 1);
  if (depth < options_.max_depth) {
    push(TraceEvent{std::chrono::system_clock::now(), TraceEventType::StreamEnd, info.name, info.type,
                    std::nullopt, std::nullopt, depth});
  }
  if constexpr (trace::kTraceEnabled) {
    if (trace::has_flag(options_.flags, trace::TraceFlag::StreamEvents)) {
      trace::emit(sink_, trace::StreamOpen{read_or<trace::SpanId>(context, kSpanKey, 0), info.name,
                                           trace::steady_tick()});
    }
  }
  if (!context.is_object()) {
    context = Json::object();
  }
  context[kStreamKey] = true;
  return context;
}

auto TracingHandler::events() const -> std::vector<TraceEvent> {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

auto TracingHandler::events_for(const std::string& component_name) const -> std::vector<TraceEvent> {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TraceEvent> matching;
  for (const auto& event : events_) {
    if (event.component_name == component_name) {
      matching.push_back(event);
    }
  }
  return matching;
}

auto TracingHandler::render() const -> std::string {
  std::string out;
  for (const auto& event : events()) {
    out += event.to_string();
    out += '\n';
  }
  return out;
}

auto TracingHandler::clear() -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.clear();
}

}  // namespace relay::callbacks
