#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

#include "callbacks/run_info.hpp"

namespace relay::callbacks::trace {

using SpanId = std::uint64_t;
using Tick = std::uint64_t;

enum class SpanStatus : std::uint8_t {
  Ok,
  Error,
  Abandoned,
};

enum class TraceFlag : std::uint32_t {
  Spans = 1u << 0,
  ErrorDetail = 1u << 1,
  StreamEvents = 1u << 2,
};

using TraceFlags = std::uint32_t;

constexpr auto to_flags(TraceFlag flag) -> TraceFlags {
  return static_cast<TraceFlags>(flag);
}

constexpr auto has_flag(TraceFlags flags, TraceFlag flag) -> bool {
  return (flags & to_flags(flag)) != 0;
}

inline constexpr TraceFlags kAllFlags =
    to_flags(TraceFlag::Spans) | to_flags(TraceFlag::ErrorDetail) | to_flags(TraceFlag::StreamEvents);

inline auto steady_tick() -> Tick {
  using clock = std::chrono::steady_clock;
  return static_cast<Tick>(
    std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now().time_since_epoch()).count());
}

struct SpanStart {
  SpanId span_id = 0;
  SpanId parent_span_id = 0;
  std::string_view name;
  ComponentType component = ComponentType::Runnable;
  int depth = 0;
  Tick ts = 0;
};

struct SpanEnd {
  SpanId span_id = 0;
  std::string_view name;
  Tick ts = 0;
  Tick duration = 0;
  SpanStatus status = SpanStatus::Ok;
};

struct SpanError {
  SpanId span_id = 0;
  std::string_view name;
  std::string_view message;
};

struct StreamOpen {
  SpanId span_id = 0;
  std::string_view name;
  Tick ts = 0;
};

/// Statically bound sink: a set of function pointers filled from whichever
/// on_* members the sink type provides.
struct TraceSinkRef {
  void* self = nullptr;
  void (*span_start)(void*, const SpanStart&) = nullptr;
  void (*span_end)(void*, const SpanEnd&) = nullptr;
  void (*span_error)(void*, const SpanError&) = nullptr;
  void (*stream_open)(void*, const StreamOpen&) = nullptr;

  auto enabled() const -> bool {
    return span_start || span_end || span_error || stream_open;
  }
};

namespace detail {

template <typename Sink>
constexpr bool has_span_start = requires(Sink& sink, const SpanStart& event) { sink.on_span_start(event); };

template <typename Sink>
constexpr bool has_span_end = requires(Sink& sink, const SpanEnd& event) { sink.on_span_end(event); };

template <typename Sink>
constexpr bool has_span_error = requires(Sink& sink, const SpanError& event) { sink.on_span_error(event); };

template <typename Sink>
constexpr bool has_stream_open = requires(Sink& sink, const StreamOpen& event) { sink.on_stream_open(event); };

}  // namespace detail

template <typename Sink>
auto make_sink(Sink& sink) -> TraceSinkRef {
  TraceSinkRef ref;
  ref.self = &sink;
  if constexpr (detail::has_span_start<Sink>) {
    ref.span_start = [](void* self, const SpanStart& event) { static_cast<Sink*>(self)->on_span_start(event); };
  }
  if constexpr (detail::has_span_end<Sink>) {
    ref.span_end = [](void* self, const SpanEnd& event) { static_cast<Sink*>(self)->on_span_end(event); };
  }
  if constexpr (detail::has_span_error<Sink>) {
    ref.span_error = [](void* self, const SpanError& event) { static_cast<Sink*>(self)->on_span_error(event); };
  }
  if constexpr (detail::has_stream_open<Sink>) {
    ref.stream_open = [](void* self, const StreamOpen& event) { static_cast<Sink*>(self)->on_stream_open(event); };
  }
  return ref;
}

#if defined(RELAY_TRACE_DISABLED)
inline constexpr bool kTraceEnabled = false;
#else
inline constexpr bool kTraceEnabled = true;
#endif

inline auto emit(TraceSinkRef sink, const SpanStart& event) -> void {
  if (sink.span_start) {
    sink.span_start(sink.self, event);
  }
}

inline auto emit(TraceSinkRef sink, const SpanEnd& event) -> void {
  if (sink.span_end) {
    sink.span_end(sink.self, event);
  }
}

inline auto emit(TraceSinkRef sink, const SpanError& event) -> void {
  if (sink.span_error) {
    sink.span_error(sink.self, event);
  }
}

inline auto emit(TraceSinkRef sink, const StreamOpen& event) -> void {
  if (sink.stream_open) {
    sink.stream_open(sink.self, event);
  }
}

}  // namespace relay::callbacks::trace
