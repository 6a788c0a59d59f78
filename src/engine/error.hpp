#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace relay::engine {

using Json = nlohmann::json;

enum class ErrorCode {
  StreamClosed,
  SourceExhausted,
  UnitFailed,
  NoOutput,
  EmptyInput,
  InvalidGraph,
  IterationCeiling,
  NoExecutionMode,
  Internal,
};

struct Error {
  ErrorCode code = ErrorCode::Internal;
  std::string message;
  /// Node or stream source the error refers to; empty when not applicable.
  std::string origin;
};

template <typename T>
using Expected = tl::expected<T, Error>;

inline auto make_error(ErrorCode code, std::string message, std::string origin = {}) -> Error {
  return Error{code, std::move(message), std::move(origin)};
}

inline auto to_string(ErrorCode code) -> std::string_view {
  switch (code) {
    case ErrorCode::StreamClosed: return "stream_closed";
    case ErrorCode::SourceExhausted: return "source_exhausted";
    case ErrorCode::UnitFailed: return "unit_failed";
    case ErrorCode::NoOutput: return "no_output";
    case ErrorCode::EmptyInput: return "empty_input";
    case ErrorCode::InvalidGraph: return "invalid_graph";
    case ErrorCode::IterationCeiling: return "iteration_ceiling";
    case ErrorCode::NoExecutionMode: return "no_execution_mode";
    case ErrorCode::Internal: return "internal";
  }
  return "unknown";
}

inline auto describe(const Error& error) -> std::string {
  std::string out{to_string(error.code)};
  if (!error.origin.empty()) {
    out += "[" + error.origin + "]";
  }
  out += ": " + error.message;
  return out;
}

/// Converts a captured exception into a UnitFailed error.
inline auto from_exception(const std::exception_ptr& ptr, std::string origin = {}) -> Error {
  try {
    std::rethrow_exception(ptr);
  } catch (const std::exception& ex) {
    return make_error(ErrorCode::UnitFailed, ex.what(), std::move(origin));
  } catch (...) {
    return make_error(ErrorCode::UnitFailed, "unknown exception", std::move(origin));
  }
}

/// Carries an Error through code paths that only speak exceptions (stdexec senders).
class ErrorException : public std::exception {
 public:
  explicit ErrorException(Error error) : error_(std::move(error)), what_(describe(error_)) {}

  auto error() const -> const Error& { return error_; }
  auto what() const noexcept -> const char* override { return what_.c_str(); }

 private:
  Error error_;
  std::string what_;
};

}  // namespace relay::engine
