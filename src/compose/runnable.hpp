#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "callbacks/run_with_callbacks.hpp"
#include "compose/capabilities.hpp"
#include "engine/callable_traits.hpp"

namespace relay::compose {

/// Execution unit with four modes: invoke (value -> value), stream (value ->
/// stream), collect (stream -> value) and transform (stream -> stream).
///
/// Implementations supply only the modes they support natively through
/// capabilities(); the rest are derived once, on first use, by
/// derive_capabilities. Every public call is observed by options.callbacks when set,
/// and exceptions thrown by implementations surface as UnitFailed errors.
template <typename I, typename O>
class Runnable {
 public:
  using Input = I;
  using Output = O;

  virtual ~Runnable() = default;

  Runnable() = default;
  Runnable(const Runnable&) = delete;
  auto operator=(const Runnable&) -> Runnable& = delete;

  auto invoke(I input, const RunOptions& options = {}) -> Expected<O> {
    const auto* caps = resolved();
    if (caps == nullptr) {
      return tl::unexpected(no_mode_error());
    }
    const auto info = run_info();
    return callbacks::run_with_callbacks(
        options.callbacks, options.context, info, callbacks::Payload::of(input),
        [&](const callbacks::Context& context) {
          return engine::detail::invoke_guarded(info.name, caps->invoke, std::move(input),
                                                options.with_context(context));
        });
  }

  auto stream(I input, const RunOptions& options = {}) -> Expected<StreamReader<O>> {
    const auto* caps = resolved();
    if (caps == nullptr) {
      return tl::unexpected(no_mode_error());
    }
    const auto info = run_info();
    return callbacks::run_stream_with_callbacks<O>(
        options.callbacks, options.context, info, callbacks::Payload::of(input),
        [&](const callbacks::Context& context) {
          return engine::detail::invoke_guarded(info.name, caps->stream, std::move(input),
                                                options.with_context(context));
        });
  }

  auto collect(StreamReader<I> input, const RunOptions& options = {}) -> Expected<O> {
    const auto* caps = resolved();
    if (caps == nullptr) {
      return tl::unexpected(no_mode_error());
    }
    const auto info = run_info();
    return callbacks::run_with_callbacks(
        options.callbacks, options.context, info, callbacks::StreamPayload::of<I>(),
        [&](const callbacks::Context& context) {
          return engine::detail::invoke_guarded(info.name, caps->collect, std::move(input),
                                                options.with_context(context));
        });
  }

  auto transform(StreamReader<I> input, const RunOptions& options = {}) -> Expected<StreamReader<O>> {
    const auto* caps = resolved();
    if (caps == nullptr) {
      return tl::unexpected(no_mode_error());
    }
    const auto info = run_info();
    return callbacks::run_stream_with_callbacks<O>(
        options.callbacks, options.context, info, callbacks::StreamPayload::of<I>(),
        [&](const callbacks::Context& context) {
          return engine::detail::invoke_guarded(info.name, caps->transform, std::move(input),
                                                options.with_context(context));
        });
  }

  /// Sequential invoke over inputs; stops at the first failure.
  auto batch(std::vector<I> inputs, const RunOptions& options = {}) -> Expected<std::vector<O>> {
    std::vector<O> outputs;
    outputs.reserve(inputs.size());
    for (auto& input : inputs) {
      auto output = invoke(std::move(input), options);
      if (!output) {
        return tl::unexpected(output.error());
      }
      outputs.push_back(std::move(*output));
    }
    return outputs;
  }

  /// Concurrent invoke on the executor. Output i belongs to input i; on failure the
  /// error of the lowest failing index is returned after all calls joined.
  auto batch_parallel(std::vector<I> inputs, const RunOptions& options = {}) -> Expected<std::vector<O>> {
    std::vector<std::optional<Expected<O>>> results(inputs.size());
    options.executor_or_shared().for_each_index(inputs.size(), [&](std::size_t index) {
      results[index].emplace(invoke(std::move(inputs[index]), options));
    });

    std::vector<O> outputs;
    outputs.reserve(results.size());
    for (auto& result : results) {
      if (!*result) {
        return tl::unexpected(result->error());
      }
      outputs.push_back(std::move(**result));
    }
    return outputs;
  }

  /// Modes implemented natively, before derivation.
  auto native_modes() const -> ModeSet { return modes_of(capabilities()); }

  virtual auto name() const -> std::string { return "Runnable"; }

  virtual auto run_info() const -> callbacks::RunInfo {
    return callbacks::RunInfo{name(), "Runnable", callbacks::ComponentType::Runnable, Json::object()};
  }

 protected:
  virtual auto capabilities() const -> Capabilities<I, O> = 0;

 private:
  auto resolved() -> const Capabilities<I, O>* {
    std::call_once(derive_once_, [this] {
      auto native = capabilities();
      if (!native.empty()) {
        derived_ = derive_capabilities(native);
      }
    });
    return derived_ ? &*derived_ : nullptr;
  }

  auto no_mode_error() const -> Error {
    return engine::make_error(ErrorCode::NoExecutionMode, "unit implements no execution mode", name());
  }

  std::once_flag derive_once_;
  std::optional<Capabilities<I, O>> derived_;
};

template <typename I, typename O>
using RunnablePtr = std::shared_ptr<Runnable<I, O>>;

}  // namespace relay::compose
