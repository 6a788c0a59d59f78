#pragma once

#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "callbacks/callback_manager.hpp"
#include "stream/channel.hpp"

namespace relay::callbacks {

using ManagerPtr = std::shared_ptr<const CallbackManager>;

namespace detail {

inline auto trigger_begin(const CallbackManager& manager, Context context, const RunInfo& info,
                          const Payload& input) -> Context {
  return manager.trigger_start(std::move(context), info, input);
}

inline auto trigger_begin(const CallbackManager& manager, Context context, const RunInfo& info,
                          const StreamPayload& input) -> Context {
  return manager.trigger_start_with_stream_input(std::move(context), info, input);
}

template <typename T>
class ObservedSource final : public stream::detail::Source<T> {
 public:
  ObservedSource(stream::detail::SourcePtr<T> upstream, ManagerPtr manager, Context context, RunInfo info)
      : upstream_(std::move(upstream)),
        manager_(std::move(manager)),
        context_(std::move(context)),
        info_(std::move(info)) {}

  auto next() -> stream::StreamItem<T> override {
    auto item = upstream_->next();
    if (item.is_eof()) {
      finish(true);
    } else if (item.is_error() && item.error().code != engine::ErrorCode::SourceExhausted) {
      manager_->trigger_error(context_, info_, item.error());
    }
    return item;
  }

  auto cancel() -> void override {
    upstream_->cancel();
    finish(false);
  }

 private:
  auto finish(bool completed) -> void {
    if (!finished_.exchange(true)) {
      manager_->trigger_end(context_, info_, Payload::none(Json{{"stream_completed", completed}}));
    }
  }

  stream::detail::SourcePtr<T> upstream_;
  ManagerPtr manager_;
  Context context_;
  RunInfo info_;
  std::atomic<bool> finished_{false};
};

}  // namespace detail

/// Wraps fn with start, end and error hooks. fn receives the context produced by the
/// start hooks and returns an Expected. An error result fires the error hooks and is
/// returned unchanged; a thrown exception fires them and is rethrown.
template <typename Input, typename Fn>
auto run_with_callbacks(const ManagerPtr& manager, Context context, const RunInfo& info,
                        const Input& input, Fn&& fn) -> std::invoke_result_t<Fn&, const Context&> {
  using Result = std::invoke_result_t<Fn&, const Context&>;
  if (!manager) {
    return fn(std::as_const(context));
  }

  context = detail::trigger_begin(*manager, std::move(context), info, input);

  std::optional<Result> result;
  try {
    result.emplace(fn(std::as_const(context)));
  } catch (...) {
    manager->trigger_error(context, info, engine::from_exception(std::current_exception(), info.name));
    throw;
  }

  if (!*result) {
    manager->trigger_error(context, info, result->error());
    return std::move(*result);
  }
  if constexpr (std::is_void_v<typename Result::value_type>) {
    manager->trigger_end(context, info, Payload::none());
  } else {
    manager->trigger_end(context, info, Payload::of(**result));
  }
  return std::move(*result);
}

/// Stream counterpart of run_with_callbacks. The end hooks fire with
/// {"stream_completed": true} once the returned reader drains, or false when it is
/// closed early; in-band error items fire the error hooks as they pass.
template <typename T, typename Input, typename Fn>
auto run_stream_with_callbacks(const ManagerPtr& manager, Context context, const RunInfo& info,
                               const Input& input, Fn&& fn) -> engine::Expected<stream::StreamReader<T>> {
  if (!manager) {
    return fn(std::as_const(context));
  }

  context = detail::trigger_begin(*manager, std::move(context), info, input);

  std::optional<engine::Expected<stream::StreamReader<T>>> result;
  try {
    result.emplace(fn(std::as_const(context)));
  } catch (...) {
    manager->trigger_error(context, info, engine::from_exception(std::current_exception(), info.name));
    throw;
  }
  if (!*result) {
    manager->trigger_error(context, info, result->error());
    return tl::unexpected(result->error());
  }

  context = manager->trigger_end_with_stream_output(std::move(context), info, StreamPayload::of<T>());
  auto source = (*result)->release_source();
  return stream::StreamReader<T>(
      std::make_shared<detail::ObservedSource<T>>(std::move(source), manager, std::move(context), info));
}

}  // namespace relay::callbacks
