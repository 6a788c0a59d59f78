#pragma once

#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include <stdexec/execution.hpp>

#include "engine/callable_traits.hpp"
#include "graph/graph_types.hpp"

namespace relay::graph::detail {

template <typename S, typename Fn>
inline constexpr bool takes_options_v = std::is_invocable_v<Fn&, S, const RunOptions&>;

template <typename S, typename Fn>
auto call_node(Fn& fn, S state, const RunOptions& options) -> decltype(auto) {
  if constexpr (takes_options_v<S, Fn>) {
    return fn(std::move(state), options);
  } else {
    return fn(std::move(state));
  }
}

template <typename S, typename Fn>
using node_result_t = std::remove_cvref_t<decltype(call_node<S>(std::declval<Fn&>(), std::declval<S>(),
                                                                std::declval<const RunOptions&>()))>;

/// Waits for a node's sender and unwraps its single value.
template <typename S, typename Sender>
auto await_node(Sender&& sender) -> Expected<S> {
  auto result = stdexec::sync_wait(std::forward<Sender>(sender));
  if (!result) {
    return tl::unexpected(engine::make_error(ErrorCode::UnitFailed, "node sender was stopped"));
  }
  using Value = std::remove_cvref_t<decltype(std::get<0>(std::move(*result)))>;
  if constexpr (engine::detail::is_expected_v<Value>) {
    return std::get<0>(std::move(*result));
  } else {
    return S(std::get<0>(std::move(*result)));
  }
}

/// Normalizes a node callable into NodeFn<S>. Accepted shapes take S, optionally
/// followed by const RunOptions&, and return S, Expected<S>, or a sender of either.
/// Exceptions become UnitFailed errors whose origin is the node name. The callable is
/// invoked as const and may run concurrently from parallel edges and concurrent runs.
template <typename S, typename Fn>
auto adapt_node(const std::string& name, Fn fn) -> NodeFn<S> {
  using Result = node_result_t<S, const Fn>;
  return [fn = std::move(fn), name](S state, const RunOptions& options) -> Expected<S> {
    if constexpr (stdexec::sender<Result>) {
      return engine::detail::invoke_guarded(name, [&]() -> Expected<S> {
        return await_node<S>(call_node<S>(fn, std::move(state), options));
      });
    } else {
      static_assert(std::is_same_v<engine::detail::unwrap_expected_t<Result>, S>,
                    "graph node must return the state type, Expected of it, or a sender of it");
      return engine::detail::invoke_guarded(name, [&]() { return call_node<S>(fn, std::move(state), options); });
    }
  };
}

}  // namespace relay::graph::detail
