#pragma once

#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "compose/runnable.hpp"

namespace relay::compose {

/// Runnable backed by a caller-supplied strategy table.
template <typename I, typename O>
class Lambda final : public Runnable<I, O> {
 public:
  /// Fails with NoExecutionMode when caps implements no mode.
  static auto create(Capabilities<I, O> caps, std::string name = "Lambda") -> Expected<RunnablePtr<I, O>> {
    if (caps.empty()) {
      return tl::unexpected(
          engine::make_error(ErrorCode::NoExecutionMode, "lambda requires at least one execution mode", name));
    }
    return RunnablePtr<I, O>(new Lambda(std::move(caps), std::move(name)));
  }

  auto name() const -> std::string override { return name_; }

  auto run_info() const -> callbacks::RunInfo override {
    return callbacks::RunInfo{name_, "Lambda", callbacks::ComponentType::Runnable, Json::object()};
  }

 protected:
  auto capabilities() const -> Capabilities<I, O> override { return caps_; }

 private:
  Lambda(Capabilities<I, O> caps, std::string name) : caps_(std::move(caps)), name_(std::move(name)) {}

  Capabilities<I, O> caps_;
  std::string name_;
};

/// Invoke-only runnable from fn: I -> O or I -> Expected<O>.
template <typename Fn,
          typename I = engine::detail::unary_arg_t<Fn>,
          typename O = engine::detail::unwrap_expected_t<std::invoke_result_t<Fn&, I>>>
auto make_lambda(Fn fn, std::string name = "Lambda") -> RunnablePtr<I, O> {
  Capabilities<I, O> caps;
  caps.invoke = [fn = std::move(fn), name](I input, const RunOptions&) mutable {
    return engine::detail::invoke_guarded(name, fn, std::move(input));
  };
  return *Lambda<I, O>::create(std::move(caps), std::move(name));
}

/// Stream-only runnable from fn: I -> StreamReader<O> or I -> Expected<StreamReader<O>>.
template <typename Fn,
          typename I = engine::detail::unary_arg_t<Fn>,
          typename R = engine::detail::unwrap_expected_t<std::invoke_result_t<Fn&, I>>,
          typename O = typename std::remove_cvref_t<decltype(std::declval<R&>().recv()->get())>>
auto make_streaming_lambda(Fn fn, std::string name = "Lambda") -> RunnablePtr<I, O> {
  Capabilities<I, O> caps;
  caps.stream = [fn = std::move(fn), name](I input, const RunOptions&) mutable {
    return engine::detail::invoke_guarded(name, fn, std::move(input));
  };
  return *Lambda<I, O>::create(std::move(caps), std::move(name));
}

}  // namespace relay::compose
