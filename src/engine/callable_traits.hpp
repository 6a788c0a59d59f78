#pragma once

#include <concepts>
#include <exception>
#include <functional>
#include <tuple>
#include <type_traits>
#include <utility>

#include "engine/error.hpp"

namespace relay::engine::detail {

template <typename T>
struct function_traits;

template <typename R, typename... Args>
struct function_traits<R(Args...)> {
  using result_type = R;
  using args_tuple = std::tuple<Args...>;
  static constexpr std::size_t arity = sizeof...(Args);
};

template <typename R, typename... Args>
struct function_traits<R (*)(Args...)> : function_traits<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct function_traits<R (C::*)(Args...)> : function_traits<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct function_traits<R (C::*)(Args...) const> : function_traits<R(Args...)> {};

template <typename T, typename = void>
struct callable_traits;

template <typename R, typename... Args>
struct callable_traits<R(Args...), void> : function_traits<R(Args...)> {};

template <typename R, typename... Args>
struct callable_traits<R (*)(Args...), void> : function_traits<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...), void> : function_traits<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...) const, void> : function_traits<R(Args...)> {};

template <typename T>
struct callable_traits<T, std::void_t<decltype(&T::operator())>> : callable_traits<decltype(&T::operator())> {};

template <typename Fn>
concept UnaryCallable = requires {
  typename callable_traits<std::remove_cvref_t<Fn>>::result_type;
  requires callable_traits<std::remove_cvref_t<Fn>>::arity == 1;
};

/// Decayed type of the single argument of a unary callable.
template <UnaryCallable Fn>
using unary_arg_t =
  std::remove_cvref_t<std::tuple_element_t<0, typename callable_traits<std::remove_cvref_t<Fn>>::args_tuple>>;

template <typename T>
struct expected_traits {
  using value_type = T;
  static constexpr bool is_expected = false;
};

template <typename T>
struct expected_traits<Expected<T>> {
  using value_type = T;
  static constexpr bool is_expected = true;
};

template <typename T>
inline constexpr bool is_expected_v = expected_traits<std::remove_cvref_t<T>>::is_expected;

/// T for both T and Expected<T>.
template <typename T>
using unwrap_expected_t = typename expected_traits<std::remove_cvref_t<T>>::value_type;

/// Calls fn and normalizes its result to Expected. A thrown exception becomes a
/// UnitFailed error tagged with origin.
template <typename Fn, typename... Args>
auto invoke_guarded(std::string_view origin, Fn&& fn, Args&&... args)
    -> Expected<unwrap_expected_t<std::invoke_result_t<Fn&&, Args&&...>>> {
  using Raw = std::invoke_result_t<Fn&&, Args&&...>;
  try {
    if constexpr (is_expected_v<Raw>) {
      auto result = std::invoke(std::forward<Fn>(fn), std::forward<Args>(args)...);
      if (!result && result.error().origin.empty()) {
        result.error().origin = std::string(origin);
      }
      return result;
    } else if constexpr (std::is_void_v<Raw>) {
      std::invoke(std::forward<Fn>(fn), std::forward<Args>(args)...);
      return {};
    } else {
      return std::invoke(std::forward<Fn>(fn), std::forward<Args>(args)...);
    }
  } catch (const ErrorException& ex) {
    return tl::unexpected(ex.error());
  } catch (...) {
    return tl::unexpected(from_exception(std::current_exception(), std::string(origin)));
  }
}

}  // namespace relay::engine::detail
