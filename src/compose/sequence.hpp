#pragma once

#include <memory>
#include <string>
#include <utility>

#include "compose/runnable.hpp"

namespace relay::compose {

/// first followed by second. Streaming runs first.stream through second.transform
/// when either side streams natively; otherwise first.invoke feeds second.stream.
template <typename I, typename M, typename O>
class Sequence final : public Runnable<I, O> {
 public:
  Sequence(RunnablePtr<I, M> first, RunnablePtr<M, O> second)
      : first_(std::move(first)), second_(std::move(second)) {}

  auto name() const -> std::string override { return first_->name() + " | " + second_->name(); }

  auto run_info() const -> callbacks::RunInfo override {
    return callbacks::RunInfo{name(), "Sequence", callbacks::ComponentType::Chain,
                              Json{{"first", first_->name()}, {"second", second_->name()}}};
  }

 protected:
  auto capabilities() const -> Capabilities<I, O> override {
    Capabilities<I, O> caps;
    caps.invoke = [first = first_, second = second_](I input, const RunOptions& options) -> Expected<O> {
      auto middle = first->invoke(std::move(input), options);
      if (!middle) {
        return tl::unexpected(middle.error());
      }
      return second->invoke(std::move(*middle), options);
    };

    const bool stream_through = first_->native_modes().stream || second_->native_modes().transform;
    caps.stream = [first = first_, second = second_, stream_through](
                      I input, const RunOptions& options) -> Expected<StreamReader<O>> {
      if (stream_through) {
        auto middle = first->stream(std::move(input), options);
        if (!middle) {
          return tl::unexpected(middle.error());
        }
        return second->transform(std::move(*middle), options);
      }
      auto middle = first->invoke(std::move(input), options);
      if (!middle) {
        return tl::unexpected(middle.error());
      }
      return second->stream(std::move(*middle), options);
    };

    caps.collect = [first = first_, second = second_](StreamReader<I> input,
                                                      const RunOptions& options) -> Expected<O> {
      auto middle = first->collect(std::move(input), options);
      if (!middle) {
        return tl::unexpected(middle.error());
      }
      return second->invoke(std::move(*middle), options);
    };

    caps.transform = [first = first_, second = second_](StreamReader<I> input,
                                                        const RunOptions& options) -> Expected<StreamReader<O>> {
      auto middle = first->transform(std::move(input), options);
      if (!middle) {
        return tl::unexpected(middle.error());
      }
      return second->transform(std::move(*middle), options);
    };
    return caps;
  }

 private:
  RunnablePtr<I, M> first_;
  RunnablePtr<M, O> second_;
};

template <typename I, typename M, typename O>
auto pipe(RunnablePtr<I, M> first, RunnablePtr<M, O> second) -> RunnablePtr<I, O> {
  return std::make_shared<Sequence<I, M, O>>(std::move(first), std::move(second));
}

}  // namespace relay::compose
