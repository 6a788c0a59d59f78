#pragma once

#include <functional>
#include <utility>

#include "common/logging/log.hpp"
#include "compose/run_options.hpp"
#include "stream/stream_utils.hpp"

namespace relay::compose {

using engine::Error;
using engine::ErrorCode;
using engine::Expected;
using stream::StreamReader;

/// Strategy table: one optional implementation per execution mode.
template <typename I, typename O>
struct Capabilities {
  using InvokeFn = std::function<Expected<O>(I, const RunOptions&)>;
  using StreamFn = std::function<Expected<StreamReader<O>>(I, const RunOptions&)>;
  using CollectFn = std::function<Expected<O>(StreamReader<I>, const RunOptions&)>;
  using TransformFn = std::function<Expected<StreamReader<O>>(StreamReader<I>, const RunOptions&)>;

  InvokeFn invoke;
  StreamFn stream;
  CollectFn collect;
  TransformFn transform;

  auto empty() const -> bool { return !invoke && !stream && !collect && !transform; }
};

struct ModeSet {
  bool invoke = false;
  bool stream = false;
  bool collect = false;
  bool transform = false;
};

template <typename I, typename O>
auto modes_of(const Capabilities<I, O>& caps) -> ModeSet {
  return ModeSet{static_cast<bool>(caps.invoke), static_cast<bool>(caps.stream),
                 static_cast<bool>(caps.collect), static_cast<bool>(caps.transform)};
}

namespace detail {

/// First value of a stream; the rest of the stream is released.
template <typename T>
auto first_item(StreamReader<T> reader) -> Expected<T> {
  auto item = reader.recv();
  if (!item) {
    return tl::unexpected(item.error());
  }
  if (item->is_error()) {
    return tl::unexpected(item->error());
  }
  if (item->is_eof()) {
    return tl::unexpected(engine::make_error(ErrorCode::NoOutput, "stream produced no output"));
  }
  auto value = item->take();
  reader.close();
  return value;
}

template <typename T>
auto first_of(Expected<StreamReader<T>> reader) -> Expected<T> {
  if (!reader) {
    return tl::unexpected(reader.error());
  }
  return first_item(std::move(*reader));
}

/// Takes only the first input of a stream for a value-input implementation.
template <typename T>
auto first_input(StreamReader<T> reader) -> Expected<T> {
  auto item = reader.recv();
  if (!item) {
    return tl::unexpected(item.error());
  }
  if (item->is_error()) {
    return tl::unexpected(item->error());
  }
  if (item->is_eof()) {
    return tl::unexpected(engine::make_error(ErrorCode::EmptyInput, "collect received an empty input stream"));
  }
  auto value = item->take();
  if (reader.is_open()) {
    log::debug("collect derived from a single-input mode: remaining input items are discarded");
    reader.close();
  }
  return value;
}

template <typename T>
auto wrap_single(Expected<T> value) -> Expected<StreamReader<T>> {
  if (!value) {
    return tl::unexpected(value.error());
  }
  return stream::single(std::move(*value));
}

}  // namespace detail

/// Fills the modes missing from native using only native implementations.
template <typename I, typename O>
auto derive_capabilities(const Capabilities<I, O>& native) -> Capabilities<I, O> {
  Capabilities<I, O> full = native;

  if (!full.invoke) {
    if (native.stream) {
      full.invoke = [s = native.stream](I input, const RunOptions& options) {
        return detail::first_of(s(std::move(input), options));
      };
    } else if (native.collect) {
      full.invoke = [c = native.collect](I input, const RunOptions& options) {
        return c(stream::single(std::move(input)), options);
      };
    } else if (native.transform) {
      full.invoke = [t = native.transform](I input, const RunOptions& options) {
        return detail::first_of(t(stream::single(std::move(input)), options));
      };
    }
  }

  if (!full.stream) {
    if (native.invoke) {
      full.stream = [i = native.invoke](I input, const RunOptions& options) {
        return detail::wrap_single(i(std::move(input), options));
      };
    } else if (native.transform) {
      full.stream = [t = native.transform](I input, const RunOptions& options) {
        return t(stream::single(std::move(input)), options);
      };
    } else if (native.collect) {
      full.stream = [c = native.collect](I input, const RunOptions& options) {
        return detail::wrap_single(c(stream::single(std::move(input)), options));
      };
    }
  }

  if (!full.collect) {
    if (native.transform) {
      full.collect = [t = native.transform](StreamReader<I> input, const RunOptions& options) {
        return detail::first_of(t(std::move(input), options));
      };
    } else if (native.invoke) {
      full.collect = [i = native.invoke](StreamReader<I> input, const RunOptions& options) -> Expected<O> {
        auto first = detail::first_input(std::move(input));
        if (!first) {
          return tl::unexpected(first.error());
        }
        return i(std::move(*first), options);
      };
    } else if (native.stream) {
      full.collect = [s = native.stream](StreamReader<I> input, const RunOptions& options) -> Expected<O> {
        auto first = detail::first_input(std::move(input));
        if (!first) {
          return tl::unexpected(first.error());
        }
        return detail::first_of(s(std::move(*first), options));
      };
    }
  }

  if (!full.transform) {
    if (native.collect) {
      full.transform = [c = native.collect](StreamReader<I> input, const RunOptions& options) {
        return detail::wrap_single(c(std::move(input), options));
      };
    } else if (native.stream) {
      full.transform = [s = native.stream](StreamReader<I> input,
                                           const RunOptions& options) -> Expected<StreamReader<O>> {
        return stream::flat_map<I, O>(std::move(input), [s, options](I item) { return s(std::move(item), options); });
      };
    } else if (native.invoke) {
      full.transform = [i = native.invoke](StreamReader<I> input,
                                           const RunOptions& options) -> Expected<StreamReader<O>> {
        return stream::transform(std::move(input), [i, options](I item) { return i(std::move(item), options); });
      };
    }
  }

  return full;
}

}  // namespace relay::compose
