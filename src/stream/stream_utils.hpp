#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "common/logging/flags.hpp"
#include "stream/channel.hpp"

namespace relay::stream {

namespace detail {

template <typename T>
struct transform_output {
  using type = T;
  static constexpr bool is_optional = false;
  static constexpr bool is_expected = false;
};

template <typename T>
struct transform_output<std::optional<T>> {
  using type = T;
  static constexpr bool is_optional = true;
  static constexpr bool is_expected = false;
};

template <typename T>
struct transform_output<Expected<T>> {
  using type = T;
  static constexpr bool is_optional = false;
  static constexpr bool is_expected = true;
};

template <typename T, typename Fn>
using transform_raw_t = std::remove_cvref_t<std::invoke_result_t<Fn&, T&&>>;

template <typename T, typename Fn>
using transform_result_t = typename transform_output<transform_raw_t<T, Fn>>::type;

template <typename T>
class ConcatSource final : public Source<T> {
 public:
  explicit ConcatSource(std::vector<SourcePtr<T>> sources) : sources_(std::move(sources)) {}

  auto next() -> StreamItem<T> override {
    while (index_ < sources_.size() && !cancelled_.load(std::memory_order_acquire)) {
      auto item = sources_[index_]->next();
      if (item.is_eof()) {
        ++index_;
        continue;
      }
      return item;
    }
    return StreamItem<T>::eof();
  }

  auto cancel() -> void override {
    cancelled_.store(true, std::memory_order_release);
    for (auto& source : sources_) {
      source->cancel();
    }
  }

 private:
  std::vector<SourcePtr<T>> sources_;
  std::size_t index_ = 0;
  std::atomic<bool> cancelled_{false};
};

template <typename T, typename Fn>
class TransformSource final : public Source<transform_result_t<T, Fn>> {
 public:
  using Out = transform_result_t<T, Fn>;
  using Traits = transform_output<transform_raw_t<T, Fn>>;

  TransformSource(SourcePtr<T> upstream, Fn fn) : upstream_(std::move(upstream)), fn_(std::move(fn)) {}

  auto next() -> StreamItem<Out> override {
    while (true) {
      auto item = upstream_->next();
      if (item.is_eof()) {
        return StreamItem<Out>::eof();
      }
      if (item.is_error()) {
        return StreamItem<Out>::error(item.error());
      }
      try {
        auto result = fn_(item.take());
        if constexpr (Traits::is_optional) {
          if (!result) {
            continue;
          }
          return StreamItem<Out>::value(std::move(*result));
        } else if constexpr (Traits::is_expected) {
          if (!result) {
            return StreamItem<Out>::error(std::move(result.error()));
          }
          return StreamItem<Out>::value(std::move(*result));
        } else {
          return StreamItem<Out>::value(std::move(result));
        }
      } catch (...) {
        return StreamItem<Out>::error(engine::from_exception(std::current_exception()));
      }
    }
  }

  auto cancel() -> void override { upstream_->cancel(); }

 private:
  SourcePtr<T> upstream_;
  Fn fn_;
};

/// Expands each upstream value into a whole stream, drained in input order.
template <typename T, typename R>
class FlatMapSource final : public Source<R> {
 public:
  using Expand = std::function<Expected<StreamReader<R>>(T)>;

  FlatMapSource(SourcePtr<T> upstream, Expand expand) : upstream_(std::move(upstream)), expand_(std::move(expand)) {}

  auto next() -> StreamItem<R> override {
    while (!cancelled_.load(std::memory_order_acquire)) {
      if (auto current = current_source()) {
        auto item = current->next();
        if (!item.is_eof()) {
          return item;
        }
        set_current(nullptr);
      }
      auto item = upstream_->next();
      if (item.is_eof()) {
        return StreamItem<R>::eof();
      }
      if (item.is_error()) {
        return StreamItem<R>::error(item.error());
      }
      auto expanded = expand_(item.take());
      if (!expanded) {
        return StreamItem<R>::error(std::move(expanded.error()));
      }
      set_current(expanded->release_source());
    }
    return StreamItem<R>::eof();
  }

  auto cancel() -> void override {
    cancelled_.store(true, std::memory_order_release);
    upstream_->cancel();
    if (auto current = current_source()) {
      current->cancel();
    }
  }

 private:
  auto current_source() -> SourcePtr<R> {
    std::lock_guard<std::mutex> lock(current_mutex_);
    return current_;
  }

  auto set_current(SourcePtr<R> source) -> void {
    std::lock_guard<std::mutex> lock(current_mutex_);
    current_ = std::move(source);
    if (current_ && cancelled_.load(std::memory_order_acquire)) {
      current_->cancel();
    }
  }

  SourcePtr<T> upstream_;
  Expand expand_;
  SourcePtr<R> current_;
  std::mutex current_mutex_;
  std::atomic<bool> cancelled_{false};
};

/// One upstream shared by N readers through a single buffer and per-reader cursors.
/// Items are dropped once every active reader has moved past them. Upstream pulls run
/// on a puller thread owned by the state and only when a reader is waiting at the
/// head, so a retired reader never stays blocked on an upstream it no longer reads.
template <typename T>
class CopyState {
 public:
  CopyState(SourcePtr<T> upstream, std::size_t readers)
      : upstream_(std::move(upstream)), cursors_(readers, 0), active_(readers, true), active_count_(readers) {}

  ~CopyState() {
    bool in_flight = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopping_ = true;
      in_flight = pulling_;
      demand_.notify_all();
    }
    if (in_flight) {
      upstream_->cancel();
    }
    if (puller_.joinable()) {
      puller_.join();
    }
  }

  CopyState(const CopyState&) = delete;
  auto operator=(const CopyState&) -> CopyState& = delete;

  auto next(std::size_t reader) -> StreamItem<T> {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
      if (!active_[reader]) {
        return StreamItem<T>::eof();
      }
      if (cursors_[reader] < base_ + buffer_.size()) {
        auto item = buffer_[static_cast<std::size_t>(cursors_[reader] - base_)];
        ++cursors_[reader];
        trim();
        return item;
      }
      if (finished_) {
        return StreamItem<T>::eof();
      }
      if (!requested_) {
        requested_ = true;
        if (!puller_.joinable()) {
          puller_ = std::thread([this] { pull_loop(); });
        }
        demand_.notify_one();
      }
      changed_.wait(lock);
    }
  }

  auto cancel(std::size_t reader) -> void {
    bool release_upstream = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!active_[reader]) {
        return;
      }
      active_[reader] = false;
      --active_count_;
      release_upstream = active_count_ == 0;
      trim();
      changed_.notify_all();
    }
    if (release_upstream) {
      upstream_->cancel();
    }
  }

 private:
  auto pull_loop() -> void {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
      demand_.wait(lock, [&] { return requested_ || stopping_; });
      if (stopping_) {
        return;
      }
      pulling_ = true;
      lock.unlock();
      auto item = upstream_->next();
      lock.lock();
      pulling_ = false;
      requested_ = false;
      if (item.is_eof()) {
        finished_ = true;
      } else if (active_count_ > 0) {
        buffer_.push_back(std::move(item));
      }
      changed_.notify_all();
      if (finished_) {
        return;
      }
    }
  }

  auto trim() -> void {
    std::optional<std::uint64_t> slowest;
    for (std::size_t i = 0; i < cursors_.size(); ++i) {
      if (active_[i] && (!slowest || cursors_[i] < *slowest)) {
        slowest = cursors_[i];
      }
    }
    if (!slowest) {
      base_ += buffer_.size();
      buffer_.clear();
      return;
    }
    while (base_ < *slowest && !buffer_.empty()) {
      buffer_.pop_front();
      ++base_;
    }
  }

  SourcePtr<T> upstream_;
  std::mutex mutex_;
  std::condition_variable changed_;
  std::condition_variable demand_;
  std::deque<StreamItem<T>> buffer_;
  std::uint64_t base_ = 0;
  std::vector<std::uint64_t> cursors_;
  std::vector<bool> active_;
  std::size_t active_count_;
  bool requested_ = false;
  bool pulling_ = false;
  bool finished_ = false;
  bool stopping_ = false;
  std::thread puller_;
};

template <typename T>
class CopySource final : public Source<T> {
 public:
  CopySource(std::shared_ptr<CopyState<T>> state, std::size_t index)
      : state_(std::move(state)), index_(index) {}

  auto next() -> StreamItem<T> override { return state_->next(index_); }
  auto cancel() -> void override { state_->cancel(index_); }

 private:
  std::shared_ptr<CopyState<T>> state_;
  std::size_t index_;
};

/// Fan-in over a bounded channel fed by one pump thread per source. Pumps block on
/// their sources, so they own dedicated threads instead of pool workers.
template <typename T>
class MergeSource final : public Source<T> {
 public:
  MergeSource(std::vector<std::pair<std::string, SourcePtr<T>>> sources, bool mark_exhausted,
              std::size_t capacity)
      : out_(std::make_shared<ChannelState<T>>(capacity == 0 ? 1 : capacity)) {
    auto remaining = std::make_shared<std::atomic<std::size_t>>(sources.size());
    for (auto& entry : sources) {
      sources_.push_back(entry.second);
    }
    pumps_.reserve(sources.size());
    for (auto& [name, source] : sources) {
      pumps_.emplace_back([out = out_, source = source, name = name, remaining, mark_exhausted]() {
        bool accepted = true;
        while (true) {
          auto item = source->next();
          if (item.is_eof()) {
            break;
          }
          if (!out->push(std::move(item))) {
            accepted = false;
            source->cancel();
            break;
          }
        }
        if (accepted && mark_exhausted) {
          out->push(StreamItem<T>::error(engine::make_error(
              ErrorCode::SourceExhausted, "source '" + name + "' exhausted", name)));
        }
        if (remaining->fetch_sub(1) == 1) {
          out->close_write();
        }
      });
    }
  }

  ~MergeSource() override { cancel(); }

  MergeSource(const MergeSource&) = delete;
  auto operator=(const MergeSource&) -> MergeSource& = delete;

  auto next() -> StreamItem<T> override { return out_->pop(); }

  auto cancel() -> void override {
    out_->close_read();
    for (auto& source : sources_) {
      source->cancel();
    }
  }

 private:
  std::shared_ptr<ChannelState<T>> out_;
  std::vector<SourcePtr<T>> sources_;
  std::vector<std::jthread> pumps_;
};

}  // namespace detail

inline auto default_merge_capacity() -> std::size_t {
  return FLAGS_stream_merge_capacity > 0 ? static_cast<std::size_t>(FLAGS_stream_merge_capacity) : 1;
}

/// Drains each reader in order. Error items are forwarded in place.
template <typename T>
auto concat(std::vector<StreamReader<T>> readers) -> StreamReader<T> {
  if (readers.empty()) {
    return empty_reader<T>();
  }
  if (readers.size() == 1) {
    return std::move(readers.front());
  }
  std::vector<detail::SourcePtr<T>> sources;
  sources.reserve(readers.size());
  for (auto& reader : readers) {
    sources.push_back(reader.release_source());
  }
  return StreamReader<T>(std::make_shared<detail::ConcatSource<T>>(std::move(sources)));
}

/// Maps each value through fn. fn may return R, std::optional<R> (nullopt drops the
/// item) or Expected<R>; exceptions become error items at the same position.
template <typename T, typename Fn>
auto transform(StreamReader<T> reader, Fn fn) -> StreamReader<detail::transform_result_t<T, Fn>> {
  using Out = detail::transform_result_t<T, Fn>;
  return StreamReader<Out>(
      std::make_shared<detail::TransformSource<T, Fn>>(reader.release_source(), std::move(fn)));
}

/// Replaces every value with the stream expand returns for it, concatenated in
/// input order. A failed expansion becomes an error item.
template <typename T, typename R>
auto flat_map(StreamReader<T> reader, std::function<Expected<StreamReader<R>>(T)> expand) -> StreamReader<R> {
  return StreamReader<R>(
      std::make_shared<detail::FlatMapSource<T, R>>(reader.release_source(), std::move(expand)));
}

/// Splits one reader into n readers that each observe every item in order.
/// The original reader is consumed; n == 1 returns it unchanged.
template <typename T>
auto copy(StreamReader<T> reader, std::size_t n) -> std::vector<StreamReader<T>> {
  std::vector<StreamReader<T>> readers;
  if (n == 0) {
    reader.close();
    return readers;
  }
  if (n == 1) {
    readers.push_back(std::move(reader));
    return readers;
  }
  auto state = std::make_shared<detail::CopyState<T>>(reader.release_source(), n);
  readers.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    readers.emplace_back(std::make_shared<detail::CopySource<T>>(state, i));
  }
  return readers;
}

/// Fans readers into one. Per-source order is kept; interleaving is unspecified.
template <typename T>
auto merge(std::vector<StreamReader<T>> readers, std::size_t capacity = default_merge_capacity())
    -> StreamReader<T> {
  if (readers.empty()) {
    return empty_reader<T>();
  }
  if (readers.size() == 1) {
    return std::move(readers.front());
  }
  std::vector<std::pair<std::string, detail::SourcePtr<T>>> sources;
  sources.reserve(readers.size());
  for (std::size_t i = 0; i < readers.size(); ++i) {
    sources.emplace_back(std::to_string(i), readers[i].release_source());
  }
  return StreamReader<T>(
      std::make_shared<detail::MergeSource<T>>(std::move(sources), false, capacity));
}

/// Like merge, but emits a SourceExhausted error item naming each source as it drains.
template <typename T>
auto named_merge(std::map<std::string, StreamReader<T>> readers,
                 std::size_t capacity = default_merge_capacity()) -> StreamReader<T> {
  if (readers.empty()) {
    return empty_reader<T>();
  }
  std::vector<std::pair<std::string, detail::SourcePtr<T>>> sources;
  sources.reserve(readers.size());
  for (auto& [name, reader] : readers) {
    sources.emplace_back(name, reader.release_source());
  }
  return StreamReader<T>(
      std::make_shared<detail::MergeSource<T>>(std::move(sources), true, capacity));
}

/// True when an item is the exhaustion marker emitted by named_merge.
template <typename T>
auto is_source_exhausted(const StreamItem<T>& item) -> bool {
  return item.is_error() && item.error().code == ErrorCode::SourceExhausted;
}

}  // namespace relay::stream
