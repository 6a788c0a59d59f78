#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "stream/stream_item.hpp"

namespace relay::stream {

namespace detail {

/// Pull side of a stream. next() blocks until an item is available; cancel() may be
/// called from another thread and must unblock a pending next().
template <typename T>
class Source {
 public:
  virtual ~Source() = default;
  virtual auto next() -> StreamItem<T> = 0;
  virtual auto cancel() -> void = 0;
};

template <typename T>
using SourcePtr = std::shared_ptr<Source<T>>;

/// Shared queue behind a writer/reader pair. Capacity 0 is a synchronous handoff:
/// push returns only after a reader took the item.
template <typename T>
class ChannelState {
 public:
  explicit ChannelState(std::size_t capacity) : capacity_(capacity) {}

  auto push(StreamItem<T> item) -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    if (capacity_ > 0) {
      writable_.wait(lock, [&] { return read_closed_ || write_closed_ || items_.size() < capacity_; });
    }
    if (read_closed_ || write_closed_) {
      return false;
    }
    items_.push_back(std::move(item));
    const auto ticket = ++pushed_;
    readable_.notify_one();
    if (capacity_ == 0) {
      writable_.wait(lock, [&] { return read_closed_ || popped_ >= ticket; });
      return popped_ >= ticket;
    }
    return true;
  }

  auto pop() -> StreamItem<T> {
    std::unique_lock<std::mutex> lock(mutex_);
    readable_.wait(lock, [&] { return !items_.empty() || write_closed_ || read_closed_; });
    if (!items_.empty() && !read_closed_) {
      auto item = std::move(items_.front());
      items_.pop_front();
      ++popped_;
      writable_.notify_all();
      return item;
    }
    return StreamItem<T>::eof();
  }

  auto close_write() -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    write_closed_ = true;
    readable_.notify_all();
    writable_.notify_all();
  }

  /// Drops buffered items; pending and later pushes report rejection.
  auto close_read() -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    read_closed_ = true;
    items_.clear();
    readable_.notify_all();
    writable_.notify_all();
  }

  auto write_closed() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_closed_ || read_closed_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable readable_;
  std::condition_variable writable_;
  std::deque<StreamItem<T>> items_;
  std::size_t capacity_;
  std::uint64_t pushed_ = 0;
  std::uint64_t popped_ = 0;
  bool write_closed_ = false;
  bool read_closed_ = false;
};

template <typename T>
class ChannelSource final : public Source<T> {
 public:
  explicit ChannelSource(std::shared_ptr<ChannelState<T>> state) : state_(std::move(state)) {}

  auto next() -> StreamItem<T> override { return state_->pop(); }
  auto cancel() -> void override { state_->close_read(); }

 private:
  std::shared_ptr<ChannelState<T>> state_;
};

template <typename T>
class ValuesSource final : public Source<T> {
 public:
  explicit ValuesSource(std::vector<T> values) : values_(std::move(values)) {}

  auto next() -> StreamItem<T> override {
    if (cancelled_.load(std::memory_order_acquire) || index_ >= values_.size()) {
      return StreamItem<T>::eof();
    }
    return StreamItem<T>::value(std::move(values_[index_++]));
  }

  auto cancel() -> void override { cancelled_.store(true, std::memory_order_release); }

 private:
  std::vector<T> values_;
  std::size_t index_ = 0;
  std::atomic<bool> cancelled_{false};
};

/// Stands in for a reader that was already retired when handed to a combinator.
template <typename T>
class ClosedSource final : public Source<T> {
 public:
  auto next() -> StreamItem<T> override {
    if (reported_.exchange(true)) {
      return StreamItem<T>::eof();
    }
    return StreamItem<T>::error(
        engine::make_error(ErrorCode::StreamClosed, "stream reader was already closed"));
  }

  auto cancel() -> void override { reported_.store(true); }

 private:
  std::atomic<bool> reported_{false};
};

}  // namespace detail

/// Read end of a stream. Move-only; observes end-of-stream exactly once, after which
/// the reader is retired and further reads fail with StreamClosed.
template <typename T>
class StreamReader {
 public:
  StreamReader() = default;
  explicit StreamReader(detail::SourcePtr<T> source) : source_(std::move(source)) {}

  ~StreamReader() { close(); }

  StreamReader(const StreamReader&) = delete;
  auto operator=(const StreamReader&) -> StreamReader& = delete;

  StreamReader(StreamReader&& other) noexcept : source_(std::move(other.source_)) {}

  auto operator=(StreamReader&& other) noexcept -> StreamReader& {
    if (this != &other) {
      close();
      source_ = std::move(other.source_);
    }
    return *this;
  }

  /// Blocks for the next item. Fails only when the reader is already retired.
  auto recv() -> Expected<StreamItem<T>> {
    if (!source_) {
      return tl::unexpected(
          engine::make_error(ErrorCode::StreamClosed, "read from a closed stream reader"));
    }
    auto item = source_->next();
    if (item.is_eof()) {
      close();
    }
    return item;
  }

  /// Drains the stream; the first in-band error aborts and retires the reader.
  auto collect_all() -> Expected<std::vector<T>> {
    std::vector<T> values;
    while (true) {
      auto item = recv();
      if (!item) {
        return tl::unexpected(item.error());
      }
      if (item->is_eof()) {
        return values;
      }
      if (item->is_error()) {
        auto error = item->error();
        close();
        return tl::unexpected(std::move(error));
      }
      values.push_back(item->take());
    }
  }

  /// Retires the reader early; the upstream writer sees its writes rejected.
  auto close() -> void {
    if (source_) {
      auto source = std::move(source_);
      source_.reset();
      source->cancel();
    }
  }

  auto is_open() const -> bool { return static_cast<bool>(source_); }

  /// Hands the underlying source to a combinator and retires this reader.
  auto release_source() -> detail::SourcePtr<T> {
    if (!source_) {
      return std::make_shared<detail::ClosedSource<T>>();
    }
    auto source = std::move(source_);
    source_.reset();
    return source;
  }

 private:
  detail::SourcePtr<T> source_;
};

/// Write end of a stream. Move-only; destroying it closes the channel.
template <typename T>
class StreamWriter {
 public:
  StreamWriter() = default;
  explicit StreamWriter(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {}

  ~StreamWriter() { close(); }

  StreamWriter(const StreamWriter&) = delete;
  auto operator=(const StreamWriter&) -> StreamWriter& = delete;

  StreamWriter(StreamWriter&& other) noexcept : state_(std::move(other.state_)) {}

  auto operator=(StreamWriter&& other) noexcept -> StreamWriter& {
    if (this != &other) {
      close();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  /// Returns false when the channel no longer accepts items.
  auto write(T value) -> bool {
    return state_ && state_->push(StreamItem<T>::value(std::move(value)));
  }

  auto write_error(Error error) -> bool {
    return state_ && state_->push(StreamItem<T>::error(std::move(error)));
  }

  /// Idempotent. Items already written still drain to the reader.
  auto close() -> void {
    if (state_) {
      state_->close_write();
      state_.reset();
    }
  }

  auto is_closed() const -> bool { return !state_ || state_->write_closed(); }

 private:
  std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T>
struct Pipe {
  StreamReader<T> reader;
  StreamWriter<T> writer;
};

/// Creates a connected pair. Capacity 0 hands each item over synchronously.
template <typename T>
auto pipe(std::size_t capacity = 0) -> Pipe<T> {
  auto state = std::make_shared<detail::ChannelState<T>>(capacity);
  return Pipe<T>{StreamReader<T>(std::make_shared<detail::ChannelSource<T>>(state)),
                 StreamWriter<T>(state)};
}

template <typename T>
auto from_values(std::vector<T> values) -> StreamReader<T> {
  return StreamReader<T>(std::make_shared<detail::ValuesSource<T>>(std::move(values)));
}

template <typename T>
auto single(T value) -> StreamReader<T> {
  std::vector<T> values;
  values.push_back(std::move(value));
  return from_values(std::move(values));
}

template <typename T>
auto empty_reader() -> StreamReader<T> {
  return from_values(std::vector<T>{});
}

}  // namespace relay::stream
