#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace relay::engine {

struct ExecutorConfig {
  /// Worker thread count; 0 or less selects hardware concurrency.
  int threads = 0;
};

/// Fixed-size worker pool for fan-out work (parallel graph edges, batch_parallel).
///
/// run_all blocks the caller until every task finished. A call issued from one of
/// this executor's own workers runs its tasks inline, so nested fan-outs never wait
/// on a pool they already occupy.
class Executor {
 public:
  explicit Executor(ExecutorConfig config = {});
  ~Executor();

  Executor(const Executor&) = delete;
  auto operator=(const Executor&) -> Executor& = delete;
  Executor(Executor&&) = delete;
  auto operator=(Executor&&) -> Executor& = delete;

  /// Runs all tasks and joins; rethrows the first exception by task index.
  auto run_all(std::vector<std::function<void()>> tasks) const -> void;

  template <typename Fn>
  auto for_each_index(std::size_t count, Fn&& fn) const -> void {
    std::vector<std::function<void()>> tasks;
    tasks.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
      tasks.emplace_back([&fn, i]() { fn(i); });
    }
    run_all(std::move(tasks));
  }

  auto thread_count() const -> int;

  /// True when the calling thread is one of this executor's workers.
  auto on_worker() const -> bool;

  /// Process-wide executor sized by --executor_threads, built on first use.
  static auto shared() -> Executor&;

 private:
  struct Pool;
  std::unique_ptr<Pool> pool_;
};

}  // namespace relay::engine
