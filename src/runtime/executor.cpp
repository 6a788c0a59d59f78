#include "runtime/executor.hpp"

#include <algorithm>
#include <exception>
#include <thread>
#include <utility>

#include <exec/async_scope.hpp>
#include <exec/static_thread_pool.hpp>
#include <stdexec/execution.hpp>

#include "common/logging/flags.hpp"
#include "common/logging/log.hpp"

namespace relay::engine {

namespace {

thread_local const void* t_current_pool = nullptr;

auto resolve_threads(int requested) -> int {
  if (requested > 0) {
    return requested;
  }
  const auto hw = static_cast<int>(std::thread::hardware_concurrency());
  return std::max(1, hw);
}

class WorkerMark {
 public:
  explicit WorkerMark(const void* pool) : previous_(t_current_pool) { t_current_pool = pool; }
  ~WorkerMark() { t_current_pool = previous_; }

  WorkerMark(const WorkerMark&) = delete;
  auto operator=(const WorkerMark&) -> WorkerMark& = delete;

 private:
  const void* previous_;
};

}  // namespace

struct Executor::Pool {
  explicit Pool(int threads) : size(threads), pool(static_cast<std::size_t>(threads)) {}
  int size;
  exec::static_thread_pool pool;
};

Executor::Executor(ExecutorConfig config)
    : pool_(std::make_unique<Pool>(resolve_threads(config.threads))) {
  log::debug("executor started with {} threads", pool_->size);
}

Executor::~Executor() = default;

auto Executor::thread_count() const -> int { return pool_ ? pool_->size : 0; }

auto Executor::on_worker() const -> bool {
  return pool_ && t_current_pool == pool_.get();
}

auto Executor::run_all(std::vector<std::function<void()>> tasks) const -> void {
  if (tasks.empty()) {
    return;
  }
  std::vector<std::exception_ptr> failures(tasks.size());

  if (tasks.size() == 1 || on_worker()) {
    for (std::size_t i = 0; i < tasks.size(); ++i) {
      try {
        tasks[i]();
      } catch (...) {
        failures[i] = std::current_exception();
      }
    }
  } else {
    auto scheduler = pool_->pool.get_scheduler();
    const void* marker = pool_.get();
    exec::async_scope scope;
    for (std::size_t i = 0; i < tasks.size(); ++i) {
      scope.spawn(stdexec::schedule(scheduler) |
                  stdexec::then([&tasks, &failures, marker, i]() noexcept {
                    WorkerMark mark(marker);
                    try {
                      tasks[i]();
                    } catch (...) {
                      failures[i] = std::current_exception();
                    }
                  }));
    }
    stdexec::sync_wait(scope.on_empty());
  }

  for (auto& failure : failures) {
    if (failure) {
      std::rethrow_exception(failure);
    }
  }
}

auto Executor::shared() -> Executor& {
  static Executor instance(ExecutorConfig{FLAGS_executor_threads});
  return instance;
}

}  // namespace relay::engine
