#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "callbacks/callback_manager.hpp"
#include "runtime/executor.hpp"

namespace relay::compose {

using engine::Json;

/// Per-call options shared by every execution mode.
struct RunOptions {
  std::shared_ptr<const callbacks::CallbackManager> callbacks;
  callbacks::Context context = Json::object();
  Json metadata = Json::object();
  std::vector<std::string> tags;
  /// Pool for concurrent fan-out; nullptr selects Executor::shared().
  const engine::Executor* executor = nullptr;

  auto with_context(callbacks::Context next) const -> RunOptions {
    RunOptions copy = *this;
    copy.context = std::move(next);
    return copy;
  }

  auto executor_or_shared() const -> const engine::Executor& {
    return executor ? *executor : engine::Executor::shared();
  }
};

}  // namespace relay::compose
