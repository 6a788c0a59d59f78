#include "callbacks/callback_manager.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <utility>

#include "common/logging/log.hpp"

namespace relay::callbacks {

namespace {

struct GlobalHandlers {
  std::mutex mutex;
  std::vector<HandlerPtr> handlers;
};

auto globals() -> GlobalHandlers& {
  static GlobalHandlers instance;
  return instance;
}

}  // namespace

CallbackManager::CallbackManager(std::vector<HandlerPtr> handlers) : handlers_(std::move(handlers)) {}

auto CallbackManager::add_handler(HandlerPtr handler) -> void {
  if (handler) {
    handlers_.push_back(std::move(handler));
  }
}

auto CallbackManager::remove_handler(const HandlerPtr& handler) -> bool {
  auto it = std::find(handlers_.begin(), handlers_.end(), handler);
  if (it == handlers_.end()) {
    return false;
  }
  handlers_.erase(it);
  return true;
}

auto CallbackManager::handlers() const -> std::vector<HandlerPtr> {
  auto all = handlers_;
  auto global = global_handlers();
  all.insert(all.end(), global.begin(), global.end());
  return all;
}

auto CallbackManager::with_handlers(const std::vector<HandlerPtr>& extra) const -> CallbackManager {
  auto combined = handlers_;
  combined.insert(combined.end(), extra.begin(), extra.end());
  return CallbackManager(std::move(combined));
}

template <typename Hook>
auto CallbackManager::dispatch(Context context, const RunInfo& info, std::string_view hook_name,
                               Hook&& hook) const -> Context {
  for (const auto& handler : handlers()) {
    try {
      context = hook(*handler, context);
    } catch (const std::exception& ex) {
      log::warn("callback handler failed in {} for '{}': {}", hook_name, info.name, ex.what());
    } catch (...) {
      log::warn("callback handler failed in {} for '{}': unknown exception", hook_name, info.name);
    }
  }
  return context;
}

auto CallbackManager::trigger_start(Context context, const RunInfo& info, const Payload& input) const
    -> Context {
  return dispatch(std::move(context), info, "on_start",
                  [&](CallbackHandler& handler, const Context& ctx) { return handler.on_start(ctx, info, input); });
}

auto CallbackManager::trigger_end(Context context, const RunInfo& info, const Payload& output) const
    -> Context {
  return dispatch(std::move(context), info, "on_end",
                  [&](CallbackHandler& handler, const Context& ctx) { return handler.on_end(ctx, info, output); });
}

auto CallbackManager::trigger_error(Context context, const RunInfo& info, const engine::Error& error) const
    -> Context {
  return dispatch(std::move(context), info, "on_error",
                  [&](CallbackHandler& handler, const Context& ctx) { return handler.on_error(ctx, info, error); });
}

auto CallbackManager::trigger_start_with_stream_input(Context context, const RunInfo& info,
                                                      const StreamPayload& input) const -> Context {
  return dispatch(std::move(context), info, "on_start_with_stream_input",
                  [&](CallbackHandler& handler, const Context& ctx) {
                    return handler.on_start_with_stream_input(ctx, info, input);
                  });
}

auto CallbackManager::trigger_end_with_stream_output(Context context, const RunInfo& info,
                                                     const StreamPayload& output) const -> Context {
  return dispatch(std::move(context), info, "on_end_with_stream_output",
                  [&](CallbackHandler& handler, const Context& ctx) {
                    return handler.on_end_with_stream_output(ctx, info, output);
                  });
}

auto CallbackManager::add_global_handler(HandlerPtr handler) -> void {
  if (!handler) {
    return;
  }
  auto& global = globals();
  std::lock_guard<std::mutex> lock(global.mutex);
  global.handlers.push_back(std::move(handler));
}

auto CallbackManager::remove_global_handler(const HandlerPtr& handler) -> bool {
  auto& global = globals();
  std::lock_guard<std::mutex> lock(global.mutex);
  auto it = std::find(global.handlers.begin(), global.handlers.end(), handler);
  if (it == global.handlers.end()) {
    return false;
  }
  global.handlers.erase(it);
  return true;
}

auto CallbackManager::clear_global_handlers() -> void {
  auto& global = globals();
  std::lock_guard<std::mutex> lock(global.mutex);
  global.handlers.clear();
}

auto CallbackManager::global_handlers() -> std::vector<HandlerPtr> {
  auto& global = globals();
  std::lock_guard<std::mutex> lock(global.mutex);
  return global.handlers;
}

}  // namespace relay::callbacks
