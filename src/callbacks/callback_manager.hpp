#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "callbacks/callback_handler.hpp"

namespace relay::callbacks {

using HandlerPtr = std::shared_ptr<CallbackHandler>;

/// Ordered handler chain. Instance handlers run first, then process-wide global
/// handlers. A handler that throws is logged and skipped; the next handler sees the
/// last context produced without failure.
class CallbackManager {
 public:
  CallbackManager() = default;
  explicit CallbackManager(std::vector<HandlerPtr> handlers);

  auto add_handler(HandlerPtr handler) -> void;
  auto remove_handler(const HandlerPtr& handler) -> bool;

  /// Instance handlers followed by the current global handlers.
  auto handlers() const -> std::vector<HandlerPtr>;

  auto with_handlers(const std::vector<HandlerPtr>& extra) const -> CallbackManager;

  auto trigger_start(Context context, const RunInfo& info, const Payload& input) const -> Context;
  auto trigger_end(Context context, const RunInfo& info, const Payload& output) const -> Context;
  auto trigger_error(Context context, const RunInfo& info, const engine::Error& error) const -> Context;
  auto trigger_start_with_stream_input(Context context, const RunInfo& info,
                                       const StreamPayload& input) const -> Context;
  auto trigger_end_with_stream_output(Context context, const RunInfo& info,
                                      const StreamPayload& output) const -> Context;

  static auto add_global_handler(HandlerPtr handler) -> void;
  static auto remove_global_handler(const HandlerPtr& handler) -> bool;
  static auto clear_global_handlers() -> void;
  static auto global_handlers() -> std::vector<HandlerPtr>;

 private:
  template <typename Hook>
  auto dispatch(Context context, const RunInfo& info, std::string_view hook_name, Hook&& hook) const
      -> Context;

  std::vector<HandlerPtr> handlers_;
};

}  // namespace relay::callbacks
