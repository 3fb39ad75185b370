// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_CORE_CALLBACK_SINK_H_
#define SKINMARK_CORE_CALLBACK_SINK_H_

#include <mutex>
#include <string>

#include "spdlog/sinks/base_sink.h"

#include "core/logger.h"
#include "skinmark/skinmark.h"

namespace skinmark {
namespace internal {

/// spdlog sink that hands each message to the user's C callback.
///
/// The callback gets the bare message text; the level travels as its own
/// argument, so no pattern is applied. Guarded by the base_sink mutex.
class CallbackSink : public spdlog::sinks::base_sink<std::mutex> {
 public:
  CallbackSink() = default;

  /// Passing nullptr as `callback` stops forwarding.
  void SetCallback(skinmark_log_callback_t callback, void* userdata) {
    std::lock_guard<std::mutex> lock(
        spdlog::sinks::base_sink<std::mutex>::mutex_);
    callback_ = callback;
    userdata_ = userdata;
  }

 protected:
  void sink_it_(const spdlog::details::log_msg& msg) override {
    if (!callback_) return;
    std::string text(msg.payload.data(), msg.payload.size());
    callback_(FromSpdlogLevel(msg.level), text.c_str(), userdata_);
  }

  void flush_() override {}

 private:
  skinmark_log_callback_t callback_ = nullptr;
  void* userdata_ = nullptr;
};

}  // namespace internal
}  // namespace skinmark

#endif  // SKINMARK_CORE_CALLBACK_SINK_H_
