// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_CORE_LOGGER_H_
#define SKINMARK_CORE_LOGGER_H_

#include <memory>

#include "spdlog/spdlog.h"

#include "skinmark/skinmark.h"

namespace skinmark {
namespace internal {

class CallbackSink;

// One "skinmark" logger per process, built on first use: a colored stderr
// sink plus the CallbackSink that feeds skinmark_set_log_callback. Its
// starting level is read from SKINMARK_LOG_LEVEL.
void InitLogger();
std::shared_ptr<spdlog::logger> GetLogger();
std::shared_ptr<CallbackSink> GetCallbackSink();

void SetLogLevel(SkinmarkLogLevel level);

/// Level for a SKINMARK_LOG_LEVEL value ("trace" ... "fatal", "off").
/// Null, empty and unknown names give `fallback`.
spdlog::level::level_enum LevelFromName(const char* name,
                                        spdlog::level::level_enum fallback);

spdlog::level::level_enum ToSpdlogLevel(SkinmarkLogLevel level);

/// Inverse of ToSpdlogLevel; "off" reports as fatal.
SkinmarkLogLevel FromSpdlogLevel(spdlog::level::level_enum level);

}  // namespace internal
}  // namespace skinmark

// ---------------------------------------------------------------------------
// Convenience macros (internal use only).
// ---------------------------------------------------------------------------

#define SKINMARK_LOG_TRACE(...)  SPDLOG_LOGGER_TRACE(::skinmark::internal::GetLogger(), __VA_ARGS__)
#define SKINMARK_LOG_DEBUG(...)  SPDLOG_LOGGER_DEBUG(::skinmark::internal::GetLogger(), __VA_ARGS__)
#define SKINMARK_LOG_INFO(...)   SPDLOG_LOGGER_INFO(::skinmark::internal::GetLogger(), __VA_ARGS__)
#define SKINMARK_LOG_WARN(...)   SPDLOG_LOGGER_WARN(::skinmark::internal::GetLogger(), __VA_ARGS__)
#define SKINMARK_LOG_ERROR(...)  SPDLOG_LOGGER_ERROR(::skinmark::internal::GetLogger(), __VA_ARGS__)
#define SKINMARK_LOG_FATAL(...)  SPDLOG_LOGGER_CRITICAL(::skinmark::internal::GetLogger(), __VA_ARGS__)

#endif  // SKINMARK_CORE_LOGGER_H_
