// Copyright 2026 The skinmark Authors

#include "core/logger.h"

#include <cstdlib>
#include <mutex>
#include <string>

#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include "core/callback_sink.h"

namespace skinmark {
namespace internal {

namespace {

constexpr char kLevelEnvVar[] = "SKINMARK_LOG_LEVEL";

std::once_flag g_init_flag;
std::shared_ptr<spdlog::logger> g_logger;
std::shared_ptr<CallbackSink> g_callback_sink;

std::shared_ptr<spdlog::logger> BuildLogger(
    const std::shared_ptr<CallbackSink>& callback_sink) {
  auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  spdlog::sinks_init_list sinks = {stderr_sink, callback_sink};
  auto logger = std::make_shared<spdlog::logger>("skinmark", sinks);
  logger->set_pattern("[skinmark][%l] %v");
  logger->set_level(
      LevelFromName(std::getenv(kLevelEnvVar), spdlog::level::info));
  logger->flush_on(spdlog::level::warn);
  return logger;
}

}  // namespace

void InitLogger() {
  std::call_once(g_init_flag, []() {
    g_callback_sink = std::make_shared<CallbackSink>();
    g_logger = BuildLogger(g_callback_sink);
  });
}

std::shared_ptr<spdlog::logger> GetLogger() {
  InitLogger();
  return g_logger;
}

std::shared_ptr<CallbackSink> GetCallbackSink() {
  InitLogger();
  return g_callback_sink;
}

void SetLogLevel(SkinmarkLogLevel level) {
  GetLogger()->set_level(ToSpdlogLevel(level));
}

spdlog::level::level_enum LevelFromName(const char* name,
                                        spdlog::level::level_enum fallback) {
  if (!name || !*name) return fallback;
  std::string value(name);
  if (value == "trace") return spdlog::level::trace;
  if (value == "debug") return spdlog::level::debug;
  if (value == "info") return spdlog::level::info;
  if (value == "warn") return spdlog::level::warn;
  if (value == "error") return spdlog::level::err;
  if (value == "fatal") return spdlog::level::critical;
  if (value == "off") return spdlog::level::off;
  return fallback;
}

spdlog::level::level_enum ToSpdlogLevel(SkinmarkLogLevel level) {
  switch (level) {
    case kSkinmarkLogTrace: return spdlog::level::trace;
    case kSkinmarkLogDebug: return spdlog::level::debug;
    case kSkinmarkLogWarn:  return spdlog::level::warn;
    case kSkinmarkLogError: return spdlog::level::err;
    case kSkinmarkLogFatal: return spdlog::level::critical;
    case kSkinmarkLogInfo:
    default:                return spdlog::level::info;
  }
}

SkinmarkLogLevel FromSpdlogLevel(spdlog::level::level_enum level) {
  switch (level) {
    case spdlog::level::trace:    return kSkinmarkLogTrace;
    case spdlog::level::debug:    return kSkinmarkLogDebug;
    case spdlog::level::warn:     return kSkinmarkLogWarn;
    case spdlog::level::err:      return kSkinmarkLogError;
    case spdlog::level::critical:
    case spdlog::level::off:      return kSkinmarkLogFatal;
    case spdlog::level::info:
    default:                      return kSkinmarkLogInfo;
  }
}

}  // namespace internal
}  // namespace skinmark
