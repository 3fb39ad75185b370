// Copyright 2026 The skinmark Authors

#include "core/skinmark_context.h"

#include <utility>

#include "core/logger.h"

namespace skinmark {
namespace internal {

SkinmarkContextImpl::SkinmarkContextImpl() = default;

SkinmarkContextImpl::~SkinmarkContextImpl() = default;

bool SkinmarkContextImpl::Initialize() {
  if (initialized_) return true;

  SKINMARK_LOG_DEBUG("Initializing skinmark context...");

  renderer_ = CreateAnnotationRenderer();
  if (!renderer_) {
    SetError(kSkinmarkErrorRenderFailed,
             "Failed to create annotation renderer");
    return false;
  }

  initialized_ = true;
  ClearError();
  return true;
}

void SkinmarkContextImpl::SetError(SkinmarkError code,
                                   const std::string& message) {
  last_error_ = code;
  last_error_message_ = message;
  if (code == kSkinmarkErrorNoFaceDetected) {
    SKINMARK_LOG_WARN("Error {}: {}", static_cast<int>(code), message);
  } else {
    SKINMARK_LOG_ERROR("Error {}: {}", static_cast<int>(code), message);
  }
}

void SkinmarkContextImpl::ClearError() {
  last_error_ = kSkinmarkOk;
  last_error_message_.clear();
}

SkinmarkError SkinmarkContextImpl::LoadConfig(const std::string& path) {
  std::string message;
  SkinmarkError err = LoadAnnotationConfig(path, &config_, &message);
  if (err != kSkinmarkOk) {
    SetError(err, message.empty() ? "Failed to load config" : message);
    return err;
  }
  ClearError();
  return kSkinmarkOk;
}

SkinmarkError SkinmarkContextImpl::SetConfigValue(const std::string& key,
                                                  const std::string& value) {
  SkinmarkError err = config_.Set(key, value);
  if (err == kSkinmarkErrorInvalidParam) {
    SetError(err, "Unknown config key: " + key);
  } else if (err != kSkinmarkOk) {
    SetError(err, "Invalid value '" + value + "' for " + key);
  } else {
    ClearError();
  }
  return err;
}

void SkinmarkContextImpl::ResetConfig() {
  config_ = AnnotationConfig();
  ClearError();
}

SkinmarkError SkinmarkContextImpl::Annotate(const Image* image,
                                            const AnchorFrame* frame,
                                            const std::vector<Issue>& issues,
                                            AnnotationResult* out) {
  if (!initialized_) {
    SetError(kSkinmarkErrorNotInitialized, "Context not initialized");
    return kSkinmarkErrorNotInitialized;
  }

  AnnotationPipeline pipeline(config_, renderer_.get());
  std::string message;
  SkinmarkError err = pipeline.Run(image, frame, issues, out, &message);
  if (err == kSkinmarkErrorNoFaceDetected) {
    SetError(err, "No face detected for annotation");
  } else if (err != kSkinmarkOk) {
    SetError(err, message);
  } else {
    ClearError();
  }
  return err;
}

}  // namespace internal
}  // namespace skinmark
