// Copyright 2026 The skinmark Authors

#ifndef SKINMARK_CORE_SKINMARK_CONTEXT_H_
#define SKINMARK_CORE_SKINMARK_CONTEXT_H_

#include <memory>
#include <string>
#include <vector>

#include "annotation/annotation_pipeline.h"
#include "annotation/annotation_renderer.h"
#include "core/annotation_config.h"
#include "skinmark/skinmark.h"

namespace skinmark {
namespace internal {

/// Internal implementation of the opaque SkinmarkContext handle.
///
/// Owns the annotation configuration and the drawing backend, and
/// provides the bridge between the public C API and the pipeline.
class SkinmarkContextImpl {
 public:
  SkinmarkContextImpl();
  ~SkinmarkContextImpl();

  // Non-copyable.
  SkinmarkContextImpl(const SkinmarkContextImpl&) = delete;
  SkinmarkContextImpl& operator=(const SkinmarkContextImpl&) = delete;

  /// Create the drawing backend.
  bool Initialize();

  /// Check if the context has been successfully initialized.
  bool is_initialized() const { return initialized_; }

  // -- Error state --

  SkinmarkError last_error() const { return last_error_; }
  const char* last_error_message() const { return last_error_message_.c_str(); }

  void SetError(SkinmarkError code, const std::string& message);
  void ClearError();

  // -- Configuration --

  const AnnotationConfig& config() const { return config_; }
  SkinmarkError LoadConfig(const std::string& path);
  SkinmarkError SetConfigValue(const std::string& key,
                               const std::string& value);
  void ResetConfig();

  // -- Annotation --

  /// Run the annotation pipeline. On kSkinmarkOk and
  /// kSkinmarkErrorNoFaceDetected `out` holds the result; the latter is
  /// also recorded as the last error so callers can tell it apart.
  SkinmarkError Annotate(const Image* image, const AnchorFrame* frame,
                         const std::vector<Issue>& issues,
                         AnnotationResult* out);

 private:
  AnnotationConfig config_;
  std::unique_ptr<AnnotationRenderer> renderer_;
  bool initialized_ = false;

  SkinmarkError last_error_ = kSkinmarkOk;
  std::string last_error_message_;
};

}  // namespace internal
}  // namespace skinmark

#endif  // SKINMARK_CORE_SKINMARK_CONTEXT_H_
