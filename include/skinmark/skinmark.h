// Copyright 2026 The skinmark Authors
//
// Licensed under the MIT License. See LICENSE file in the project root for
// full license information.

#ifndef SKINMARK_SKINMARK_H_
#define SKINMARK_SKINMARK_H_

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ---------------------------------------------------------------------------
// Export macro
// ---------------------------------------------------------------------------
#if defined(_WIN32)
#if defined(SKINMARK_BUILDING)
#define SKINMARK_API __declspec(dllexport)
#else
#define SKINMARK_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define SKINMARK_API __attribute__((visibility("default")))
#else
#define SKINMARK_API
#endif

// ---------------------------------------------------------------------------
// Version (auto-generated from CMakeLists.txt via configure_file)
// ---------------------------------------------------------------------------
#include "skinmark/version.h"

// ---------------------------------------------------------------------------
// Thread safety
// ---------------------------------------------------------------------------
//
// General rules:
//   - Each SkinmarkContext is independent; different contexts may be used
//     concurrently from different threads without external synchronization.
//   - Operations on the SAME context are NOT thread-safe.  The caller must
//     serialize access to a single context if it is shared across threads.
//   - SkinmarkImage, SkinmarkAnchorFrame and SkinmarkResult objects are
//     immutable after creation; reading them from several threads is safe.
//   - The anchor topology and the severity color table are read-only
//     process-wide constants.
//   - skinmark_set_log_level() and skinmark_set_log_callback() are
//     process-global and internally synchronized.
//

// ---------------------------------------------------------------------------
// Opaque handles
// ---------------------------------------------------------------------------
typedef struct SkinmarkContext SkinmarkContext;
typedef struct SkinmarkImage SkinmarkImage;
typedef struct SkinmarkAnchorFrame SkinmarkAnchorFrame;
typedef struct SkinmarkResult SkinmarkResult;

// ---------------------------------------------------------------------------
// Types
// ---------------------------------------------------------------------------

/// Error codes returned by skinmark functions.
typedef enum SkinmarkError {
  kSkinmarkOk = 0,
  kSkinmarkErrorNotInitialized = -1,
  kSkinmarkErrorInvalidParam = -2,
  kSkinmarkErrorOutOfMemory = -5,
  kSkinmarkErrorNoFaceDetected = -30,   ///< Upstream detector found no face
  kSkinmarkErrorEmptyIssueList = -31,   ///< Annotation requested with 0 issues
  kSkinmarkErrorDecodeFailed = -32,     ///< Source image could not be decoded
  kSkinmarkErrorEncodeFailed = -33,     ///< Output image could not be encoded
  kSkinmarkErrorRenderFailed = -34,     ///< Drawing backend unavailable
  kSkinmarkErrorConfigFailed = -35,     ///< Configuration could not be applied
  kSkinmarkErrorUnknown = -99,
} SkinmarkError;

/// Log severity levels for the internal logging system.
typedef enum SkinmarkLogLevel {
  kSkinmarkLogTrace = 0,   ///< Very detailed diagnostic info
  kSkinmarkLogDebug = 1,   ///< Debug-level messages
  kSkinmarkLogInfo = 2,    ///< Informational messages (default)
  kSkinmarkLogWarn = 3,    ///< Warnings
  kSkinmarkLogError = 4,   ///< Errors
  kSkinmarkLogFatal = 5,   ///< Fatal / critical errors
} SkinmarkLogLevel;

/// User-defined log callback function type.
///
/// @param level  The severity level of the message.
/// @param message  Null-terminated UTF-8 message text, without the
///                 "[skinmark][level]" prefix used on stderr.
/// @param userdata  The opaque pointer passed to skinmark_set_log_callback.
typedef void (*skinmark_log_callback_t)(SkinmarkLogLevel level,
                                        const char* message,
                                        void* userdata);

/// Ordinal severity of a skin issue. Drives color and scatter density.
typedef enum SkinmarkSeverity {
  kSkinmarkSeverityMild = 0,      ///< Drawn yellow
  kSkinmarkSeverityModerate = 1,  ///< Drawn orange
  kSkinmarkSeveritySevere = 2,    ///< Drawn red
  kSkinmarkSeverityCritical = 3,  ///< Drawn purple
} SkinmarkSeverity;

/// Point in image pixel space (or normalized space where documented).
typedef struct SkinmarkPoint {
  float x;
  float y;
} SkinmarkPoint;

/// One skin issue to visualize.
///
/// `points` is the caller's guess of the affected geometry and may be empty.
/// It is never modified; the geometry actually used is reported back through
/// skinmark_result_get_points().
typedef struct SkinmarkIssue {
  const char* type;              ///< e.g. "dark_circles", "acne"
  const char* region;            ///< e.g. "left_under_eye", "forehead"
  SkinmarkSeverity severity;
  const SkinmarkPoint* points;   ///< Optional caller geometry (may be NULL)
  int point_count;               ///< Number of entries in `points`
} SkinmarkIssue;

/// One row of the legend, in issue-list order.
typedef struct SkinmarkLegendEntry {
  int index;                  ///< 1-based issue number (matches on-image marker)
  char label[256];            ///< "<Region>: <Type>" (UTF-8, untruncated)
  SkinmarkSeverity severity;
  uint32_t color;             ///< Severity color, ARGB (0xAARRGGBB)
  int rendered;               ///< Non-zero if the issue was drawn on the image
} SkinmarkLegendEntry;

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

/// Create a new skinmark context holding the default annotation
/// configuration. The caller must destroy it with skinmark_context_destroy().
///
/// @return A new context, or NULL on failure.
SKINMARK_API SkinmarkContext* skinmark_context_create(void);

/// Destroy a skinmark context and release all associated resources.
///
/// @param ctx  Context to destroy. NULL is safely ignored.
SKINMARK_API void skinmark_context_destroy(SkinmarkContext* ctx);

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

/// Get the error code from the last failed operation on this context.
SKINMARK_API SkinmarkError skinmark_get_last_error(const SkinmarkContext* ctx);

/// Get a human-readable error message for the last failed operation.
///
/// Lifetime: The returned string is valid until the next API call on the
/// same context.  Copy the string if you need it beyond that.
///
/// @return UTF-8 error message. Never returns NULL.
SKINMARK_API const char* skinmark_get_last_error_message(
    const SkinmarkContext* ctx);

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

/// Load annotation policy values from an INI-style file of `key=value`
/// lines. Lines starting with '#' or '[' are ignored; unknown keys are
/// logged and skipped. On any malformed value the whole load is rejected
/// and the previous configuration stays in effect.
///
/// @return kSkinmarkOk, kSkinmarkErrorInvalidParam or
///         kSkinmarkErrorConfigFailed.
SKINMARK_API SkinmarkError skinmark_context_load_config(SkinmarkContext* ctx,
                                                        const char* path);

/// Set a single configuration value from its textual form
/// (e.g. "overlay_alpha", "0.6").
SKINMARK_API SkinmarkError skinmark_config_set(SkinmarkContext* ctx,
                                               const char* key,
                                               const char* value);

/// Read a configuration value in textual form into `buf`.
SKINMARK_API SkinmarkError skinmark_config_get(const SkinmarkContext* ctx,
                                               const char* key, char* buf,
                                               int buf_size);

/// Restore every configuration value to its documented default.
SKINMARK_API void skinmark_config_reset(SkinmarkContext* ctx);

// ---------------------------------------------------------------------------
// Images
// ---------------------------------------------------------------------------

/// Create an image from a packed 8-bit RGB buffer (3 bytes per pixel).
///
/// @param rgb     Pixel data, row-major, `stride` bytes per row.
/// @param stride  Bytes per row (>= width * 3).
/// @return New image, or NULL on failure (see last error).
SKINMARK_API SkinmarkImage* skinmark_image_create_rgb(SkinmarkContext* ctx,
                                                      const uint8_t* rgb,
                                                      int width, int height,
                                                      int stride);

/// Decode an encoded raster (PNG, JPEG, BMP, ...) into an image.
SKINMARK_API SkinmarkImage* skinmark_image_decode(SkinmarkContext* ctx,
                                                  const uint8_t* bytes,
                                                  size_t size);

/// Destroy an image. NULL is safely ignored.
SKINMARK_API void skinmark_image_destroy(SkinmarkImage* image);

SKINMARK_API int skinmark_image_get_width(const SkinmarkImage* image);
SKINMARK_API int skinmark_image_get_height(const SkinmarkImage* image);

/// Copy the image as packed RGB8 into `out_rgb` (width * height * 3 bytes).
SKINMARK_API SkinmarkError skinmark_image_copy_rgb(const SkinmarkImage* image,
                                                   uint8_t* out_rgb,
                                                   size_t out_size);

// ---------------------------------------------------------------------------
// Anchor frames (output of the external face landmark detector)
// ---------------------------------------------------------------------------

/// Create an anchor frame for one detected face from pixel-space points.
/// Points are indexed by dense face-mesh anchor index (468 or 478 points).
SKINMARK_API SkinmarkAnchorFrame* skinmark_anchor_frame_create(
    SkinmarkContext* ctx, const SkinmarkPoint* points, int point_count);

/// Create an anchor frame from normalized [0, 1] points; they are scaled to
/// pixel space using the given image size.
SKINMARK_API SkinmarkAnchorFrame* skinmark_anchor_frame_create_normalized(
    SkinmarkContext* ctx, const SkinmarkPoint* points, int point_count,
    int image_width, int image_height);

/// Create a frame that records "the detector found no face".
SKINMARK_API SkinmarkAnchorFrame* skinmark_anchor_frame_create_no_face(
    SkinmarkContext* ctx);

/// Destroy an anchor frame. NULL is safely ignored.
SKINMARK_API void skinmark_anchor_frame_destroy(SkinmarkAnchorFrame* frame);

/// Non-zero if the frame describes a detected face.
SKINMARK_API int skinmark_anchor_frame_has_face(
    const SkinmarkAnchorFrame* frame);

/// Number of anchor points in the frame (0 for a no-face frame).
SKINMARK_API int skinmark_anchor_frame_point_count(
    const SkinmarkAnchorFrame* frame);

// ---------------------------------------------------------------------------
// Anchor topology and region resolution
// ---------------------------------------------------------------------------

/// Number of named regions in the built-in dense-mesh anchor topology.
SKINMARK_API int skinmark_topology_region_count(void);

/// Name of region `index` (e.g. "left_tear_trough"), or NULL if out of range.
SKINMARK_API const char* skinmark_topology_region_name(int index);

/// Copy the anchor indices of region `index`.
/// @return Total number of indices in the region, or -1 if out of range.
///         At most `max_count` entries are written to `out_indices`.
SKINMARK_API int skinmark_topology_region_indices(int index, int* out_indices,
                                                  int max_count);

/// Resolve a free-text region label and issue type to anchor indices.
///
/// Resolution never fails: labels matching no rule fall back to the full
/// face-oval outline. Dark-circle issue types override the region text and
/// always resolve to the tear-trough anchors.
///
/// @return Total number of resolved indices (may exceed `max_count`), or -1
///         if `region` is NULL.
SKINMARK_API int skinmark_resolve_region(const char* region,
                                         const char* issue_type,
                                         int* out_indices, int max_count);

// ---------------------------------------------------------------------------
// Severity helpers
// ---------------------------------------------------------------------------

/// Parse "mild" / "moderate" / "severe" / "critical" (case-insensitive).
SKINMARK_API SkinmarkError skinmark_severity_from_string(
    const char* text, SkinmarkSeverity* out_severity);

/// Lower-case name of a severity, or "unknown".
SKINMARK_API const char* skinmark_severity_to_string(SkinmarkSeverity severity);

/// Fixed severity color in ARGB (0xAARRGGBB).
SKINMARK_API uint32_t skinmark_severity_color(SkinmarkSeverity severity);

// ---------------------------------------------------------------------------
// Annotation pipeline
// ---------------------------------------------------------------------------

/// Annotate `image` with every issue in `issues`.
///
/// Preconditions (rejected before any rendering, no result produced):
///   - image must be non-NULL            -> kSkinmarkErrorInvalidParam
///   - issue_count must be > 0           -> kSkinmarkErrorEmptyIssueList
///
/// If `frame` is NULL or a no-face frame, a result IS produced: it holds the
/// unannotated base image, zero drawn issues and the full legend entry list,
/// and both the return value and skinmark_result_get_status() report
/// kSkinmarkErrorNoFaceDetected.
///
/// Failures while shaping a single issue never abort the others.
///
/// @param out_result  Receives a new result on kSkinmarkOk or
///                    kSkinmarkErrorNoFaceDetected. Caller must free it with
///                    skinmark_result_destroy().
SKINMARK_API SkinmarkError skinmark_annotate(SkinmarkContext* ctx,
                                             const SkinmarkImage* image,
                                             const SkinmarkAnchorFrame* frame,
                                             const SkinmarkIssue* issues,
                                             int issue_count,
                                             SkinmarkResult** out_result);

/// Destroy a result. NULL is safely ignored.
SKINMARK_API void skinmark_result_destroy(SkinmarkResult* result);

/// kSkinmarkOk or kSkinmarkErrorNoFaceDetected.
SKINMARK_API SkinmarkError skinmark_result_get_status(
    const SkinmarkResult* result);

/// Encoded PNG bytes of the annotated image. Owned by the result.
SKINMARK_API const uint8_t* skinmark_result_get_png_data(
    const SkinmarkResult* result);
SKINMARK_API size_t skinmark_result_get_png_size(const SkinmarkResult* result);

/// "data:image/png;base64,..." form of the PNG. Owned by the result.
SKINMARK_API const char* skinmark_result_get_data_uri(
    const SkinmarkResult* result);

SKINMARK_API int skinmark_result_get_width(const SkinmarkResult* result);
SKINMARK_API int skinmark_result_get_height(const SkinmarkResult* result);

/// Number of input issues (== number of legend entries).
SKINMARK_API int skinmark_result_get_issue_count(const SkinmarkResult* result);

/// Number of issues that produced on-image geometry.
SKINMARK_API int skinmark_result_get_rendered_count(
    const SkinmarkResult* result);

/// Copy the anchor coordinates actually used for issue `issue_index`.
/// @return Total number of points for that issue, or -1 on bad index.
SKINMARK_API int skinmark_result_get_points(const SkinmarkResult* result,
                                            int issue_index,
                                            SkinmarkPoint* out_points,
                                            int max_count);

/// Get legend entry `index` (0-based, issue-list order).
SKINMARK_API SkinmarkError skinmark_result_get_legend_entry(
    const SkinmarkResult* result, int index, SkinmarkLegendEntry* out_entry);

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

/// Get the library version as a string (e.g. "1.0.0").
SKINMARK_API const char* skinmark_version_string(void);

/// Get the major version number.
SKINMARK_API int skinmark_version_major(void);

/// Get the minor version number.
SKINMARK_API int skinmark_version_minor(void);

/// Get the patch version number.
SKINMARK_API int skinmark_version_patch(void);

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

/// Set the minimum log level. Messages below this level are discarded.
/// Default level is kSkinmarkLogInfo.
SKINMARK_API void skinmark_set_log_level(SkinmarkLogLevel level);

/// Set a user-defined log callback.
///
/// When a callback is registered, all log messages (at or above the current
/// level) are forwarded to the callback in addition to the default stderr
/// output.  Pass NULL as @p callback to unregister a previous callback.
///
/// @param callback  The callback function, or NULL to unregister.
/// @param userdata  Opaque pointer passed through to the callback.
SKINMARK_API void skinmark_set_log_callback(skinmark_log_callback_t callback,
                                            void* userdata);

/// Emit a log message at the given level through the skinmark logging
/// system.
///
/// @param level    Severity level.
/// @param message  Null-terminated UTF-8 string.
SKINMARK_API void skinmark_log(SkinmarkLogLevel level, const char* message);

#ifdef __cplusplus
}  // extern "C"
#endif

#endif  // SKINMARK_SKINMARK_H_
