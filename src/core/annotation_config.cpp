// Copyright 2026 The skinmark Authors

#include "core/annotation_config.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <sstream>
#include <unordered_map>
#include <utility>

#include "core/logger.h"

namespace skinmark {
namespace internal {

namespace {

bool ParseDouble(const std::string& text, double* out) {
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  double v = std::strtod(text.c_str(), &end);
  if (errno != 0 || end == text.c_str() || *end != '\0') return false;
  *out = v;
  return true;
}

bool ParseInt(const std::string& text, int* out) {
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long v = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') return false;
  if (v < -1000000 || v > 1000000) return false;
  *out = static_cast<int>(v);
  return true;
}

std::string Trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return std::string();
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::string FormatDouble(double v) {
  std::ostringstream os;
  os << v;
  return os.str();
}

struct Field {
  std::function<bool(AnnotationConfig*, const std::string&)> set;
  std::function<std::string(const AnnotationConfig&)> get;
};

// Double field constrained to [lo, hi].
template <typename T>
Field RealField(T AnnotationConfig::*member, double lo, double hi) {
  Field f;
  f.set = [member, lo, hi](AnnotationConfig* c, const std::string& text) {
    double v = 0.0;
    if (!ParseDouble(text, &v) || v < lo || v > hi) return false;
    c->*member = static_cast<T>(v);
    return true;
  };
  f.get = [member](const AnnotationConfig& c) {
    return FormatDouble(static_cast<double>(c.*member));
  };
  return f;
}

Field IntField(int AnnotationConfig::*member, int lo, int hi) {
  Field f;
  f.set = [member, lo, hi](AnnotationConfig* c, const std::string& text) {
    int v = 0;
    if (!ParseInt(text, &v) || v < lo || v > hi) return false;
    c->*member = v;
    return true;
  };
  f.get = [member](const AnnotationConfig& c) {
    return std::to_string(c.*member);
  };
  return f;
}

Field BoolField(bool AnnotationConfig::*member) {
  Field f;
  f.set = [member](AnnotationConfig* c, const std::string& text) {
    if (text == "1" || text == "true" || text == "yes" || text == "on") {
      c->*member = true;
      return true;
    }
    if (text == "0" || text == "false" || text == "no" || text == "off") {
      c->*member = false;
      return true;
    }
    return false;
  };
  f.get = [member](const AnnotationConfig& c) {
    return std::string(c.*member ? "1" : "0");
  };
  return f;
}

Field StringField(std::string AnnotationConfig::*member) {
  Field f;
  f.set = [member](AnnotationConfig* c, const std::string& text) {
    if (text.empty()) return false;
    c->*member = text;
    return true;
  };
  f.get = [member](const AnnotationConfig& c) { return c.*member; };
  return f;
}

const std::unordered_map<std::string, Field>& Fields() {
  static const std::unordered_map<std::string, Field> kFields = {
      {"overlay_alpha", RealField(&AnnotationConfig::overlay_alpha, 0.0, 1.0)},
      {"stroke_width", RealField(&AnnotationConfig::stroke_width, 0.1, 50.0)},
      {"scatter_dot_radius",
       RealField(&AnnotationConfig::scatter_dot_radius, 0.5, 50.0)},
      {"draw_issue_markers", BoolField(&AnnotationConfig::draw_issue_markers)},
      {"closed_resample_count",
       IntField(&AnnotationConfig::closed_resample_count, 8, 2000)},
      {"open_resample_count",
       IntField(&AnnotationConfig::open_resample_count, 8, 2000)},
      {"contour_smoothing",
       RealField(&AnnotationConfig::contour_smoothing, 0.0, 1000.0)},
      {"line_smoothing",
       RealField(&AnnotationConfig::line_smoothing, 0.0, 1000.0)},
      {"crescent_smoothing",
       RealField(&AnnotationConfig::crescent_smoothing, 0.0, 1000.0)},
      {"crescent_lift_fraction",
       RealField(&AnnotationConfig::crescent_lift_fraction, 0.0, 0.5)},
      {"crescent_depth_fraction",
       RealField(&AnnotationConfig::crescent_depth_fraction, 0.0, 0.5)},
      {"scatter_count_mild",
       IntField(&AnnotationConfig::scatter_count_mild, 0, 10000)},
      {"scatter_count_moderate",
       IntField(&AnnotationConfig::scatter_count_moderate, 0, 10000)},
      {"scatter_count_severe",
       IntField(&AnnotationConfig::scatter_count_severe, 0, 10000)},
      {"scatter_count_critical",
       IntField(&AnnotationConfig::scatter_count_critical, 0, 10000)},
      {"scatter_attempt_factor",
       IntField(&AnnotationConfig::scatter_attempt_factor, 1, 1000)},
      {"legend_max_rows", IntField(&AnnotationConfig::legend_max_rows, 1, 100)},
      {"legend_max_label_chars",
       IntField(&AnnotationConfig::legend_max_label_chars, 4, 250)},
      {"legend_font", StringField(&AnnotationConfig::legend_font)},
      {"legend_font_size",
       IntField(&AnnotationConfig::legend_font_size, 4, 200)},
  };
  return kFields;
}

}  // namespace

int AnnotationConfig::ScatterCount(SkinmarkSeverity severity) const {
  switch (severity) {
    case kSkinmarkSeverityMild:     return scatter_count_mild;
    case kSkinmarkSeverityModerate: return scatter_count_moderate;
    case kSkinmarkSeveritySevere:   return scatter_count_severe;
    case kSkinmarkSeverityCritical: return scatter_count_critical;
    default:                        return scatter_count_moderate;
  }
}

SkinmarkError AnnotationConfig::Set(const std::string& key,
                                    const std::string& value) {
  const auto& fields = Fields();
  auto it = fields.find(key);
  if (it == fields.end()) return kSkinmarkErrorInvalidParam;

  AnnotationConfig candidate = *this;
  if (!it->second.set(&candidate, Trim(value))) {
    return kSkinmarkErrorConfigFailed;
  }
  *this = std::move(candidate);
  return kSkinmarkOk;
}

bool AnnotationConfig::Get(const std::string& key,
                           std::string* out_value) const {
  const auto& fields = Fields();
  auto it = fields.find(key);
  if (it == fields.end() || !out_value) return false;
  *out_value = it->second.get(*this);
  return true;
}

SkinmarkError LoadAnnotationConfig(const std::string& path,
                                   AnnotationConfig* config,
                                   std::string* error_message) {
  if (!config) return kSkinmarkErrorInvalidParam;

  std::ifstream f(path);
  if (!f) {
    if (error_message) *error_message = "Cannot open config file: " + path;
    return kSkinmarkErrorConfigFailed;
  }

  AnnotationConfig loaded = *config;
  std::string line;
  int line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == '[') continue;

    auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      if (error_message) {
        *error_message = path + ":" + std::to_string(line_no) +
                         ": expected key=value";
      }
      return kSkinmarkErrorConfigFailed;
    }
    std::string key = Trim(trimmed.substr(0, eq));
    std::string val = Trim(trimmed.substr(eq + 1));

    SkinmarkError err = loaded.Set(key, val);
    if (err == kSkinmarkErrorInvalidParam) {
      SKINMARK_LOG_WARN("{}:{}: unknown config key '{}' ignored", path,
                        line_no, key);
      continue;
    }
    if (err != kSkinmarkOk) {
      if (error_message) {
        *error_message = path + ":" + std::to_string(line_no) +
                         ": invalid value '" + val + "' for " + key;
      }
      return kSkinmarkErrorConfigFailed;
    }
  }

  *config = std::move(loaded);
  SKINMARK_LOG_DEBUG("Loaded annotation config from {}", path);
  return kSkinmarkOk;
}

}  // namespace internal
}  // namespace skinmark
