// Copyright 2026 The skinmark Authors
//
// skinmark_annotate -- annotate a face photo with skin issues.
//
//   skinmark_annotate --image face.png --anchors anchors.txt
//                     --issue dark_circles:left_eye:moderate
//                     [--issue ...] [--config skinmark.ini]
//                     [--out annotated.png] [--data-uri]
//
// The anchors file holds one "x y" pixel pair per line, indexed by dense
// face-mesh anchor. An empty anchors file means the detector found no face.
//
// Exit status: 0 annotated, 2 no face detected, 1 error.

#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "skinmark/skinmark.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitNoFace = 2;

struct Options {
  std::string image_path;
  std::string anchors_path;
  std::string config_path;
  std::string out_path = "annotated.png";
  std::vector<std::string> issues;
  bool data_uri = false;
};

void PrintUsage(const char* argv0) {
  std::fprintf(stderr,
               "Usage: %s --image FILE --anchors FILE "
               "--issue TYPE:REGION:SEVERITY [--issue ...]\n"
               "          [--config FILE] [--out FILE] [--data-uri]\n",
               argv0);
}

bool ParseArgs(int argc, char** argv, Options* opts) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    bool has_value = i + 1 < argc;
    if (std::strcmp(arg, "--image") == 0 && has_value) {
      opts->image_path = argv[++i];
    } else if (std::strcmp(arg, "--anchors") == 0 && has_value) {
      opts->anchors_path = argv[++i];
    } else if (std::strcmp(arg, "--issue") == 0 && has_value) {
      opts->issues.push_back(argv[++i]);
    } else if (std::strcmp(arg, "--config") == 0 && has_value) {
      opts->config_path = argv[++i];
    } else if (std::strcmp(arg, "--out") == 0 && has_value) {
      opts->out_path = argv[++i];
    } else if (std::strcmp(arg, "--data-uri") == 0) {
      opts->data_uri = true;
    } else {
      std::fprintf(stderr, "Unknown or incomplete argument: %s\n", arg);
      return false;
    }
  }
  return !opts->image_path.empty() && !opts->anchors_path.empty();
}

bool ReadFile(const std::string& path, std::vector<uint8_t>* out) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  out->assign(std::istreambuf_iterator<char>(f),
              std::istreambuf_iterator<char>());
  return true;
}

bool ReadAnchors(const std::string& path, std::vector<SkinmarkPoint>* out) {
  std::ifstream f(path);
  if (!f) return false;
  std::string line;
  while (std::getline(f, line)) {
    if (line.empty() || line[0] == '#') continue;
    std::istringstream ss(line);
    SkinmarkPoint p = {};
    if (!(ss >> p.x >> p.y)) return false;
    out->push_back(p);
  }
  return true;
}

// "type:region:severity"
bool ParseIssue(const std::string& text, skinmark::Issue* out) {
  size_t a = text.find(':');
  size_t b = a == std::string::npos ? a : text.find(':', a + 1);
  if (b == std::string::npos) return false;
  out->type = text.substr(0, a);
  out->region = text.substr(a + 1, b - a - 1);
  std::string severity = text.substr(b + 1);
  return !out->type.empty() && !out->region.empty() &&
         skinmark_severity_from_string(severity.c_str(), &out->severity) ==
             kSkinmarkOk;
}

}  // namespace

int main(int argc, char** argv) {
  Options opts;
  if (!ParseArgs(argc, argv, &opts)) {
    PrintUsage(argv[0]);
    return kExitError;
  }

  std::vector<skinmark::Issue> issues;
  for (const auto& text : opts.issues) {
    skinmark::Issue issue;
    if (!ParseIssue(text, &issue)) {
      std::fprintf(stderr, "Bad --issue '%s' (want type:region:severity)\n",
                   text.c_str());
      return kExitError;
    }
    issues.push_back(issue);
  }

  std::vector<uint8_t> image_bytes;
  if (!ReadFile(opts.image_path, &image_bytes)) {
    std::fprintf(stderr, "Cannot read image %s\n", opts.image_path.c_str());
    return kExitError;
  }
  std::vector<SkinmarkPoint> anchors;
  if (!ReadAnchors(opts.anchors_path, &anchors)) {
    std::fprintf(stderr, "Cannot parse anchors %s\n",
                 opts.anchors_path.c_str());
    return kExitError;
  }

  try {
    skinmark::Context ctx;
    if (!opts.config_path.empty()) ctx.LoadConfig(opts.config_path);

    auto image = ctx.DecodeImage(image_bytes.data(), image_bytes.size());
    auto frame = anchors.empty() ? ctx.CreateNoFaceFrame()
                                 : ctx.CreateAnchorFrame(anchors);
    auto result = ctx.Annotate(image, frame, issues);

    if (opts.data_uri) {
      std::printf("%s\n", result.data_uri().c_str());
    } else {
      std::ofstream out(opts.out_path, std::ios::binary);
      out.write(reinterpret_cast<const char*>(result.png_data()),
                static_cast<std::streamsize>(result.png_size()));
      if (!out) {
        std::fprintf(stderr, "Cannot write %s\n", opts.out_path.c_str());
        return kExitError;
      }
    }

    for (int i = 0; i < result.issue_count(); ++i) {
      SkinmarkLegendEntry entry = result.legend_entry(i);
      std::fprintf(stderr, "%d. %s (%s)%s\n", entry.index, entry.label,
                   skinmark::to_string(entry.severity),
                   entry.rendered ? "" : " [not drawn]");
    }

    if (result.no_face()) {
      std::fprintf(stderr, "No face detected; image left unannotated\n");
      return kExitNoFace;
    }
    return kExitOk;
  } catch (const skinmark::Error& e) {
    std::fprintf(stderr, "skinmark error %d: %s\n",
                 static_cast<int>(e.code()), e.what());
    return kExitError;
  }
}
