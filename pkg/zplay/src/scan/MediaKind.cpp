// Repository: Z-Play-supply
// Component: Media Kind
// Purpose: Extension-based classification of candidate files.
// Copyright (c) 2025 Z-Play

#include "zplay/scan/MediaKind.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace zplay::scan {

const char* MediaKindToString(MediaKind kind) {
  switch (kind) {
    case MediaKind::kVideo: return "video";
    case MediaKind::kImage: return "image";
    case MediaKind::kAudio: return "audio";
  }
  return "unknown";
}

std::optional<MediaKind> ParseMediaKind(const std::string& name) {
  for (MediaKind kind : {MediaKind::kVideo, MediaKind::kImage, MediaKind::kAudio}) {
    if (name == MediaKindToString(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

std::optional<MediaKind> MediaKindFromExtension(const std::string& extension) {
  std::string ext = extension;
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (ext == "jpg" || ext == "jpeg" || ext == "png" || ext == "gif" ||
      ext == "bmp" || ext == "webp" || ext == "svg" || ext == "tiff") {
    return MediaKind::kImage;
  }
  if (ext == "mp4" || ext == "mkv" || ext == "webm" || ext == "avi" ||
      ext == "mov" || ext == "wmv" || ext == "flv" || ext == "mpeg") {
    return MediaKind::kVideo;
  }
  if (ext == "mp3" || ext == "wav" || ext == "ogg" || ext == "m4a" ||
      ext == "flac" || ext == "aac") {
    return MediaKind::kAudio;
  }
  return std::nullopt;
}

std::optional<MediaKind> ClassifyPath(const std::filesystem::path& path) {
  std::string ext = path.extension().string();
  if (ext.size() < 2) {
    return std::nullopt;
  }
  return MediaKindFromExtension(ext.substr(1));
}

bool PathIsUnder(const std::filesystem::path& path, const std::filesystem::path& root) {
  auto root_it = root.begin();
  auto path_it = path.begin();
  for (; root_it != root.end(); ++root_it, ++path_it) {
    // A trailing separator shows up as an empty final component.
    if (root_it->empty() && std::next(root_it) == root.end()) {
      break;
    }
    if (path_it == path.end() || *path_it != *root_it) {
      return false;
    }
  }
  return true;
}

}  // namespace zplay::scan
