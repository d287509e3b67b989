// Repository: Z-Play-supply
// Component: Media Kind
// Purpose: Extension-based classification of candidate files.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_SCAN_MEDIA_KIND_HPP_
#define ZPLAY_SCAN_MEDIA_KIND_HPP_

#include <filesystem>
#include <optional>
#include <string>

namespace zplay::scan {

enum class MediaKind {
  kVideo,
  kImage,
  kAudio,
};

const char* MediaKindToString(MediaKind kind);

// Inverse of MediaKindToString ("video", "image", "audio").
std::optional<MediaKind> ParseMediaKind(const std::string& name);

// Case-insensitive lookup of a bare extension ("mp4", "JPG"). No leading dot.
std::optional<MediaKind> MediaKindFromExtension(const std::string& extension);

// Classifies by the path's extension. Paths without a known extension have no kind.
std::optional<MediaKind> ClassifyPath(const std::filesystem::path& path);

// True if `path` equals `root` or lies beneath it (component-wise prefix).
bool PathIsUnder(const std::filesystem::path& path, const std::filesystem::path& root);

}  // namespace zplay::scan

#endif  // ZPLAY_SCAN_MEDIA_KIND_HPP_
