// Repository: Z-Play-supply
// Component: Playback Speed
// Purpose: Discrete playback rates offered to the front.
// Copyright (c) 2025 Z-Play

#include "zplay/supply/PlaybackSpeed.hpp"

namespace zplay::supply {

const char* PlaybackSpeedName(PlaybackSpeed speed) {
  switch (speed) {
    case PlaybackSpeed::kX0_5: return "x0.5";
    case PlaybackSpeed::kX1: return "x1";
    case PlaybackSpeed::kX2: return "x2";
    case PlaybackSpeed::kX4: return "x4";
    case PlaybackSpeed::kX8: return "x8";
    case PlaybackSpeed::kX16: return "x16";
    case PlaybackSpeed::kX32: return "x32";
  }
  return "x1";
}

double PlaybackSpeedRate(PlaybackSpeed speed) {
  switch (speed) {
    case PlaybackSpeed::kX0_5: return 0.5;
    case PlaybackSpeed::kX1: return 1.0;
    case PlaybackSpeed::kX2: return 2.0;
    case PlaybackSpeed::kX4: return 4.0;
    case PlaybackSpeed::kX8: return 8.0;
    case PlaybackSpeed::kX16: return 16.0;
    case PlaybackSpeed::kX32: return 32.0;
  }
  return 1.0;
}

std::optional<PlaybackSpeed> ParsePlaybackSpeed(const std::string& name) {
  for (PlaybackSpeed speed : kAllPlaybackSpeeds) {
    if (name == PlaybackSpeedName(speed)) {
      return speed;
    }
  }
  return std::nullopt;
}

}  // namespace zplay::supply
