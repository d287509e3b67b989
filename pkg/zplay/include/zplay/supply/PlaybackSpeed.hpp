// Repository: Z-Play-supply
// Component: Playback Speed
// Purpose: Discrete playback rates offered to the front.
// Copyright (c) 2025 Z-Play

#ifndef ZPLAY_SUPPLY_PLAYBACK_SPEED_HPP_
#define ZPLAY_SUPPLY_PLAYBACK_SPEED_HPP_

#include <array>
#include <optional>
#include <string>

namespace zplay::supply {

enum class PlaybackSpeed {
  kX0_5,
  kX1,
  kX2,
  kX4,
  kX8,
  kX16,
  kX32,
};

inline constexpr std::array<PlaybackSpeed, 7> kAllPlaybackSpeeds = {
    PlaybackSpeed::kX0_5, PlaybackSpeed::kX1,  PlaybackSpeed::kX2, PlaybackSpeed::kX4,
    PlaybackSpeed::kX8,   PlaybackSpeed::kX16, PlaybackSpeed::kX32,
};

// "x0.5", "x1", ... "x32".
const char* PlaybackSpeedName(PlaybackSpeed speed);

double PlaybackSpeedRate(PlaybackSpeed speed);

std::optional<PlaybackSpeed> ParsePlaybackSpeed(const std::string& name);

}  // namespace zplay::supply

#endif  // ZPLAY_SUPPLY_PLAYBACK_SPEED_HPP_
