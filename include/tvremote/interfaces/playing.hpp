#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tvremote::interfaces {

enum class DeviceState : uint8_t {
    Idle,
    Loading,
    Paused,
    Playing,
    Stopped,
    Seeking
};

enum class RepeatState : uint8_t {
    Off,
    Track,
    All
};

enum class ShuffleState : uint8_t {
    Off,
    Albums,
    Songs
};

enum class PowerState : uint8_t {
    Unknown,
    Off,
    On
};

enum class InputAction : uint8_t {
    SingleTap,
    DoubleTap,
    Hold
};

/// Snapshot of what the device is currently playing.
struct PlayingInfo {
    DeviceState device_state = DeviceState::Idle;
    std::optional<std::string> title;
    std::optional<std::string> artist;
    std::optional<std::string> album;
    std::optional<std::string> genre;
    std::optional<uint32_t> total_time;
    std::optional<uint32_t> position;
    std::optional<ShuffleState> shuffle;
    std::optional<RepeatState> repeat;

    bool operator==(const PlayingInfo&) const = default;
};

std::string_view ToString(DeviceState state);
std::string_view ToString(PowerState state);

}  // namespace tvremote::interfaces
