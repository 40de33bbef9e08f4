#pragma once
#include "tvremote/core/failures.hpp"
#include "tvremote/core/result.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>

namespace tvremote::interfaces {

enum class FeatureName : uint16_t {
    Up = 0,
    Down = 1,
    Left = 2,
    Right = 3,
    Play = 4,
    PlayPause = 5,
    Pause = 6,
    Stop = 7,
    Next = 8,
    Previous = 9,
    Select = 10,
    Menu = 11,
    VolumeUp = 12,
    VolumeDown = 13,
    Home = 14,
    HomeHold = 15,
    TopMenu = 16,
    Suspend = 17,
    WakeUp = 18,
    SetPosition = 19,
    SetShuffle = 20,
    SetRepeat = 21,
    Title = 22,
    Artist = 23,
    Album = 24,
    Genre = 25,
    TotalTime = 26,
    Position = 27,
    Shuffle = 28,
    Repeat = 29,
    PowerState = 32,
    TurnOn = 33,
    TurnOff = 34,
    SkipForward = 36,
    SkipBackward = 37,
    PushUpdates = 43,
    Volume = 45,
    SetVolume = 46
};

enum class FeatureState : uint8_t {
    Unknown,
    Unsupported,
    Unavailable,
    Available
};

struct FeatureInfo {
    FeatureState state = FeatureState::Unsupported;
    std::map<std::string, std::string> options{};
};

struct FeatureEntry {
    FeatureName name;
    std::string_view label;
    std::string_view description;

    [[nodiscard]] constexpr uint16_t Index() const noexcept {
        return static_cast<uint16_t>(name);
    }
};

inline constexpr std::array kFeatureTable = {
    FeatureEntry{FeatureName::Up, "up", "Up button on remote."},
    FeatureEntry{FeatureName::Down, "down", "Down button on remote."},
    FeatureEntry{FeatureName::Left, "left", "Left button on remote."},
    FeatureEntry{FeatureName::Right, "right", "Right button on remote."},
    FeatureEntry{FeatureName::Play, "play", "Start playback."},
    FeatureEntry{FeatureName::PlayPause, "play_pause", "Toggle between play/pause."},
    FeatureEntry{FeatureName::Pause, "pause", "Pause playback."},
    FeatureEntry{FeatureName::Stop, "stop", "Stop playback."},
    FeatureEntry{FeatureName::Next, "next", "Next item."},
    FeatureEntry{FeatureName::Previous, "previous", "Previous item."},
    FeatureEntry{FeatureName::Select, "select", "Select current option."},
    FeatureEntry{FeatureName::Menu, "menu", "Go back to previous menu."},
    FeatureEntry{FeatureName::VolumeUp, "volume_up", "Increase volume."},
    FeatureEntry{FeatureName::VolumeDown, "volume_down", "Decrease volume."},
    FeatureEntry{FeatureName::Home, "home", "Home/TV button."},
    FeatureEntry{FeatureName::HomeHold, "home_hold", "Long-press home button."},
    FeatureEntry{FeatureName::TopMenu, "top_menu", "Go to main menu."},
    FeatureEntry{FeatureName::Suspend, "suspend", "Suspend device."},
    FeatureEntry{FeatureName::WakeUp, "wakeup", "Wake up device."},
    FeatureEntry{FeatureName::SetPosition, "set_position", "Seek to position."},
    FeatureEntry{FeatureName::SetShuffle, "set_shuffle", "Change shuffle state."},
    FeatureEntry{FeatureName::SetRepeat, "set_repeat", "Change repeat state."},
    FeatureEntry{FeatureName::Title, "title", "Title of playing media."},
    FeatureEntry{FeatureName::Artist, "artist", "Artist of playing song."},
    FeatureEntry{FeatureName::Album, "album", "Album from playing artist."},
    FeatureEntry{FeatureName::Genre, "genre", "Genre of playing song."},
    FeatureEntry{FeatureName::TotalTime, "total_time", "Total length of playing media (seconds)."},
    FeatureEntry{FeatureName::Position, "position", "Current play time position."},
    FeatureEntry{FeatureName::Shuffle, "shuffle", "Shuffle state."},
    FeatureEntry{FeatureName::Repeat, "repeat", "Repeat state."},
    FeatureEntry{FeatureName::PowerState, "power_state", "Current device power state."},
    FeatureEntry{FeatureName::TurnOn, "turn_on", "Turn device on."},
    FeatureEntry{FeatureName::TurnOff, "turn_off", "Turn off device."},
    FeatureEntry{FeatureName::SkipForward, "skip_forward", "Skip forward a time interval."},
    FeatureEntry{FeatureName::SkipBackward, "skip_backward", "Skip backwards a time interval."},
    FeatureEntry{FeatureName::PushUpdates, "push_updates", "Push updates are supported."},
    FeatureEntry{FeatureName::Volume, "volume", "Current volume level."},
    FeatureEntry{FeatureName::SetVolume, "set_volume", "Set volume level."},
};

[[nodiscard]] constexpr bool HasUniqueIndices(std::span<const FeatureEntry> table) {
    for (size_t i = 0; i < table.size(); ++i) {
        for (size_t j = i + 1; j < table.size(); ++j) {
            if (table[i].Index() == table[j].Index()) {
                return false;
            }
        }
    }
    return true;
}

static_assert(HasUniqueIndices(kFeatureTable), "Feature table contains duplicate indices");

/// Runtime form of the duplicate check for tables assembled elsewhere.
[[nodiscard]] Result<Unit, RemoteFailure> ValidateFeatureTable(std::span<const FeatureEntry> table);

[[nodiscard]] const FeatureEntry* FindFeature(FeatureName name);

[[nodiscard]] std::string_view ToString(FeatureState state);

}  // namespace tvremote::interfaces
