#pragma once
#include <array>
#include <cstdint>
#include <string_view>

namespace tvremote::interfaces {

/// Backend wire protocols a device may speak.
enum class ProtocolTag : uint8_t {
    Mrp,
    Dmap,
    Companion,
    AirPlay,
    Raop
};

inline constexpr std::array<ProtocolTag, 5> kDefaultPriorities = {
    ProtocolTag::Mrp, ProtocolTag::Dmap, ProtocolTag::Companion,
    ProtocolTag::AirPlay, ProtocolTag::Raop};

inline constexpr std::array<ProtocolTag, 5> kPowerPriorities = {
    ProtocolTag::Companion, ProtocolTag::Mrp, ProtocolTag::Dmap,
    ProtocolTag::AirPlay, ProtocolTag::Raop};

inline constexpr std::string_view ToString(const ProtocolTag tag) {
    switch (tag) {
        case ProtocolTag::Mrp: return "MRP";
        case ProtocolTag::Dmap: return "DMAP";
        case ProtocolTag::Companion: return "Companion";
        case ProtocolTag::AirPlay: return "AirPlay";
        case ProtocolTag::Raop: return "RAOP";
    }
    return "Unknown";
}

}  // namespace tvremote::interfaces
