#include "tvremote/interfaces/features.hpp"
#include <format>
#include <set>

namespace tvremote::interfaces {

    Result<Unit, RemoteFailure> ValidateFeatureTable(std::span<const FeatureEntry> table) {
        std::set<uint16_t> seen;
        for (const auto& entry : table) {
            if (!seen.insert(entry.Index()).second) {
                return Result<Unit, RemoteFailure>::Err(
                    RemoteFailure::InvalidInput(
                        std::format("Feature index {} ({}) is defined twice", entry.Index(), entry.label)));
            }
        }
        return Result<Unit, RemoteFailure>::Ok(unit);
    }

    const FeatureEntry* FindFeature(const FeatureName name) {
        for (const auto& entry : kFeatureTable) {
            if (entry.name == name) {
                return &entry;
            }
        }
        return nullptr;
    }

    std::string_view ToString(const FeatureState state) {
        switch (state) {
            case FeatureState::Unknown: return "Unknown";
            case FeatureState::Unsupported: return "Unsupported";
            case FeatureState::Unavailable: return "Unavailable";
            case FeatureState::Available: return "Available";
        }
        return "Unknown";
    }

}
