#include <catch2/catch_test_macros.hpp>
#include "tvremote/interfaces/features.hpp"
#include <array>
#include <set>
using namespace tvremote;
using namespace tvremote::interfaces;

TEST_CASE("Features - Feature table", "[features]") {
    SECTION("Built-in table is valid") {
        REQUIRE(ValidateFeatureTable(kFeatureTable).IsOk());
        REQUIRE(HasUniqueIndices(kFeatureTable));
    }
    SECTION("Labels are unique") {
        std::set<std::string_view> labels;
        for (const auto& entry : kFeatureTable) {
            REQUIRE(labels.insert(entry.label).second);
        }
    }
    SECTION("Indices keep their wire values") {
        REQUIRE(FindFeature(FeatureName::Up)->Index() == 0);
        REQUIRE(FindFeature(FeatureName::PowerState)->Index() == 32);
        REQUIRE(FindFeature(FeatureName::PushUpdates)->Index() == 43);
        REQUIRE(FindFeature(FeatureName::SetVolume)->Index() == 46);
    }
    SECTION("Lookup by name") {
        const auto* entry = FindFeature(FeatureName::PlayPause);
        REQUIRE(entry != nullptr);
        REQUIRE(entry->label == "play_pause");
        REQUIRE_FALSE(entry->description.empty());
    }
}

TEST_CASE("Features - Duplicate detection", "[features]") {
    const std::array table = {
        FeatureEntry{FeatureName::Up, "up", "Up."},
        FeatureEntry{FeatureName::Down, "down", "Down."},
        FeatureEntry{FeatureName::Up, "up_again", "Up again."},
    };
    REQUIRE_FALSE(HasUniqueIndices(table));

    auto result = ValidateFeatureTable(table);
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().Is(RemoteFailureType::InvalidInput));
    REQUIRE(result.UnwrapErr().message.find("up_again") != std::string::npos);

    REQUIRE(ValidateFeatureTable(std::span<const FeatureEntry>{}).IsOk());
}

TEST_CASE("Features - State names", "[features]") {
    REQUIRE(ToString(FeatureState::Available) == "Available");
    REQUIRE(ToString(FeatureState::Unavailable) == "Unavailable");
    REQUIRE(ToString(FeatureState::Unsupported) == "Unsupported");
    REQUIRE(ToString(FeatureState::Unknown) == "Unknown");

    const FeatureInfo info;
    REQUIRE(info.state == FeatureState::Unsupported);
    REQUIRE(info.options.empty());
}
