#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "bubble/types.hpp"

namespace bubble {

namespace constants {

constexpr double kPi = 3.14159265358979323846;
constexpr double kTwoPi = 2.0 * kPi;

// Chamber is the unit square; y grows downward like the screen.
constexpr double kChamberWidth = 1.0;
constexpr double kChamberHeight = 1.0;

// Normalized curvature radius per unit of momentum for charged tracks.
constexpr double kRadiusPerMomentum = 0.03;

constexpr int kPionPairsPerCollision = 1;
constexpr double kNeutralPionProbability = 0.8;

constexpr double kLabelHitRadius_px = 30.0;
constexpr double kTrackHoverThreshold = 0.05;
constexpr double kHoverThrottle_ms = 16.0;

constexpr double kDefaultViewScale = 0.7;
constexpr double kMinViewScale = 0.5;
constexpr double kMaxViewScale = 3.0;
constexpr double kZoomFactor = 1.1;
constexpr double kPanStep_px = 20.0;

constexpr int kArcSegments = 64;
constexpr int kSpiralSegments = 100;
constexpr std::size_t kGrainPointCount = 480;
constexpr int kMinBackgroundSpirals = 5;
constexpr int kMaxBackgroundSpirals = 6;

}  // namespace constants

enum class Scenario : uint8_t {
    ProtonProton = 0,
    NeutronDecay = 1,
    MuonDecay = 2,
    PionDecay = 3,
    PhotonPairProduction = 4,
};

inline const char* ScenarioName(Scenario scenario) {
    switch (scenario) {
        case Scenario::ProtonProton:
            return "PROTON_PROTON";
        case Scenario::NeutronDecay:
            return "NEUTRON_DECAY";
        case Scenario::MuonDecay:
            return "MUON_DECAY";
        case Scenario::PionDecay:
            return "PION_DECAY";
        case Scenario::PhotonPairProduction:
            return "PHOTON_PAIR_PRODUCTION";
    }
    return "UNKNOWN";
}

inline bool ParseScenario(std::string_view text, Scenario* outScenario) {
    if (text == "pp" || text == "proton" || text == "PROTON_PROTON") {
        *outScenario = Scenario::ProtonProton;
        return true;
    }
    if (text == "neutron" || text == "NEUTRON_DECAY") {
        *outScenario = Scenario::NeutronDecay;
        return true;
    }
    if (text == "muon" || text == "MUON_DECAY") {
        *outScenario = Scenario::MuonDecay;
        return true;
    }
    if (text == "pion" || text == "PION_DECAY") {
        *outScenario = Scenario::PionDecay;
        return true;
    }
    if (text == "photon" || text == "PHOTON_PAIR_PRODUCTION") {
        *outScenario = Scenario::PhotonPairProduction;
        return true;
    }
    return false;
}

inline bool ParsePionCharge(std::string_view text, int* outCharge) {
    if (text == "-1" || text == "minus") {
        *outCharge = -1;
        return true;
    }
    if (text == "0" || text == "neutral") {
        *outCharge = 0;
        return true;
    }
    if (text == "1" || text == "+1" || text == "plus") {
        *outCharge = 1;
        return true;
    }
    return false;
}

struct GeneratorConfig {
    Scenario scenario = Scenario::ProtonProton;
    std::optional<uint32_t> seed;
    // Pion-decay scenario only; unset draws the charge uniformly.
    std::optional<int> pionCharge;
};

}  // namespace bubble
