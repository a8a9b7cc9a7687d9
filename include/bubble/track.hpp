#pragma once

#include <cstddef>
#include <optional>
#include <variant>
#include <vector>

#include "bubble/geometry.hpp"
#include "bubble/kinematics.hpp"
#include "bubble/particle_catalog.hpp"

namespace bubble {

// Neutrinos leave no track; they are drawn as rays from the vertex to the
// chamber edge once identities are revealed.
struct NeutrinoRay {
    ParticleSpecies species = ParticleSpecies::MuonNeutrino;
    Momentum momentum;
};

struct LeptonSpiral {
    ParticleSpecies species = ParticleSpecies::Electron;
    double momentum = 0.0;
    TrackShape shape;

    int Charge() const { return ChargeOf(species); }
};

struct MuonDecay {
    LeptonSpiral lepton;
    NeutrinoRay electronNeutrino;
    NeutrinoRay muonNeutrino;
};

struct MuonArc {
    ParticleSpecies species = ParticleSpecies::MuonMinus;
    double momentum = 0.0;
    TrackShape shape;
    Vec2 decayPoint;
    MuonDecay decay;

    int Charge() const { return ChargeOf(species); }
};

struct PionDecay {
    MuonArc muon;
    NeutrinoRay neutrino;
};

struct BetaDecay {
    NeutrinoRay antineutrino;
};

using DecayProduct = std::variant<PionDecay, MuonDecay, BetaDecay>;

struct Track {
    ParticleSpecies species = ParticleSpecies::Proton;
    double momentum = 0.0;
    TrackShape shape;
    std::optional<Vec2> decayPoint;
    std::vector<DecayProduct> decayProducts;
    // Top-level track whose vertex produced this one.
    std::optional<std::size_t> parentIndex;

    int Charge() const { return ChargeOf(species); }
    bool IsNeutral() const { return Charge() == 0; }

    Momentum MomentumAt(double t) const { return Momentum{momentum, TangentAt(shape, t)}; }
};

}  // namespace bubble
