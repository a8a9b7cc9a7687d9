#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "bubble/random_source.hpp"
#include "bubble/track.hpp"

namespace bubble {

enum class ParticleRole : uint8_t {
    Track = 0,
    Muon = 1,
    Lepton = 2,
    PionNeutrino = 3,
    ElectronNeutrino = 4,
    MuonNeutrino = 5,
    BetaNeutrino = 6,
};

// Locates one particle inside an event: a top-level track, or a particle
// nested in the decay product at productIndex of that track.
struct ParticleAddress {
    std::size_t trackIndex = 0;
    ParticleRole role = ParticleRole::Track;
    std::size_t productIndex = 0;

    bool operator==(const ParticleAddress& rhs) const {
        return trackIndex == rhs.trackIndex && role == rhs.role && productIndex == rhs.productIndex;
    }
    bool operator!=(const ParticleAddress& rhs) const { return !(*this == rhs); }
};

inline bool IsNeutrinoRole(ParticleRole role) {
    return role == ParticleRole::PionNeutrino || role == ParticleRole::ElectronNeutrino ||
           role == ParticleRole::MuonNeutrino || role == ParticleRole::BetaNeutrino;
}

struct ParticleCounts {
    int identifiable = 0;
    int neutrinos = 0;
};

ParticleCounts CountParticles(const std::vector<Track>& tracks);

// Identifiable particles in generation order: top-level tracks first, then the
// nested particles of each track (a muon before its own lepton).
std::vector<ParticleAddress> EnumerateIdentifiable(const std::vector<Track>& tracks);
std::vector<ParticleAddress> EnumerateNeutrinos(const std::vector<Track>& tracks);

// Species stored at the address, or nullopt when the address does not resolve.
std::optional<ParticleSpecies> SpeciesAt(const std::vector<Track>& tracks, const ParticleAddress& address);

struct NumberedParticle {
    int naturalIndex = 0;
    int displayIndex = 0;
    ParticleAddress address;
    ParticleSpecies species = ParticleSpecies::Proton;
};

// Immutable per-event numbering. Indices are 1-based; slot 0 of both maps is
// unused.
class Numbering {
public:
    Numbering() = default;
    Numbering(std::vector<NumberedParticle> particles, std::vector<int> naturalToDisplay, int neutrinoCount);

    int Total() const { return static_cast<int>(particles_.size()); }
    int NeutrinoCount() const { return neutrinoCount_; }

    int DisplayForNatural(int naturalIndex) const;
    int NaturalForDisplay(int displayIndex) const;

    const std::vector<NumberedParticle>& Particles() const { return particles_; }
    const NumberedParticle* ByDisplayIndex(int displayIndex) const;
    std::optional<int> DisplayIndexOf(const ParticleAddress& address) const;
    const char* SymbolForDisplayIndex(int displayIndex) const;

    // Smallest display index whose true identity is an electron or positron.
    std::optional<int> FormHintDisplayIndex() const;

private:
    std::vector<NumberedParticle> particles_;
    std::vector<int> naturalToDisplay_;
    std::vector<int> displayToNatural_;
    int neutrinoCount_ = 0;
};

// Fisher-Yates over display positions 2..N; position 1 stays pinned to the
// incoming particle.
Numbering BuildNumbering(const std::vector<Track>& tracks, IRandomSource& rng);

}  // namespace bubble
