#include "bubble/numbering.hpp"

#include <numeric>
#include <utility>

namespace bubble {
namespace {

const NeutrinoRay* NeutrinoAt(const DecayProduct& product, ParticleRole role) {
    if (const auto* pion = std::get_if<PionDecay>(&product)) {
        switch (role) {
            case ParticleRole::PionNeutrino:
                return &pion->neutrino;
            case ParticleRole::ElectronNeutrino:
                return &pion->muon.decay.electronNeutrino;
            case ParticleRole::MuonNeutrino:
                return &pion->muon.decay.muonNeutrino;
            default:
                return nullptr;
        }
    }
    if (const auto* muon = std::get_if<MuonDecay>(&product)) {
        switch (role) {
            case ParticleRole::ElectronNeutrino:
                return &muon->electronNeutrino;
            case ParticleRole::MuonNeutrino:
                return &muon->muonNeutrino;
            default:
                return nullptr;
        }
    }
    if (const auto* beta = std::get_if<BetaDecay>(&product)) {
        return (role == ParticleRole::BetaNeutrino) ? &beta->antineutrino : nullptr;
    }
    return nullptr;
}

}  // namespace

ParticleCounts CountParticles(const std::vector<Track>& tracks) {
    ParticleCounts counts;
    counts.identifiable = static_cast<int>(EnumerateIdentifiable(tracks).size());
    counts.neutrinos = static_cast<int>(EnumerateNeutrinos(tracks).size());
    return counts;
}

std::vector<ParticleAddress> EnumerateIdentifiable(const std::vector<Track>& tracks) {
    std::vector<ParticleAddress> addresses;
    for (std::size_t i = 0; i < tracks.size(); ++i) {
        addresses.push_back(ParticleAddress{i, ParticleRole::Track, 0});
    }
    for (std::size_t i = 0; i < tracks.size(); ++i) {
        const std::vector<DecayProduct>& products = tracks[i].decayProducts;
        for (std::size_t j = 0; j < products.size(); ++j) {
            if (std::holds_alternative<PionDecay>(products[j])) {
                addresses.push_back(ParticleAddress{i, ParticleRole::Muon, j});
                addresses.push_back(ParticleAddress{i, ParticleRole::Lepton, j});
            } else if (std::holds_alternative<MuonDecay>(products[j])) {
                addresses.push_back(ParticleAddress{i, ParticleRole::Lepton, j});
            }
        }
    }
    return addresses;
}

std::vector<ParticleAddress> EnumerateNeutrinos(const std::vector<Track>& tracks) {
    std::vector<ParticleAddress> addresses;
    for (std::size_t i = 0; i < tracks.size(); ++i) {
        const std::vector<DecayProduct>& products = tracks[i].decayProducts;
        for (std::size_t j = 0; j < products.size(); ++j) {
            if (std::holds_alternative<PionDecay>(products[j])) {
                addresses.push_back(ParticleAddress{i, ParticleRole::PionNeutrino, j});
                addresses.push_back(ParticleAddress{i, ParticleRole::ElectronNeutrino, j});
                addresses.push_back(ParticleAddress{i, ParticleRole::MuonNeutrino, j});
            } else if (std::holds_alternative<MuonDecay>(products[j])) {
                addresses.push_back(ParticleAddress{i, ParticleRole::ElectronNeutrino, j});
                addresses.push_back(ParticleAddress{i, ParticleRole::MuonNeutrino, j});
            } else if (std::holds_alternative<BetaDecay>(products[j])) {
                addresses.push_back(ParticleAddress{i, ParticleRole::BetaNeutrino, j});
            }
        }
    }
    return addresses;
}

std::optional<ParticleSpecies> SpeciesAt(const std::vector<Track>& tracks, const ParticleAddress& address) {
    if (address.trackIndex >= tracks.size()) {
        return std::nullopt;
    }
    const Track& track = tracks[address.trackIndex];
    if (address.role == ParticleRole::Track) {
        return track.species;
    }
    if (address.productIndex >= track.decayProducts.size()) {
        return std::nullopt;
    }
    const DecayProduct& product = track.decayProducts[address.productIndex];
    if (IsNeutrinoRole(address.role)) {
        const NeutrinoRay* ray = NeutrinoAt(product, address.role);
        if (ray == nullptr) {
            return std::nullopt;
        }
        return ray->species;
    }
    if (const auto* pion = std::get_if<PionDecay>(&product)) {
        if (address.role == ParticleRole::Muon) {
            return pion->muon.species;
        }
        if (address.role == ParticleRole::Lepton) {
            return pion->muon.decay.lepton.species;
        }
    }
    if (const auto* muon = std::get_if<MuonDecay>(&product)) {
        if (address.role == ParticleRole::Lepton) {
            return muon->lepton.species;
        }
    }
    return std::nullopt;
}

Numbering::Numbering(std::vector<NumberedParticle> particles, std::vector<int> naturalToDisplay, int neutrinoCount)
    : particles_(std::move(particles)), naturalToDisplay_(std::move(naturalToDisplay)), neutrinoCount_(neutrinoCount) {
    displayToNatural_.assign(naturalToDisplay_.size(), 0);
    for (std::size_t natural = 1; natural < naturalToDisplay_.size(); ++natural) {
        displayToNatural_[static_cast<std::size_t>(naturalToDisplay_[natural])] = static_cast<int>(natural);
    }
    for (NumberedParticle& particle : particles_) {
        particle.displayIndex = naturalToDisplay_[static_cast<std::size_t>(particle.naturalIndex)];
    }
}

int Numbering::DisplayForNatural(int naturalIndex) const {
    if (naturalIndex < 1 || naturalIndex > Total()) {
        return 0;
    }
    return naturalToDisplay_[static_cast<std::size_t>(naturalIndex)];
}

int Numbering::NaturalForDisplay(int displayIndex) const {
    if (displayIndex < 1 || displayIndex > Total()) {
        return 0;
    }
    return displayToNatural_[static_cast<std::size_t>(displayIndex)];
}

const NumberedParticle* Numbering::ByDisplayIndex(int displayIndex) const {
    const int natural = NaturalForDisplay(displayIndex);
    if (natural == 0) {
        return nullptr;
    }
    return &particles_[static_cast<std::size_t>(natural - 1)];
}

std::optional<int> Numbering::DisplayIndexOf(const ParticleAddress& address) const {
    for (const NumberedParticle& particle : particles_) {
        if (particle.address == address) {
            return particle.displayIndex;
        }
    }
    return std::nullopt;
}

const char* Numbering::SymbolForDisplayIndex(int displayIndex) const {
    const NumberedParticle* particle = ByDisplayIndex(displayIndex);
    if (particle == nullptr) {
        return "";
    }
    return SymbolOf(particle->species);
}

std::optional<int> Numbering::FormHintDisplayIndex() const {
    for (int display = 1; display <= Total(); ++display) {
        const ParticleSpecies species = ByDisplayIndex(display)->species;
        if (species == ParticleSpecies::Electron || species == ParticleSpecies::Positron) {
            return display;
        }
    }
    return std::nullopt;
}

Numbering BuildNumbering(const std::vector<Track>& tracks, IRandomSource& rng) {
    const std::vector<ParticleAddress> addresses = EnumerateIdentifiable(tracks);
    const int total = static_cast<int>(addresses.size());

    std::vector<NumberedParticle> particles;
    particles.reserve(addresses.size());
    for (std::size_t i = 0; i < addresses.size(); ++i) {
        NumberedParticle particle;
        particle.naturalIndex = static_cast<int>(i) + 1;
        particle.address = addresses[i];
        particle.species = SpeciesAt(tracks, addresses[i]).value_or(ParticleSpecies::Proton);
        particles.push_back(particle);
    }

    std::vector<int> naturalToDisplay(static_cast<std::size_t>(total) + 1, 0);
    std::iota(naturalToDisplay.begin(), naturalToDisplay.end(), 0);
    for (int i = total; i > 2; --i) {
        const int j = 2 + static_cast<int>(rng.UniformIndex(static_cast<std::size_t>(i - 1)));
        std::swap(naturalToDisplay[static_cast<std::size_t>(i)], naturalToDisplay[static_cast<std::size_t>(j)]);
    }

    return Numbering(std::move(particles), std::move(naturalToDisplay), static_cast<int>(EnumerateNeutrinos(tracks).size()));
}

}  // namespace bubble
