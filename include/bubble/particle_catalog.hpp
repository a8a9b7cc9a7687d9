#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace bubble {

enum class ParticleSpecies : uint8_t {
    Proton = 0,
    Neutron = 1,
    PionPlus = 2,
    PionMinus = 3,
    PionZero = 4,
    MuonPlus = 5,
    MuonMinus = 6,
    Electron = 7,
    Positron = 8,
    Photon = 9,
    ElectronNeutrino = 10,
    ElectronAntineutrino = 11,
    MuonNeutrino = 12,
    MuonAntineutrino = 13,
};

struct Rgba {
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;
    float a = 1.0f;
};

struct ParticleInfo {
    const char* name;
    const char* symbol;
    const char* particleClass;
    int charge;
    Rgba color;
    float strokeWidth;
    const char* description;
};

const ParticleInfo& Describe(ParticleSpecies species);

inline int ChargeOf(ParticleSpecies species) { return Describe(species).charge; }
inline const char* SymbolOf(ParticleSpecies species) { return Describe(species).symbol; }

ParticleSpecies MuonForCharge(int charge);
ParticleSpecies PionForCharge(int charge);
ParticleSpecies LeptonForCharge(int charge);

// Neutrinos emitted with a charged muon/pion of the given charge sign.
ParticleSpecies PionDecayNeutrino(int pionCharge);
ParticleSpecies MuonDecayElectronNeutrino(int muonCharge);
ParticleSpecies MuonDecayMuonNeutrino(int muonCharge);

std::optional<ParticleSpecies> SpeciesFromSymbol(std::string_view symbol);

}  // namespace bubble
