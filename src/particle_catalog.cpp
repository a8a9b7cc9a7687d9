#include "bubble/particle_catalog.hpp"

#include <array>
#include <cstddef>

namespace bubble {
namespace {

constexpr Rgba Hex(uint32_t rgb) {
    return Rgba{
        static_cast<float>((rgb >> 16) & 0xFF) / 255.0f,
        static_cast<float>((rgb >> 8) & 0xFF) / 255.0f,
        static_cast<float>(rgb & 0xFF) / 255.0f,
        1.0f,
    };
}

constexpr const char* kNeutrinoDescription = "Neutral lepton, barely interacts and leaves no visible track";

const std::array<ParticleInfo, 14> kCatalog = {{
    {"Proton (p)", "p", "Proton", 1, Hex(0x845ef7), 3.0f,
     "Heavy baryon, short thick track, high momentum"},
    {"Neutron (n)", "n", "Neutron", 0, Hex(0x94d2ff), 2.0f,
     "Neutral baryon, invisible until it decays"},
    {"Pion (π⁺)", "π⁺", "Pion", 1, Hex(0x51cf66), 2.5f,
     "Light meson, decays into a muon and a neutrino"},
    {"Pion (π⁻)", "π⁻", "Pion", -1, Hex(0x51cf66), 2.5f,
     "Light meson, decays into a muon and a neutrino"},
    {"Pion (π⁰)", "π⁰", "Pion", 0, Hex(0x94d2ff), 2.0f,
     "Neutral pion, decays almost immediately"},
    {"Muon (μ⁺)", "μ⁺", "Muon", 1, Hex(0x4dabf7), 2.0f,
     "Heavy lepton, minimal interaction, long curved track"},
    {"Muon (μ⁻)", "μ⁻", "Muon", -1, Hex(0x4dabf7), 2.0f,
     "Heavy lepton, minimal interaction, long curved track"},
    {"Electron (e⁻)", "e⁻", "Electron", -1, Hex(0xffd43b), 1.5f,
     "Light lepton, loses energy quickly and curls into a tight spiral"},
    {"Positron (e⁺)", "e⁺", "Positron", 1, Hex(0xff8787), 1.5f,
     "Antiparticle of the electron, curls into a tight spiral"},
    {"Photon (γ)", "γ", "Gamma", 0, Hex(0xcccccc), 1.0f,
     "Neutral, invisible until it converts or is identified"},
    {"Electron neutrino (νe)", "νe", "Neutrino", 0, Hex(0xffffff), 0.5f, kNeutrinoDescription},
    {"Electron antineutrino (ν̄e)", "ν̄e", "Neutrino", 0, Hex(0xffffff), 0.5f, kNeutrinoDescription},
    {"Muon neutrino (νμ)", "νμ", "Neutrino", 0, Hex(0xffffff), 0.5f, kNeutrinoDescription},
    {"Muon antineutrino (ν̄μ)", "ν̄μ", "Neutrino", 0, Hex(0xffffff), 0.5f, kNeutrinoDescription},
}};

}  // namespace

const ParticleInfo& Describe(ParticleSpecies species) {
    return kCatalog[static_cast<std::size_t>(species)];
}

ParticleSpecies MuonForCharge(int charge) {
    return (charge < 0) ? ParticleSpecies::MuonMinus : ParticleSpecies::MuonPlus;
}

ParticleSpecies PionForCharge(int charge) {
    if (charge == 0) {
        return ParticleSpecies::PionZero;
    }
    return (charge < 0) ? ParticleSpecies::PionMinus : ParticleSpecies::PionPlus;
}

ParticleSpecies LeptonForCharge(int charge) {
    return (charge < 0) ? ParticleSpecies::Electron : ParticleSpecies::Positron;
}

ParticleSpecies PionDecayNeutrino(int pionCharge) {
    return (pionCharge < 0) ? ParticleSpecies::MuonAntineutrino : ParticleSpecies::MuonNeutrino;
}

ParticleSpecies MuonDecayElectronNeutrino(int muonCharge) {
    return (muonCharge < 0) ? ParticleSpecies::ElectronAntineutrino : ParticleSpecies::ElectronNeutrino;
}

ParticleSpecies MuonDecayMuonNeutrino(int muonCharge) {
    return (muonCharge < 0) ? ParticleSpecies::MuonNeutrino : ParticleSpecies::MuonAntineutrino;
}

std::optional<ParticleSpecies> SpeciesFromSymbol(std::string_view symbol) {
    for (std::size_t i = 0; i < kCatalog.size(); ++i) {
        if (symbol == kCatalog[i].symbol) {
            return static_cast<ParticleSpecies>(i);
        }
    }
    return std::nullopt;
}

}  // namespace bubble
