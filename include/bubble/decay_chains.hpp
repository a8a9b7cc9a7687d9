#pragma once

#include "bubble/random_source.hpp"
#include "bubble/track.hpp"

namespace bubble {

// Curvature radius for a charged track of the given momentum, with a small
// random jitter so equal momenta do not produce identical arcs.
double CurvatureRadius(double momentum, IRandomSource& rng);

// Electron or positron curling into a shrinking spiral from vertex.
Track BuildLeptonTrack(ParticleSpecies species, const Momentum& momentum, const Vec2& vertex, IRandomSource& rng);

// Lepton plus two neutrinos from a muon of muonCharge decaying at vertex with
// momentum muonAtVertex. The lepton has the muon's charge sign; the muon
// neutrino leaves near-antiparallel to the muon.
MuonDecay BuildMuonDecay(int muonCharge, const Momentum& muonAtVertex, const Vec2& vertex, IRandomSource& rng);

// Muon arc (with its own nested decay) plus neutrino from a charged pion.
PionDecay BuildPionDecay(int pionCharge, const Momentum& pionAtVertex, const Vec2& vertex, IRandomSource& rng);

struct ElectronPair {
    Track electron;
    Track positron;
};

// Electron and positron open 60-90 degrees symmetrically about the photon
// direction with equal momenta.
ElectronPair BuildPairConversion(const Momentum& photon, const Vec2& vertex, IRandomSource& rng);

struct NeutralPionProducts {
    Track photon;
    Track electron;
    Track positron;
};

// Photon plus a symmetric e+ e- pair opening 60-90 degrees.
NeutralPionProducts BuildNeutralPionDecay(const Momentum& pion, const Vec2& vertex, IRandomSource& rng);

}  // namespace bubble
