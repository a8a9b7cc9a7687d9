#include "bubble/decay_chains.hpp"

#include <cmath>

namespace bubble {
namespace {

constexpr double kRadiusJitter = 0.15;

constexpr SplitBounds kPionToMuon{0.4, 0.8, -0.1, 0.1};
constexpr SplitBounds kMuonToLepton{0.4, 0.6, 0.3, 0.7};
constexpr SplitBounds kNeutralPionToPhoton{0.3, 0.5, -constants::kPi / 8.0, constants::kPi / 8.0};

constexpr double kMinMuonTurnFraction = 0.2;
constexpr double kMaxMuonTurnFraction = 0.35;
constexpr double kMinLeptonSpiralRadius = 0.05;
constexpr double kMaxLeptonSpiralRadius = 0.09;
constexpr double kLeptonSpiralTurns = 3.0;
constexpr double kMinAntiparallelNeutrinoShare = 0.1;
constexpr double kMaxAntiparallelNeutrinoShare = 0.2;
constexpr double kAntiparallelSpread = 0.3;
constexpr double kMinPairOpening = constants::kPi / 3.0;
constexpr double kMaxPairOpening = constants::kPi / 2.0;
constexpr double kPhotonTrackLength = 0.25;

TrackShape LeptonSpiralShape(const Vec2& vertex, double direction, int charge, IRandomSource& rng) {
    const double radius = rng.Uniform(kMinLeptonSpiralRadius, kMaxLeptonSpiralRadius);
    return MakeShrinkingSpiral(vertex, direction, radius, kLeptonSpiralTurns, charge);
}

// A primary of 0.5 / cos(opening / 2) at -opening / 2 leaves a mirror-image
// complement, so the pair opens symmetrically about the parent with equal shares.
TwoBodySplit SymmetricPairSplit(const Momentum& parent, IRandomSource& rng) {
    const double halfOpening = rng.Uniform(kMinPairOpening, kMaxPairOpening) * 0.5;
    return SplitMomentum(parent, 0.5 / std::cos(halfOpening), -halfOpening);
}

}  // namespace

Track BuildLeptonTrack(ParticleSpecies species, const Momentum& momentum, const Vec2& vertex, IRandomSource& rng) {
    Track track;
    track.species = species;
    track.momentum = momentum.magnitude;
    track.shape = LeptonSpiralShape(vertex, momentum.angle, ChargeOf(species), rng);
    return track;
}

double CurvatureRadius(double momentum, IRandomSource& rng) {
    return momentum * constants::kRadiusPerMomentum * rng.Uniform(1.0 - kRadiusJitter, 1.0 + kRadiusJitter);
}

MuonDecay BuildMuonDecay(int muonCharge, const Momentum& muonAtVertex, const Vec2& vertex, IRandomSource& rng) {
    const TwoBodySplit leptonSplit = SampleSplit(muonAtVertex, kMuonToLepton, rng);

    // The muon neutrino recoils near-antiparallel to the muon; the electron
    // neutrino carries the rest and trails on the side opposite the lepton.
    const Momentum antiparallel{
        muonAtVertex.magnitude * rng.Uniform(kMinAntiparallelNeutrinoShare, kMaxAntiparallelNeutrinoShare),
        muonAtVertex.angle + constants::kPi + rng.Uniform(-kAntiparallelSpread, kAntiparallelSpread)};
    const Momentum remainder =
        Momentum::FromComponents(leptonSplit.complement.Components() - antiparallel.Components());

    MuonDecay decay;
    decay.lepton.species = LeptonForCharge(muonCharge);
    decay.lepton.momentum = leptonSplit.primary.magnitude;
    decay.lepton.shape = LeptonSpiralShape(vertex, leptonSplit.primary.angle, muonCharge, rng);
    decay.electronNeutrino = NeutrinoRay{MuonDecayElectronNeutrino(muonCharge), remainder};
    decay.muonNeutrino = NeutrinoRay{MuonDecayMuonNeutrino(muonCharge), antiparallel};
    return decay;
}

PionDecay BuildPionDecay(int pionCharge, const Momentum& pionAtVertex, const Vec2& vertex, IRandomSource& rng) {
    const TwoBodySplit split = SampleSplit(pionAtVertex, kPionToMuon, rng);

    PionDecay decay;
    decay.neutrino = NeutrinoRay{PionDecayNeutrino(pionCharge), split.complement};

    MuonArc& muon = decay.muon;
    muon.species = MuonForCharge(pionCharge);
    muon.momentum = split.primary.magnitude;
    const double radius = CurvatureRadius(muon.momentum, rng);
    const double turnFraction = rng.Uniform(kMinMuonTurnFraction, kMaxMuonTurnFraction);
    muon.shape = MakeArc(vertex, split.primary.angle, radius, turnFraction, pionCharge);
    muon.decayPoint = EndPoint(muon.shape);

    const Momentum muonAtDecay{muon.momentum, TangentAt(muon.shape, 1.0)};
    muon.decay = BuildMuonDecay(pionCharge, muonAtDecay, muon.decayPoint, rng);
    return decay;
}

ElectronPair BuildPairConversion(const Momentum& photon, const Vec2& vertex, IRandomSource& rng) {
    const TwoBodySplit split = SymmetricPairSplit(photon, rng);

    ElectronPair pair;
    pair.electron = BuildLeptonTrack(ParticleSpecies::Electron, split.primary, vertex, rng);
    pair.positron = BuildLeptonTrack(ParticleSpecies::Positron, split.complement, vertex, rng);
    return pair;
}

NeutralPionProducts BuildNeutralPionDecay(const Momentum& pion, const Vec2& vertex, IRandomSource& rng) {
    const TwoBodySplit photonSplit = SampleSplit(pion, kNeutralPionToPhoton, rng);

    NeutralPionProducts products;
    products.photon.species = ParticleSpecies::Photon;
    products.photon.momentum = photonSplit.primary.magnitude;
    products.photon.shape = MakeStraight(vertex, photonSplit.primary.angle, kPhotonTrackLength);

    const TwoBodySplit pairSplit = SymmetricPairSplit(photonSplit.complement, rng);
    products.electron = BuildLeptonTrack(ParticleSpecies::Electron, pairSplit.primary, vertex, rng);
    products.positron = BuildLeptonTrack(ParticleSpecies::Positron, pairSplit.complement, vertex, rng);
    return products;
}

}  // namespace bubble
