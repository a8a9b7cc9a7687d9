#include "bubble/event_generator.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "bubble/decay_chains.hpp"

namespace bubble {
namespace {

constexpr double kDegree = constants::kPi / 180.0;

constexpr double kMinBeamMomentum = 40.0;
constexpr double kMaxBeamMomentum = 60.0;
constexpr double kMinProtonFraction = 0.4;
constexpr double kMaxProtonFraction = 0.7;
constexpr double kMinProtonScatter = 10.0 * kDegree;
constexpr double kMaxProtonScatter = 15.0 * kDegree;
constexpr double kMinOutgoingProtonLength = 0.35;
constexpr double kMaxOutgoingProtonLength = 0.45;
constexpr double kMinPionScatter = 22.5 * kDegree;
constexpr double kMaxPionScatter = 45.0 * kDegree;
constexpr double kPionScatterWidening = 0.3;
constexpr double kMinPionTurnFraction = 0.12;
constexpr double kMaxPionTurnFraction = 0.25;
constexpr double kNeutralPionMomentumFraction = 0.1;
constexpr double kMaxNeutralPionAngle = 15.0 * kDegree;
constexpr double kNeutralPionHop = 0.08;

constexpr double kMinNeutronMomentum = 8.0;
constexpr double kMaxNeutronMomentum = 14.0;
constexpr double kMinBetaProtonFraction = 0.5;
constexpr double kMaxBetaProtonFraction = 0.7;
constexpr double kMinBetaElectronFraction = 0.2;
constexpr double kMaxBetaElectronFraction = 0.3;
constexpr double kMinBetaEmissionAngle = 0.15;
constexpr double kMaxBetaEmissionAngle = 0.25;
constexpr double kMinBetaProtonTurnFraction = 0.1;
constexpr double kMaxBetaProtonTurnFraction = 0.2;

constexpr double kMinMuonMomentum = 6.0;
constexpr double kMaxMuonMomentum = 12.0;
constexpr double kMinIncomingMuonSweep = 0.35;
constexpr double kMaxIncomingMuonSweep = 0.7;

constexpr double kMinChargedPionMomentum = 8.0;
constexpr double kMaxChargedPionMomentum = 16.0;
constexpr double kMinIncomingPionSweep = 0.3;
constexpr double kMaxIncomingPionSweep = 0.6;
constexpr double kMinNeutralPionMomentum = 4.0;
constexpr double kMaxNeutralPionMomentum = 8.0;

constexpr double kMinPhotonMomentum = 3.0;
constexpr double kMaxPhotonMomentum = 8.0;

constexpr double kMinCentralBand = 0.35;
constexpr double kMaxCentralBand = 0.65;
constexpr double kMinConversionBand = 0.3;
constexpr double kMaxConversionBand = 0.7;
constexpr double kEntryJitter = 0.1;
constexpr double kEntryMargin = 0.05;

constexpr double kMinDeltaRayRadius = 0.004;
constexpr double kMaxDeltaRayRadius = 0.012;
constexpr double kDeltaRayTurns = 3.0;

// Appends tracks in generation order; the returned index is the only
// state shared between the steps of one scenario.
class TrackList {
public:
    std::size_t Add(Track track) {
        tracks_.push_back(std::move(track));
        return tracks_.size() - 1;
    }

    Track& At(std::size_t index) { return tracks_[index]; }

    std::vector<Track> Release() { return std::move(tracks_); }

private:
    std::vector<Track> tracks_;
};

Vec2 CentralBandPoint(IRandomSource& rng) {
    const double x = rng.Uniform(kMinCentralBand, kMaxCentralBand);
    const double y = rng.Uniform(kMinCentralBand, kMaxCentralBand);
    return Vec2(x, y);
}

Vec2 LeftEdgeEntry(const Vec2& vertex, IRandomSource& rng) {
    const double y = vertex.y + rng.Uniform(-kEntryJitter, kEntryJitter);
    return Vec2(0.0, std::clamp(y, kEntryMargin, constants::kChamberHeight - kEntryMargin));
}

// Neutral incoming particle travelling straight from entry to vertex.
Track StraightIncoming(ParticleSpecies species, double momentum, const Vec2& entry, const Vec2& vertex) {
    const Vec2 path = vertex - entry;
    Track track;
    track.species = species;
    track.momentum = momentum;
    track.shape = MakeStraight(entry, path.Angle(), path.Magnitude());
    track.decayPoint = EndPoint(track.shape);
    return track;
}

// Charged incoming particle curving from entry onto vertex.
Track CurvedIncoming(ParticleSpecies species, double momentum, const Vec2& entry, const Vec2& vertex, double sweep) {
    Track track;
    track.species = species;
    track.momentum = momentum;
    track.shape = ArcThroughPoints(entry, vertex, sweep, ChargeOf(species));
    track.decayPoint = EndPoint(track.shape);
    return track;
}

Track ChargedPionFromCollision(int charge, const Momentum& momentum, const Vec2& collision, IRandomSource& rng) {
    Track pion;
    pion.species = PionForCharge(charge);
    pion.momentum = momentum.magnitude;
    const double radius = CurvatureRadius(momentum.magnitude, rng);
    const double turnFraction = rng.Uniform(kMinPionTurnFraction, kMaxPionTurnFraction);
    pion.shape = MakeArc(collision, momentum.angle, radius, turnFraction, charge);
    pion.decayPoint = EndPoint(pion.shape);
    pion.decayProducts.emplace_back(BuildPionDecay(charge, pion.MomentumAt(1.0), *pion.decayPoint, rng));
    return pion;
}

void AddNeutralPionProducts(TrackList& list, std::size_t pionIndex, IRandomSource& rng) {
    const Track& pion = list.At(pionIndex);
    NeutralPionProducts products = BuildNeutralPionDecay(pion.MomentumAt(1.0), *pion.decayPoint, rng);
    products.photon.parentIndex = pionIndex;
    products.electron.parentIndex = pionIndex;
    products.positron.parentIndex = pionIndex;
    list.Add(std::move(products.photon));
    list.Add(std::move(products.electron));
    list.Add(std::move(products.positron));
}

}  // namespace

std::vector<Track> GenerateProtonProton(IRandomSource& rng) {
    TrackList list;
    const Vec2 entry(0.0, constants::kChamberHeight * 0.5);
    const Vec2 collision(constants::kChamberWidth * 0.5, constants::kChamberHeight * 0.5);
    const double beam = rng.Uniform(kMinBeamMomentum, kMaxBeamMomentum);

    const std::size_t incomingIndex = list.Add(StraightIncoming(ParticleSpecies::Proton, beam, entry, collision));

    const double protonFraction = rng.Uniform(kMinProtonFraction, kMaxProtonFraction);
    const double protonScatter = rng.Uniform(kMinProtonScatter, kMaxProtonScatter);
    Vec2 pionBudget((1.0 - protonFraction) * beam, 0.0);

    std::optional<Momentum> neutralPion;
    if (rng.Chance(constants::kNeutralPionProbability)) {
        const double angle = rng.Uniform(-kMaxNeutralPionAngle, kMaxNeutralPionAngle);
        neutralPion = Momentum{kNeutralPionMomentumFraction * beam, angle};
        pionBudget = pionBudget - neutralPion->Components();
    }

    const double protonForward = protonFraction * beam * 0.5;
    for (const double side : {-1.0, 1.0}) {
        const double angle = side * protonScatter;
        Track proton;
        proton.species = ParticleSpecies::Proton;
        proton.momentum = MagnitudeFromForwardComponent(protonForward, angle);
        proton.shape = MakeStraight(collision, angle, rng.Uniform(kMinOutgoingProtonLength, kMaxOutgoingProtonLength));
        proton.parentIndex = incomingIndex;
        list.Add(std::move(proton));
    }

    // Each pair shares its slice of the budget so the pair sum equals the
    // slice exactly; scatter opens up slightly for every further pair.
    const Vec2 pairShare = pionBudget / static_cast<double>(constants::kPionPairsPerCollision);
    for (int pair = 0; pair < constants::kPionPairsPerCollision; ++pair) {
        const double scatter = rng.Uniform(kMinPionScatter, kMaxPionScatter) * (1.0 + (kPionScatterWidening * pair));
        const Vec2 half = pairShare * 0.5;
        const double transverse = half.x * std::tan(scatter);

        const Momentum plus = Momentum::FromComponents(Vec2(half.x, half.y - transverse));
        const Momentum minus = Momentum::FromComponents(Vec2(half.x, half.y + transverse));

        Track pionPlus = ChargedPionFromCollision(1, plus, collision, rng);
        pionPlus.parentIndex = incomingIndex;
        list.Add(std::move(pionPlus));
        Track pionMinus = ChargedPionFromCollision(-1, minus, collision, rng);
        pionMinus.parentIndex = incomingIndex;
        list.Add(std::move(pionMinus));
    }

    if (neutralPion.has_value()) {
        Track pion;
        pion.species = ParticleSpecies::PionZero;
        pion.momentum = neutralPion->magnitude;
        pion.shape = MakeStraight(collision, neutralPion->angle, kNeutralPionHop);
        pion.decayPoint = EndPoint(pion.shape);
        pion.parentIndex = incomingIndex;
        const std::size_t pionIndex = list.Add(std::move(pion));
        AddNeutralPionProducts(list, pionIndex, rng);
    }

    return list.Release();
}

std::vector<Track> GenerateNeutronDecay(IRandomSource& rng) {
    TrackList list;
    const Vec2 vertex = CentralBandPoint(rng);
    const Vec2 entry = LeftEdgeEntry(vertex, rng);
    const double momentum = rng.Uniform(kMinNeutronMomentum, kMaxNeutronMomentum);

    const std::size_t neutronIndex = list.Add(StraightIncoming(ParticleSpecies::Neutron, momentum, entry, vertex));
    const Momentum neutron = list.At(neutronIndex).MomentumAt(1.0);
    const Vec2 decayPoint = *list.At(neutronIndex).decayPoint;

    // Proton and electron leave on opposite sides of the neutron line.
    const double side = rng.Chance(0.5) ? 1.0 : -1.0;
    const double protonFraction = rng.Uniform(kMinBetaProtonFraction, kMaxBetaProtonFraction);
    const double protonOffset = side * rng.Uniform(kMinBetaEmissionAngle, kMaxBetaEmissionAngle);
    const Momentum proton = SplitMomentum(neutron, protonFraction, protonOffset).primary;

    const double electronFraction = rng.Uniform(kMinBetaElectronFraction, kMaxBetaElectronFraction);
    const double electronOffset = -side * rng.Uniform(kMinBetaEmissionAngle, kMaxBetaEmissionAngle);
    const Momentum electron{neutron.magnitude * electronFraction, neutron.angle + electronOffset};

    const Momentum antineutrino =
        Momentum::FromComponents(neutron.Components() - proton.Components() - electron.Components());
    list.At(neutronIndex).decayProducts.emplace_back(BetaDecay{NeutrinoRay{ParticleSpecies::ElectronAntineutrino, antineutrino}});

    Track protonTrack;
    protonTrack.species = ParticleSpecies::Proton;
    protonTrack.momentum = proton.magnitude;
    const double radius = CurvatureRadius(proton.magnitude, rng);
    const double turnFraction = rng.Uniform(kMinBetaProtonTurnFraction, kMaxBetaProtonTurnFraction);
    protonTrack.shape = MakeArc(decayPoint, proton.angle, radius, turnFraction, 1);
    protonTrack.parentIndex = neutronIndex;
    list.Add(std::move(protonTrack));

    Track electronTrack = BuildLeptonTrack(ParticleSpecies::Electron, electron, decayPoint, rng);
    electronTrack.parentIndex = neutronIndex;
    list.Add(std::move(electronTrack));

    return list.Release();
}

std::vector<Track> GenerateMuonDecay(IRandomSource& rng) {
    TrackList list;
    const int charge = rng.Chance(0.5) ? 1 : -1;
    const double momentum = rng.Uniform(kMinMuonMomentum, kMaxMuonMomentum);
    const Vec2 vertex = CentralBandPoint(rng);
    const Vec2 entry = LeftEdgeEntry(vertex, rng);
    const double sweep = rng.Uniform(kMinIncomingMuonSweep, kMaxIncomingMuonSweep);

    Track muon = CurvedIncoming(MuonForCharge(charge), momentum, entry, vertex, sweep);
    muon.decayProducts.emplace_back(BuildMuonDecay(charge, muon.MomentumAt(1.0), *muon.decayPoint, rng));
    list.Add(std::move(muon));
    return list.Release();
}

std::vector<Track> GeneratePionDecay(IRandomSource& rng, std::optional<int> pionCharge) {
    static constexpr int kCharges[] = {-1, 1, 0};
    int charge = 0;
    if (pionCharge.has_value()) {
        charge = (*pionCharge > 0) ? 1 : ((*pionCharge < 0) ? -1 : 0);
    } else {
        charge = kCharges[rng.UniformIndex(3)];
    }

    TrackList list;
    if (charge != 0) {
        const double momentum = rng.Uniform(kMinChargedPionMomentum, kMaxChargedPionMomentum);
        const Vec2 vertex(constants::kChamberWidth * 0.5, rng.Uniform(kMinCentralBand, kMaxCentralBand));
        const Vec2 entry = LeftEdgeEntry(vertex, rng);
        const double sweep = rng.Uniform(kMinIncomingPionSweep, kMaxIncomingPionSweep);

        Track pion = CurvedIncoming(PionForCharge(charge), momentum, entry, vertex, sweep);
        pion.decayProducts.emplace_back(BuildPionDecay(charge, pion.MomentumAt(1.0), *pion.decayPoint, rng));
        list.Add(std::move(pion));
        return list.Release();
    }

    const double momentum = rng.Uniform(kMinNeutralPionMomentum, kMaxNeutralPionMomentum);
    const Vec2 vertex = CentralBandPoint(rng);
    const Vec2 entry = LeftEdgeEntry(vertex, rng);
    const std::size_t pionIndex = list.Add(StraightIncoming(ParticleSpecies::PionZero, momentum, entry, vertex));
    AddNeutralPionProducts(list, pionIndex, rng);
    return list.Release();
}

std::vector<Track> GeneratePhotonPairProduction(IRandomSource& rng) {
    TrackList list;
    const double momentum = rng.Uniform(kMinPhotonMomentum, kMaxPhotonMomentum);
    const Vec2 vertex(rng.Uniform(kMinConversionBand, kMaxConversionBand), rng.Uniform(kMinConversionBand, kMaxConversionBand));
    const Vec2 entry = LeftEdgeEntry(vertex, rng);

    const std::size_t photonIndex = list.Add(StraightIncoming(ParticleSpecies::Photon, momentum, entry, vertex));
    const Track& photon = list.At(photonIndex);
    ElectronPair pair = BuildPairConversion(photon.MomentumAt(1.0), *photon.decayPoint, rng);
    pair.electron.parentIndex = photonIndex;
    pair.positron.parentIndex = photonIndex;
    list.Add(std::move(pair.electron));
    list.Add(std::move(pair.positron));
    return list.Release();
}

ChamberBackground GenerateBackground(IRandomSource& rng) {
    ChamberBackground background;
    background.grain.reserve(constants::kGrainPointCount);
    for (std::size_t i = 0; i < constants::kGrainPointCount; ++i) {
        GrainPoint point;
        point.position = Vec2(rng.Uniform(0.0, constants::kChamberWidth), rng.Uniform(0.0, constants::kChamberHeight));
        point.size_px = static_cast<float>(rng.Uniform(0.5, 1.5));
        point.alpha = static_cast<float>(rng.Uniform(0.15, 0.5));
        background.grain.push_back(point);
    }

    const std::size_t spiralChoices =
        static_cast<std::size_t>(constants::kMaxBackgroundSpirals - constants::kMinBackgroundSpirals + 1);
    const int spiralCount = constants::kMinBackgroundSpirals + static_cast<int>(rng.UniformIndex(spiralChoices));
    for (int i = 0; i < spiralCount; ++i) {
        const Vec2 center(rng.Uniform(0.05, 0.95), rng.Uniform(0.05, 0.95));
        const double baseAngle = rng.Uniform(0.0, constants::kTwoPi);
        const double radius = rng.Uniform(kMinDeltaRayRadius, kMaxDeltaRayRadius);
        const int charge = rng.Chance(0.5) ? 1 : -1;
        background.deltaRays.push_back(MakeGrowingSpiral(center, baseAngle, radius, kDeltaRayTurns, charge));
    }
    return background;
}

Event GenerateEvent(const GeneratorConfig& config, IRandomSource& rng) {
    Event event;
    event.scenario = config.scenario;
    switch (config.scenario) {
        case Scenario::ProtonProton:
            event.tracks = GenerateProtonProton(rng);
            break;
        case Scenario::NeutronDecay:
            event.tracks = GenerateNeutronDecay(rng);
            break;
        case Scenario::MuonDecay:
            event.tracks = GenerateMuonDecay(rng);
            break;
        case Scenario::PionDecay:
            event.tracks = GeneratePionDecay(rng, config.pionCharge);
            break;
        case Scenario::PhotonPairProduction:
            event.tracks = GeneratePhotonPairProduction(rng);
            break;
    }
    event.numbering = BuildNumbering(event.tracks, rng);
    event.background = GenerateBackground(rng);
    return event;
}

}  // namespace bubble
