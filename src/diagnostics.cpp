#include "bubble/diagnostics.hpp"

#include <algorithm>

namespace bubble {
namespace {

Vec2 MomentumAtStart(double magnitude, const TrackShape& shape) {
    return Momentum{magnitude, TangentAt(shape, 0.0)}.Components();
}

void AddMuonDecayChildren(const MuonDecay& decay, VertexBalance* balance) {
    balance->childMomentumSum += MomentumAtStart(decay.lepton.momentum, decay.lepton.shape);
    balance->childMomentumSum += decay.electronNeutrino.momentum.Components();
    balance->childMomentumSum += decay.muonNeutrino.momentum.Components();
    balance->childCount += 3;
}

}  // namespace

std::vector<VertexBalance> CollectVertexBalances(const std::vector<Track>& tracks) {
    std::vector<VertexBalance> balances;
    for (std::size_t i = 0; i < tracks.size(); ++i) {
        const Track& track = tracks[i];
        if (!track.decayPoint.has_value()) {
            continue;
        }

        VertexBalance balance;
        balance.parent = ParticleAddress{i, ParticleRole::Track, 0};
        balance.position = *track.decayPoint;
        balance.parentMomentum = track.MomentumAt(1.0).Components();

        for (const Track& child : tracks) {
            if (child.parentIndex.has_value() && *child.parentIndex == i) {
                balance.childMomentumSum += child.MomentumAt(0.0).Components();
                ++balance.childCount;
            }
        }

        for (std::size_t j = 0; j < track.decayProducts.size(); ++j) {
            const DecayProduct& product = track.decayProducts[j];
            if (const auto* pion = std::get_if<PionDecay>(&product)) {
                const MuonArc& muon = pion->muon;
                balance.childMomentumSum += MomentumAtStart(muon.momentum, muon.shape);
                balance.childMomentumSum += pion->neutrino.momentum.Components();
                balance.childCount += 2;

                VertexBalance muonBalance;
                muonBalance.parent = ParticleAddress{i, ParticleRole::Muon, j};
                muonBalance.position = muon.decayPoint;
                muonBalance.parentMomentum = Momentum{muon.momentum, TangentAt(muon.shape, 1.0)}.Components();
                AddMuonDecayChildren(muon.decay, &muonBalance);
                balances.push_back(muonBalance);
            } else if (const auto* muonDecay = std::get_if<MuonDecay>(&product)) {
                AddMuonDecayChildren(*muonDecay, &balance);
            } else if (const auto* beta = std::get_if<BetaDecay>(&product)) {
                balance.childMomentumSum += beta->antineutrino.momentum.Components();
                ++balance.childCount;
            }
        }
        balances.push_back(balance);
    }
    return balances;
}

double MaxDecayPointOffset(const std::vector<Track>& tracks) {
    double maxOffset = 0.0;
    for (const Track& track : tracks) {
        if (track.decayPoint.has_value()) {
            maxOffset = std::max(maxOffset, Vec2::Distance(*track.decayPoint, EndPoint(track.shape)));
        }
        for (const DecayProduct& product : track.decayProducts) {
            if (const auto* pion = std::get_if<PionDecay>(&product)) {
                maxOffset = std::max(maxOffset, Vec2::Distance(pion->muon.decayPoint, EndPoint(pion->muon.shape)));
            }
        }
    }
    return maxOffset;
}

EventSnapshot SnapshotEvent(const Event& event, uint64_t seed) {
    EventSnapshot snapshot;
    snapshot.scenario = event.scenario;
    snapshot.seed = seed;
    snapshot.topLevelTracks = static_cast<uint32_t>(event.tracks.size());
    for (const Track& track : event.tracks) {
        if (!track.IsNeutral()) {
            ++snapshot.chargedTracks;
        }
    }
    snapshot.identifiable = event.numbering.Total();
    snapshot.neutrinos = event.numbering.NeutrinoCount();

    const std::vector<VertexBalance> balances = CollectVertexBalances(event.tracks);
    snapshot.vertexCount = static_cast<uint32_t>(balances.size());
    for (const VertexBalance& balance : balances) {
        snapshot.maxVertexResidual = std::max(snapshot.maxVertexResidual, balance.Residual());
    }
    snapshot.maxDecayPointOffset = MaxDecayPointOffset(event.tracks);
    return snapshot;
}

}  // namespace bubble
