#pragma once

#include <cstdint>
#include <iosfwd>
#include <vector>

#include "bubble/event.hpp"

namespace bubble {

// Momentum bookkeeping at one decay or collision vertex: the parent evaluated
// at the end of its shape against its children at the start of theirs.
struct VertexBalance {
    ParticleAddress parent;
    Vec2 position;
    Vec2 parentMomentum;
    Vec2 childMomentumSum;
    uint32_t childCount = 0;

    double Residual() const { return Vec2::Distance(parentMomentum, childMomentumSum); }
};

struct EventSnapshot {
    Scenario scenario = Scenario::ProtonProton;
    uint64_t seed = 0;
    uint32_t topLevelTracks = 0;
    uint32_t chargedTracks = 0;
    int identifiable = 0;
    int neutrinos = 0;
    uint32_t vertexCount = 0;
    double maxVertexResidual = 0.0;
    double maxDecayPointOffset = 0.0;
};

std::vector<VertexBalance> CollectVertexBalances(const std::vector<Track>& tracks);

// Largest distance between a stored decay point and its parent's shape end.
double MaxDecayPointOffset(const std::vector<Track>& tracks);

EventSnapshot SnapshotEvent(const Event& event, uint64_t seed);

void PrintEventSummary(std::ostream& out, int eventIndex, const EventSnapshot& snapshot);

}  // namespace bubble
