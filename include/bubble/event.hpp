#pragma once

#include <vector>

#include "bubble/config.hpp"
#include "bubble/numbering.hpp"
#include "bubble/track.hpp"

namespace bubble {

struct GrainPoint {
    Vec2 position;
    float size_px = 1.0f;
    float alpha = 0.5f;
};

// Decoration only: bubble grain and small delta-ray curls. Never numbered.
struct ChamberBackground {
    std::vector<GrainPoint> grain;
    std::vector<TrackShape> deltaRays;
};

struct Event {
    Scenario scenario = Scenario::ProtonProton;
    std::vector<Track> tracks;
    ChamberBackground background;
    Numbering numbering;
};

}  // namespace bubble
