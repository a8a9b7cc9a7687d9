#pragma once

#include "bubble/random_source.hpp"
#include "bubble/types.hpp"

namespace bubble {

struct Momentum {
    double magnitude = 0.0;
    double angle = 0.0;

    Vec2 Components() const { return Vec2::FromPolar(magnitude, angle); }

    static Momentum FromComponents(const Vec2& components) {
        return Momentum{components.Magnitude(), components.Angle()};
    }
};

struct TwoBodySplit {
    Momentum primary;
    Momentum complement;
};

struct SplitBounds {
    double minFraction = 0.0;
    double maxFraction = 0.0;
    double minOffset = 0.0;
    double maxOffset = 0.0;
};

TwoBodySplit SplitMomentum(const Momentum& parent, double fraction, double angleOffset);

TwoBodySplit SampleSplit(const Momentum& parent, const SplitBounds& bounds, IRandomSource& rng);

// Full magnitude whose projection on the beam axis equals forward. Only valid
// for angles kept well away from +/- pi/2.
double MagnitudeFromForwardComponent(double forward, double angle);

}  // namespace bubble
