#include "bubble/kinematics.hpp"

#include <cmath>

namespace bubble {

TwoBodySplit SplitMomentum(const Momentum& parent, double fraction, double angleOffset) {
    TwoBodySplit split;
    split.primary.magnitude = parent.magnitude * fraction;
    split.primary.angle = parent.angle + angleOffset;
    split.complement = Momentum::FromComponents(parent.Components() - split.primary.Components());
    return split;
}

TwoBodySplit SampleSplit(const Momentum& parent, const SplitBounds& bounds, IRandomSource& rng) {
    const double fraction = rng.Uniform(bounds.minFraction, bounds.maxFraction);
    const double offset = rng.Uniform(bounds.minOffset, bounds.maxOffset);
    return SplitMomentum(parent, fraction, offset);
}

double MagnitudeFromForwardComponent(double forward, double angle) {
    return forward / std::cos(angle);
}

}  // namespace bubble
