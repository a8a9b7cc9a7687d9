#include "bubble/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace bubble {
namespace {

Vec2 Direction(double angle) {
    return Vec2(std::cos(angle), std::sin(angle));
}

double SpiralAngleAt(const TrackShape& shape, double t) {
    return shape.angle + (static_cast<double>(shape.handedness) * t * constants::kTwoPi * shape.turns);
}

int SegmentCount(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::Straight:
            return 1;
        case ShapeKind::Arc:
            return constants::kArcSegments;
        case ShapeKind::Spiral:
            return constants::kSpiralSegments;
    }
    return 1;
}

}  // namespace

double SeedAngleForDirection(double direction, int handedness) {
    return direction - (static_cast<double>(handedness) * constants::kPi * 0.5);
}

TrackShape MakeStraight(const Vec2& origin, double direction, double length) {
    TrackShape shape;
    shape.kind = ShapeKind::Straight;
    shape.origin = origin;
    shape.angle = direction;
    shape.length = length;
    return shape;
}

TrackShape MakeArc(const Vec2& origin, double direction, double radius, double turnFraction, int charge) {
    TrackShape shape;
    shape.kind = ShapeKind::Arc;
    shape.origin = origin;
    shape.handedness = Handedness(charge);
    shape.angle = SeedAngleForDirection(direction, shape.handedness);
    shape.radius = radius;
    shape.length = turnFraction;
    return shape;
}

TrackShape MakeShrinkingSpiral(const Vec2& origin, double direction, double radius, double turns, int charge) {
    TrackShape shape;
    shape.kind = ShapeKind::Spiral;
    shape.origin = origin;
    shape.handedness = Handedness(charge);
    shape.angle = SeedAngleForDirection(direction, shape.handedness);
    shape.radius = radius;
    shape.turns = turns;
    shape.shrink = true;
    return shape;
}

TrackShape MakeGrowingSpiral(const Vec2& center, double baseAngle, double radius, double turns, int charge) {
    TrackShape shape;
    shape.kind = ShapeKind::Spiral;
    shape.origin = center;
    shape.handedness = Handedness(charge);
    shape.angle = baseAngle;
    shape.radius = radius;
    shape.turns = turns;
    shape.shrink = false;
    return shape;
}

TrackShape ArcThroughPoints(const Vec2& entry, const Vec2& vertex, double sweepAngle, int charge) {
    const Vec2 chord = vertex - entry;
    const double chordLength = chord.Magnitude();
    const int handedness = Handedness(charge);

    TrackShape shape;
    shape.kind = ShapeKind::Arc;
    shape.origin = entry;
    shape.handedness = handedness;
    if (chordLength <= 0.0 || sweepAngle <= 0.0 || sweepAngle >= constants::kPi) {
        shape.angle = SeedAngleForDirection(chord.Angle(), handedness);
        shape.radius = 0.0;
        shape.length = 0.0;
        return shape;
    }

    const Vec2 along = chord / chordLength;
    const Vec2 leftNormal(-along.y, along.x);
    const double radius = chordLength / (2.0 * std::sin(sweepAngle * 0.5));
    const double centerOffset = radius * std::cos(sweepAngle * 0.5);
    const Vec2 center = ((entry + vertex) * 0.5) + (leftNormal * (static_cast<double>(handedness) * centerOffset));

    shape.angle = (entry - center).Angle();
    shape.radius = radius;
    shape.length = sweepAngle / constants::kTwoPi;
    return shape;
}

double ArcSweep(const TrackShape& shape) {
    return shape.length * constants::kTwoPi * static_cast<double>(shape.handedness);
}

Vec2 ShapeCenter(const TrackShape& shape) {
    switch (shape.kind) {
        case ShapeKind::Straight:
            return shape.origin;
        case ShapeKind::Arc:
            return shape.origin - (Direction(shape.angle) * shape.radius);
        case ShapeKind::Spiral:
            if (shape.shrink) {
                return shape.origin - (Direction(shape.angle) * shape.radius);
            }
            return shape.origin;
    }
    return shape.origin;
}

Vec2 PointAt(const TrackShape& shape, double t) {
    switch (shape.kind) {
        case ShapeKind::Straight:
            return shape.origin + (Direction(shape.angle) * (t * shape.length));
        case ShapeKind::Arc: {
            const Vec2 center = ShapeCenter(shape);
            return center + (Direction(shape.angle + (t * ArcSweep(shape))) * shape.radius);
        }
        case ShapeKind::Spiral: {
            const Vec2 center = ShapeCenter(shape);
            const double r = shape.shrink ? shape.radius * (1.0 - t) : shape.radius * t;
            return center + (Direction(SpiralAngleAt(shape, t)) * r);
        }
    }
    return shape.origin;
}

Vec2 EndPoint(const TrackShape& shape) {
    return PointAt(shape, 1.0);
}

Vec2 MidPoint(const TrackShape& shape) {
    return PointAt(shape, 0.5);
}

double TangentAt(const TrackShape& shape, double t) {
    const double quarterTurn = static_cast<double>(shape.handedness) * constants::kPi * 0.5;
    switch (shape.kind) {
        case ShapeKind::Straight:
            return shape.angle;
        case ShapeKind::Arc:
            return shape.angle + (t * ArcSweep(shape)) + quarterTurn;
        case ShapeKind::Spiral:
            return SpiralAngleAt(shape, t) + quarterTurn;
    }
    return shape.angle;
}

Vec2 RayBoundaryIntersection(const Vec2& start, double angle, const ChamberBounds& bounds) {
    const double cosAngle = std::cos(angle);
    const double sinAngle = std::sin(angle);

    double bestT = std::numeric_limits<double>::infinity();
    Vec2 best;
    auto consider = [&](double t, const Vec2& hit) {
        if (t > 0.0 && t < bestT) {
            bestT = t;
            best = hit;
        }
    };

    if (cosAngle < 0.0) {
        const double t = (0.0 - start.x) / cosAngle;
        const double y = start.y + (t * sinAngle);
        if (y >= 0.0 && y <= bounds.height) {
            consider(t, Vec2(0.0, y));
        }
    }
    if (cosAngle > 0.0) {
        const double t = (bounds.width - start.x) / cosAngle;
        const double y = start.y + (t * sinAngle);
        if (y >= 0.0 && y <= bounds.height) {
            consider(t, Vec2(bounds.width, y));
        }
    }
    if (sinAngle < 0.0) {
        const double t = (0.0 - start.y) / sinAngle;
        const double x = start.x + (t * cosAngle);
        if (x >= 0.0 && x <= bounds.width) {
            consider(t, Vec2(x, 0.0));
        }
    }
    if (sinAngle > 0.0) {
        const double t = (bounds.height - start.y) / sinAngle;
        const double x = start.x + (t * cosAngle);
        if (x >= 0.0 && x <= bounds.width) {
            consider(t, Vec2(x, bounds.height));
        }
    }

    if (std::isfinite(bestT)) {
        return best;
    }

    // Out-of-view fallback for starts outside the box or degenerate rays.
    const double reach = 2.0 * std::max(bounds.width, bounds.height);
    return start + (Vec2(cosAngle, sinAngle) * reach);
}

std::vector<Vec2> SamplePolyline(const TrackShape& shape) {
    const int segments = SegmentCount(shape.kind);
    std::vector<Vec2> points;
    points.reserve(static_cast<std::size_t>(segments + 1));
    for (int i = 0; i <= segments; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(segments);
        points.push_back(PointAt(shape, t));
    }
    return points;
}

}  // namespace bubble
