#pragma once

#include <cstdint>
#include <vector>

#include "bubble/config.hpp"

namespace bubble {

enum class ShapeKind : uint8_t {
    Straight = 0,
    Arc = 1,
    Spiral = 2,
};

// angle is the direction for straight shapes, the radial start angle for arcs
// and the base angle for spirals. length is a normalized distance for straight
// shapes and a fraction of a full turn for arcs.
struct TrackShape {
    ShapeKind kind = ShapeKind::Straight;
    Vec2 origin;
    double angle = 0.0;
    double length = 0.0;
    double radius = 0.0;
    double turns = 0.0;
    bool shrink = false;
    int handedness = 1;
};

struct ChamberBounds {
    double width = constants::kChamberWidth;
    double height = constants::kChamberHeight;
};

inline int Handedness(int charge) { return (charge < 0) ? -1 : 1; }

double SeedAngleForDirection(double direction, int handedness);

TrackShape MakeStraight(const Vec2& origin, double direction, double length);
TrackShape MakeArc(const Vec2& origin, double direction, double radius, double turnFraction, int charge);
TrackShape MakeShrinkingSpiral(const Vec2& origin, double direction, double radius, double turns, int charge);
TrackShape MakeGrowingSpiral(const Vec2& center, double baseAngle, double radius, double turns, int charge);

// Arc that starts at entry and ends exactly at vertex after sweeping
// sweepAngle radians (0 < sweepAngle < pi) with the charge's handedness.
TrackShape ArcThroughPoints(const Vec2& entry, const Vec2& vertex, double sweepAngle, int charge);

Vec2 PointAt(const TrackShape& shape, double t);
Vec2 EndPoint(const TrackShape& shape);
Vec2 MidPoint(const TrackShape& shape);
double TangentAt(const TrackShape& shape, double t);
double ArcSweep(const TrackShape& shape);
Vec2 ShapeCenter(const TrackShape& shape);

Vec2 RayBoundaryIntersection(const Vec2& start, double angle, const ChamberBounds& bounds = ChamberBounds{});

std::vector<Vec2> SamplePolyline(const TrackShape& shape);

}  // namespace bubble
