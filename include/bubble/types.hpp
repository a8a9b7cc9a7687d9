#pragma once

#include <cmath>

namespace bubble {

struct Vec2 {
    double x;
    double y;

    Vec2() : x(0.0), y(0.0) {}
    Vec2(double xIn, double yIn) : x(xIn), y(yIn) {}

    Vec2 operator+(const Vec2& rhs) const { return Vec2(x + rhs.x, y + rhs.y); }
    Vec2 operator-(const Vec2& rhs) const { return Vec2(x - rhs.x, y - rhs.y); }
    Vec2 operator*(double scale) const { return Vec2(x * scale, y * scale); }
    Vec2 operator/(double scale) const { return Vec2(x / scale, y / scale); }

    Vec2& operator+=(const Vec2& rhs) {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    double Magnitude() const { return std::sqrt((x * x) + (y * y)); }

    double Angle() const { return std::atan2(y, x); }

    bool IsFinite() const { return std::isfinite(x) && std::isfinite(y); }

    static Vec2 FromPolar(double magnitude, double angle) {
        return Vec2(magnitude * std::cos(angle), magnitude * std::sin(angle));
    }

    static double Dot(const Vec2& a, const Vec2& b) { return (a.x * b.x) + (a.y * b.y); }

    static double Distance(const Vec2& a, const Vec2& b) { return (a - b).Magnitude(); }
};

}  // namespace bubble
