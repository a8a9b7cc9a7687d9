#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "bubble/event.hpp"

namespace bubble {

enum class RevealMode : uint8_t {
    // Fresh event: charged tracks in white, no labels.
    Unlabeled = 0,
    // Identification form open: shuffled number badges; neutral tracks show
    // only if they decay.
    Numbered = 1,
    // Identities revealed: species colors, symbols and neutrino rays.
    Identified = 2,
};

struct ViewTransform {
    double scale = constants::kDefaultViewScale;
    double panX = 0.0;
    double panY = 0.0;
};

struct Viewport {
    double width = 800.0;
    double height = 600.0;
};

struct RenderRequest {
    ViewTransform view;
    Viewport viewport;
    RevealMode mode = RevealMode::Unlabeled;
    std::optional<Vec2> pointer_px;
};

enum class LabelStyle : uint8_t {
    Badge = 0,
    Symbol = 1,
};

// Screen-space polyline. Background decoration has no owner.
struct Polyline {
    std::vector<Vec2> points_px;
    Rgba color;
    float width_px = 1.0f;
    bool dashed = false;
    bool highlighted = false;
    std::optional<ParticleAddress> owner;
};

struct GrainSprite {
    Vec2 position_px;
    float size_px = 1.0f;
    Rgba color;
};

struct Label {
    Vec2 position_px;
    std::string text;
    LabelStyle style = LabelStyle::Badge;
    Rgba color;
    ParticleAddress address;
};

struct HoverTarget {
    ParticleAddress address;
    ParticleSpecies species = ParticleSpecies::Proton;
    std::optional<int> displayIndex;
    Vec2 anchor_px;
};

struct FrameOutput {
    std::vector<GrainSprite> grain;
    std::vector<Polyline> polylines;
    std::vector<Label> labels;
    std::optional<HoverTarget> hover;
};

Vec2 ChamberToScreen(const Vec2& chamber, const ViewTransform& view, const Viewport& viewport);
Vec2 ScreenToChamber(const Vec2& screen_px, const ViewTransform& view, const Viewport& viewport);

// Labels for every particle visible in request.mode, in screen space.
std::vector<Label> LayoutLabels(const Event& event, const RenderRequest& request);

// Identified mode tries labels within the pixel hit radius first (nearest
// wins); otherwise the nearest particle origin within the normalized threshold.
std::optional<HoverTarget> HitTest(
    const Event& event,
    const RenderRequest& request,
    const std::vector<Label>& labels,
    const Vec2& pointer_px);

// Pure and idempotent: identical inputs give identical output.
FrameOutput RenderEvent(const Event& event, const RenderRequest& request);

// Splits a polyline into dash segments returned as consecutive point pairs.
std::vector<Vec2> DashSegments(const std::vector<Vec2>& points_px, double dash_px, double gap_px);

}  // namespace bubble
