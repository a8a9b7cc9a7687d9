#include "bubble/renderer.hpp"

#include <algorithm>
#include <limits>

namespace bubble {
namespace {

constexpr Rgba kTrackWhite{1.0f, 1.0f, 1.0f, 0.9f};
constexpr Rgba kNeutralGrey{0.6f, 0.6f, 0.6f, 0.6f};
constexpr Rgba kBadgeColor{1.0f, 1.0f, 1.0f, 1.0f};
constexpr Rgba kDeltaRayColor{1.0f, 1.0f, 1.0f, 0.3f};
constexpr float kNumberedNeutralAlpha = 0.3f;
constexpr float kNeutrinoAlpha = 0.45f;
constexpr float kHighlightWidthScale = 1.5f;

// One identifiable particle or neutrino, with the geometry needed to draw,
// label and hit-test it.
struct Drawable {
    ParticleAddress address;
    ParticleSpecies species = ParticleSpecies::Proton;
    bool isRay = false;
    // Neutral tracks show their path before identification only if they decay.
    bool decays = false;
    TrackShape shape;
    Vec2 rayStart;
    Vec2 rayEnd;
    Vec2 labelAnchor;
};

Rgba WithAlpha(Rgba color, float alpha) {
    color.a = alpha;
    return color;
}

Drawable ShapeDrawable(const ParticleAddress& address, ParticleSpecies species, const TrackShape& shape, const Vec2& anchor) {
    Drawable drawable;
    drawable.address = address;
    drawable.species = species;
    drawable.shape = shape;
    drawable.labelAnchor = anchor;
    return drawable;
}

Drawable RayDrawable(const ParticleAddress& address, const NeutrinoRay& ray, const Vec2& vertex) {
    Drawable drawable;
    drawable.address = address;
    drawable.species = ray.species;
    drawable.isRay = true;
    drawable.rayStart = vertex;
    drawable.rayEnd = RayBoundaryIntersection(vertex, ray.momentum.angle);
    drawable.labelAnchor = (drawable.rayStart + drawable.rayEnd) * 0.5;
    return drawable;
}

Vec2 TrackLabelAnchor(const Track& track) {
    if (!track.IsNeutral()) {
        return EndPoint(track.shape);
    }
    if (track.decayPoint.has_value()) {
        return *track.decayPoint;
    }
    return MidPoint(track.shape);
}

void AppendMuonDecay(
    std::size_t trackIndex,
    std::size_t productIndex,
    const MuonDecay& decay,
    const Vec2& vertex,
    std::vector<Drawable>* drawables) {
    drawables->push_back(ShapeDrawable(
        ParticleAddress{trackIndex, ParticleRole::Lepton, productIndex},
        decay.lepton.species,
        decay.lepton.shape,
        ShapeCenter(decay.lepton.shape)));
    drawables->push_back(RayDrawable(
        ParticleAddress{trackIndex, ParticleRole::ElectronNeutrino, productIndex}, decay.electronNeutrino, vertex));
    drawables->push_back(RayDrawable(
        ParticleAddress{trackIndex, ParticleRole::MuonNeutrino, productIndex}, decay.muonNeutrino, vertex));
}

std::vector<Drawable> CollectDrawables(const Event& event) {
    std::vector<Drawable> drawables;
    for (std::size_t i = 0; i < event.tracks.size(); ++i) {
        const Track& track = event.tracks[i];
        Drawable drawable =
            ShapeDrawable(ParticleAddress{i, ParticleRole::Track, 0}, track.species, track.shape, TrackLabelAnchor(track));
        drawable.decays = track.decayPoint.has_value();
        drawables.push_back(drawable);
    }
    for (std::size_t i = 0; i < event.tracks.size(); ++i) {
        const Track& track = event.tracks[i];
        const Vec2 vertex = track.decayPoint.value_or(EndPoint(track.shape));
        for (std::size_t j = 0; j < track.decayProducts.size(); ++j) {
            const DecayProduct& product = track.decayProducts[j];
            if (const auto* pion = std::get_if<PionDecay>(&product)) {
                const MuonArc& muon = pion->muon;
                drawables.push_back(ShapeDrawable(
                    ParticleAddress{i, ParticleRole::Muon, j}, muon.species, muon.shape, muon.decayPoint));
                drawables.push_back(RayDrawable(ParticleAddress{i, ParticleRole::PionNeutrino, j}, pion->neutrino, vertex));
                AppendMuonDecay(i, j, muon.decay, muon.decayPoint, &drawables);
            } else if (const auto* muonDecay = std::get_if<MuonDecay>(&product)) {
                AppendMuonDecay(i, j, *muonDecay, vertex, &drawables);
            } else if (const auto* beta = std::get_if<BetaDecay>(&product)) {
                drawables.push_back(RayDrawable(ParticleAddress{i, ParticleRole::BetaNeutrino, j}, beta->antineutrino, vertex));
            }
        }
    }
    return drawables;
}

bool IsVisible(const Drawable& drawable, RevealMode mode) {
    if (drawable.isRay) {
        return mode == RevealMode::Identified;
    }
    if (ChargeOf(drawable.species) == 0) {
        return (mode == RevealMode::Identified) || ((mode == RevealMode::Numbered) && drawable.decays);
    }
    return true;
}

Polyline StylePolyline(const Drawable& drawable, RevealMode mode, const RenderRequest& request) {
    const ParticleInfo& info = Describe(drawable.species);

    Polyline polyline;
    polyline.owner = drawable.address;
    polyline.width_px = info.strokeWidth;
    if (drawable.isRay) {
        polyline.points_px.push_back(ChamberToScreen(drawable.rayStart, request.view, request.viewport));
        polyline.points_px.push_back(ChamberToScreen(drawable.rayEnd, request.view, request.viewport));
        polyline.color = WithAlpha(info.color, kNeutrinoAlpha);
        polyline.dashed = true;
        return polyline;
    }

    for (const Vec2& point : SamplePolyline(drawable.shape)) {
        polyline.points_px.push_back(ChamberToScreen(point, request.view, request.viewport));
    }

    const bool neutral = ChargeOf(drawable.species) == 0;
    if (mode == RevealMode::Identified) {
        polyline.color = neutral ? kNeutralGrey : info.color;
        polyline.dashed = neutral;
    } else {
        polyline.color = neutral ? WithAlpha(kTrackWhite, kNumberedNeutralAlpha) : kTrackWhite;
        polyline.dashed = neutral;
    }
    return polyline;
}

std::optional<HoverTarget> MakeHoverTarget(const Event& event, const ParticleAddress& address, const Vec2& anchor_px) {
    const std::optional<ParticleSpecies> species = SpeciesAt(event.tracks, address);
    if (!species.has_value()) {
        return std::nullopt;
    }
    HoverTarget target;
    target.address = address;
    target.species = *species;
    target.displayIndex = event.numbering.DisplayIndexOf(address);
    target.anchor_px = anchor_px;
    return target;
}

}  // namespace

Vec2 ChamberToScreen(const Vec2& chamber, const ViewTransform& view, const Viewport& viewport) {
    const Vec2 center(viewport.width * 0.5, viewport.height * 0.5);
    const Vec2 pixel(chamber.x * viewport.width, chamber.y * viewport.height);
    return ((pixel - center) * view.scale) + center + Vec2(view.panX, view.panY);
}

Vec2 ScreenToChamber(const Vec2& screen_px, const ViewTransform& view, const Viewport& viewport) {
    const Vec2 center(viewport.width * 0.5, viewport.height * 0.5);
    const Vec2 pixel = ((screen_px - center - Vec2(view.panX, view.panY)) / view.scale) + center;
    return Vec2(pixel.x / viewport.width, pixel.y / viewport.height);
}

std::vector<Label> LayoutLabels(const Event& event, const RenderRequest& request) {
    std::vector<Label> labels;
    if (request.mode == RevealMode::Unlabeled) {
        return labels;
    }

    for (const Drawable& drawable : CollectDrawables(event)) {
        if (!IsVisible(drawable, request.mode)) {
            continue;
        }
        Label label;
        label.position_px = ChamberToScreen(drawable.labelAnchor, request.view, request.viewport);
        label.address = drawable.address;
        if (request.mode == RevealMode::Numbered) {
            const std::optional<int> display = event.numbering.DisplayIndexOf(drawable.address);
            if (!display.has_value()) {
                continue;
            }
            label.text = std::to_string(*display);
            label.style = LabelStyle::Badge;
            label.color = kBadgeColor;
        } else {
            const ParticleInfo& info = Describe(drawable.species);
            label.text = info.symbol;
            label.style = LabelStyle::Symbol;
            label.color = WithAlpha(info.color, 1.0f);
        }
        labels.push_back(std::move(label));
    }
    return labels;
}

std::optional<HoverTarget> HitTest(
    const Event& event,
    const RenderRequest& request,
    const std::vector<Label>& labels,
    const Vec2& pointer_px) {
    if (request.mode == RevealMode::Identified) {
        const Label* nearest = nullptr;
        double nearestDistance = constants::kLabelHitRadius_px;
        for (const Label& label : labels) {
            const double distance = Vec2::Distance(label.position_px, pointer_px);
            if (distance <= nearestDistance) {
                nearest = &label;
                nearestDistance = distance;
            }
        }
        if (nearest != nullptr) {
            return MakeHoverTarget(event, nearest->address, nearest->position_px);
        }
    }

    const Vec2 pointer = ScreenToChamber(pointer_px, request.view, request.viewport);
    const Drawable* nearest = nullptr;
    double nearestDistance = std::numeric_limits<double>::infinity();
    const std::vector<Drawable> drawables = CollectDrawables(event);
    for (const Drawable& drawable : drawables) {
        if (drawable.isRay || !IsVisible(drawable, request.mode)) {
            continue;
        }
        const double distance = Vec2::Distance(drawable.shape.origin, pointer);
        if (distance < nearestDistance) {
            nearest = &drawable;
            nearestDistance = distance;
        }
    }
    if (nearest == nullptr || nearestDistance > constants::kTrackHoverThreshold) {
        return std::nullopt;
    }
    return MakeHoverTarget(
        event, nearest->address, ChamberToScreen(nearest->shape.origin, request.view, request.viewport));
}

FrameOutput RenderEvent(const Event& event, const RenderRequest& request) {
    FrameOutput frame;

    frame.grain.reserve(event.background.grain.size());
    for (const GrainPoint& point : event.background.grain) {
        GrainSprite sprite;
        sprite.position_px = ChamberToScreen(point.position, request.view, request.viewport);
        sprite.size_px = point.size_px * static_cast<float>(request.view.scale);
        sprite.color = Rgba{1.0f, 1.0f, 1.0f, point.alpha};
        frame.grain.push_back(sprite);
    }
    for (const TrackShape& deltaRay : event.background.deltaRays) {
        Polyline polyline;
        for (const Vec2& point : SamplePolyline(deltaRay)) {
            polyline.points_px.push_back(ChamberToScreen(point, request.view, request.viewport));
        }
        polyline.color = kDeltaRayColor;
        polyline.width_px = 1.0f;
        frame.polylines.push_back(std::move(polyline));
    }

    for (const Drawable& drawable : CollectDrawables(event)) {
        if (IsVisible(drawable, request.mode)) {
            frame.polylines.push_back(StylePolyline(drawable, request.mode, request));
        }
    }

    frame.labels = LayoutLabels(event, request);
    if (request.pointer_px.has_value()) {
        frame.hover = HitTest(event, request, frame.labels, *request.pointer_px);
    }

    if (frame.hover.has_value()) {
        const std::size_t drawnCount = frame.polylines.size();
        for (std::size_t i = 0; i < drawnCount; ++i) {
            const Polyline& source = frame.polylines[i];
            if (source.owner.has_value() && *source.owner == frame.hover->address) {
                Polyline highlight = source;
                highlight.highlighted = true;
                highlight.width_px = source.width_px * kHighlightWidthScale;
                highlight.color.a = 1.0f;
                frame.polylines.push_back(std::move(highlight));
            }
        }
    }
    return frame;
}

std::vector<Vec2> DashSegments(const std::vector<Vec2>& points_px, double dash_px, double gap_px) {
    std::vector<Vec2> segments;
    if (points_px.size() < 2) {
        return segments;
    }
    if (dash_px <= 0.0 || gap_px <= 0.0) {
        for (std::size_t i = 1; i < points_px.size(); ++i) {
            segments.push_back(points_px[i - 1]);
            segments.push_back(points_px[i]);
        }
        return segments;
    }

    bool drawing = true;
    double remaining = dash_px;
    for (std::size_t i = 1; i < points_px.size(); ++i) {
        const Vec2 start = points_px[i - 1];
        const Vec2 delta = points_px[i] - start;
        const double length = delta.Magnitude();
        if (length <= 0.0) {
            continue;
        }
        const Vec2 direction = delta / length;
        double position = 0.0;
        while (position < length) {
            const double step = std::min(remaining, length - position);
            if (drawing) {
                segments.push_back(start + (direction * position));
                segments.push_back(start + (direction * (position + step)));
            }
            position += step;
            remaining -= step;
            if (remaining <= 0.0) {
                drawing = !drawing;
                remaining = drawing ? dash_px : gap_px;
            }
        }
    }
    return segments;
}

}  // namespace bubble
