#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "bubble/event_generator.hpp"
#include "bubble/renderer.hpp"
#include "validation_harness.hpp"

namespace {

using bubble::Event;
using bubble::FrameOutput;
using bubble::ParticleAddress;
using bubble::ParticleRole;
using bubble::ParticleSpecies;
using bubble::RenderRequest;
using bubble::RevealMode;
using bubble::Vec2;

constexpr bubble_validation::ScalarTolerance kPixelTolerance{1.0e-9, 1.0e-12, "affine screen mapping"};

RenderRequest UnitRequest(RevealMode mode) {
    RenderRequest request;
    request.view = bubble::ViewTransform{1.0, 0.0, 0.0};
    request.viewport = bubble::Viewport{1000.0, 1000.0};
    request.mode = mode;
    return request;
}

bubble::Track StraightProton(const Vec2& origin, double length) {
    bubble::Track track;
    track.species = ParticleSpecies::Proton;
    track.momentum = 10.0;
    track.shape = bubble::MakeStraight(origin, 0.0, length);
    return track;
}

// Track 0 ends (and is labelled) at (0.5, 0.2); track 1 starts at (0.52, 0.2).
Event LabelAndOriginEvent() {
    Event event;
    event.tracks.push_back(StraightProton(Vec2(0.2, 0.2), 0.3));
    event.tracks.push_back(StraightProton(Vec2(0.52, 0.2), 0.3));
    bubble::MersenneRandomSource rng(1U);
    event.numbering = bubble::BuildNumbering(event.tracks, rng);
    return event;
}

Event NeutronEvent(uint32_t seed) {
    bubble::GeneratorConfig config;
    config.scenario = bubble::Scenario::NeutronDecay;
    bubble::MersenneRandomSource rng(seed);
    return bubble::GenerateEvent(config, rng);
}

// Tracks: pi0, photon, electron, positron.
Event NeutralPionEvent(uint32_t seed) {
    bubble::GeneratorConfig config;
    config.scenario = bubble::Scenario::PionDecay;
    config.pionCharge = 0;
    bubble::MersenneRandomSource rng(seed);
    return bubble::GenerateEvent(config, rng);
}

std::size_t CountOwned(const FrameOutput& frame) {
    std::size_t count = 0;
    for (const bubble::Polyline& polyline : frame.polylines) {
        if (polyline.owner.has_value() && !polyline.highlighted) {
            ++count;
        }
    }
    return count;
}

const bubble::Polyline* FindOwned(const FrameOutput& frame, const ParticleAddress& address) {
    for (const bubble::Polyline& polyline : frame.polylines) {
        if (polyline.owner.has_value() && *polyline.owner == address && !polyline.highlighted) {
            return &polyline;
        }
    }
    return nullptr;
}

}  // namespace

TEST(RendererTest, ChamberCenterMapsToViewportCenter) {
    const bubble::ViewTransform view;
    const bubble::Viewport viewport{800.0, 600.0};
    const Vec2 center = bubble::ChamberToScreen(Vec2(0.5, 0.5), view, viewport);
    bubble_validation::ExpectVecNearWithTolerance("center", center, Vec2(400.0, 300.0), kPixelTolerance);

    const Vec2 corner = bubble::ChamberToScreen(Vec2(0.0, 0.0), view, viewport);
    bubble_validation::ExpectVecNearWithTolerance("corner", corner, Vec2(120.0, 90.0), kPixelTolerance);
}

TEST(RendererTest, ScreenToChamberInvertsPanAndZoom) {
    const bubble::ViewTransform view{2.0, 35.0, -12.0};
    const bubble::Viewport viewport{1280.0, 800.0};
    const Vec2 chamber(0.3, 0.8);
    const Vec2 screen = bubble::ChamberToScreen(chamber, view, viewport);
    bubble_validation::ExpectVecNearWithTolerance(
        "inverse", bubble::ScreenToChamber(screen, view, viewport), chamber, kPixelTolerance);
}

TEST(RendererTest, IdentifiedModePrefersLabelOverCloserOrigin) {
    const Event event = LabelAndOriginEvent();
    const RenderRequest request = UnitRequest(RevealMode::Identified);
    const std::vector<bubble::Label> labels = bubble::LayoutLabels(event, request);

    // 15 px from track 0's label, 5 px from track 1's origin.
    const auto hover = bubble::HitTest(event, request, labels, Vec2(515.0, 200.0));
    ASSERT_TRUE(hover.has_value());
    EXPECT_EQ(hover->address, (ParticleAddress{0, ParticleRole::Track, 0}));
}

TEST(RendererTest, NumberedModeFallsBackToNearestOrigin) {
    const Event event = LabelAndOriginEvent();
    const RenderRequest request = UnitRequest(RevealMode::Numbered);
    const std::vector<bubble::Label> labels = bubble::LayoutLabels(event, request);

    const auto hover = bubble::HitTest(event, request, labels, Vec2(515.0, 200.0));
    ASSERT_TRUE(hover.has_value());
    EXPECT_EQ(hover->address, (ParticleAddress{1, ParticleRole::Track, 0}));
    ASSERT_TRUE(hover->displayIndex.has_value());
}

TEST(RendererTest, HitTestMissesBeyondThreshold) {
    const Event event = LabelAndOriginEvent();
    const RenderRequest request = UnitRequest(RevealMode::Unlabeled);
    EXPECT_FALSE(bubble::HitTest(event, request, {}, Vec2(100.0, 900.0)).has_value());
}

TEST(RendererTest, UnlabeledModeHidesNeutralsAndRays) {
    const Event event = NeutronEvent(3U);
    const FrameOutput frame = bubble::RenderEvent(event, UnitRequest(RevealMode::Unlabeled));

    EXPECT_TRUE(frame.labels.empty());
    EXPECT_EQ(CountOwned(frame), 2U);
    EXPECT_EQ(FindOwned(frame, ParticleAddress{0, ParticleRole::Track, 0}), nullptr);
    EXPECT_EQ(frame.grain.size(), event.background.grain.size());
}

TEST(RendererTest, NumberedModeShowsBadgesAndDashedNeutrals) {
    const Event event = NeutronEvent(3U);
    const FrameOutput frame = bubble::RenderEvent(event, UnitRequest(RevealMode::Numbered));

    ASSERT_EQ(frame.labels.size(), 3U);
    for (const bubble::Label& label : frame.labels) {
        EXPECT_EQ(label.style, bubble::LabelStyle::Badge);
        const auto display = event.numbering.DisplayIndexOf(label.address);
        ASSERT_TRUE(display.has_value());
        EXPECT_EQ(label.text, std::to_string(*display));
    }

    const bubble::Polyline* neutron = FindOwned(frame, ParticleAddress{0, ParticleRole::Track, 0});
    ASSERT_NE(neutron, nullptr);
    EXPECT_TRUE(neutron->dashed);
    EXPECT_FLOAT_EQ(neutron->color.a, 0.3f);
    EXPECT_EQ(CountOwned(frame), 3U);
}

TEST(RendererTest, NumberedModeHidesNeutralsThatNeverDecay) {
    const Event event = NeutralPionEvent(7U);
    ASSERT_EQ(event.tracks.size(), 4U);
    const ParticleAddress pion{0, ParticleRole::Track, 0};
    const ParticleAddress photon{1, ParticleRole::Track, 0};

    const FrameOutput numbered = bubble::RenderEvent(event, UnitRequest(RevealMode::Numbered));
    EXPECT_EQ(FindOwned(numbered, photon), nullptr);
    const bubble::Polyline* pionTrack = FindOwned(numbered, pion);
    ASSERT_NE(pionTrack, nullptr);
    EXPECT_TRUE(pionTrack->dashed);
    EXPECT_EQ(CountOwned(numbered), 3U);
    ASSERT_EQ(numbered.labels.size(), 3U);
    for (const bubble::Label& label : numbered.labels) {
        EXPECT_NE(label.address, photon);
    }

    const FrameOutput identified = bubble::RenderEvent(event, UnitRequest(RevealMode::Identified));
    const bubble::Polyline* photonTrack = FindOwned(identified, photon);
    ASSERT_NE(photonTrack, nullptr);
    EXPECT_TRUE(photonTrack->dashed);
    EXPECT_EQ(identified.labels.size(), 4U);
}

TEST(RendererTest, IdentifiedModeRevealsSymbolsAndNeutrinoRays) {
    const Event event = NeutronEvent(3U);
    const FrameOutput frame = bubble::RenderEvent(event, UnitRequest(RevealMode::Identified));

    ASSERT_EQ(frame.labels.size(), 4U);
    bool sawAntineutrino = false;
    for (const bubble::Label& label : frame.labels) {
        EXPECT_EQ(label.style, bubble::LabelStyle::Symbol);
        if (label.address.role == ParticleRole::BetaNeutrino) {
            sawAntineutrino = true;
            EXPECT_EQ(label.text, bubble::SymbolOf(ParticleSpecies::ElectronAntineutrino));
        }
    }
    EXPECT_TRUE(sawAntineutrino);

    const bubble::Polyline* ray = FindOwned(frame, ParticleAddress{0, ParticleRole::BetaNeutrino, 0});
    ASSERT_NE(ray, nullptr);
    EXPECT_TRUE(ray->dashed);
    ASSERT_EQ(ray->points_px.size(), 2U);

    const bubble::Polyline* proton = FindOwned(frame, ParticleAddress{1, ParticleRole::Track, 0});
    ASSERT_NE(proton, nullptr);
    const bubble::Rgba protonColor = bubble::Describe(ParticleSpecies::Proton).color;
    EXPECT_FLOAT_EQ(proton->color.r, protonColor.r);
    EXPECT_FLOAT_EQ(proton->color.g, protonColor.g);
    EXPECT_FLOAT_EQ(proton->color.b, protonColor.b);
    EXPECT_FALSE(proton->dashed);
}

TEST(RendererTest, HoveredTrackIsRedrawnHighlighted) {
    const Event event = NeutronEvent(5U);
    RenderRequest request = UnitRequest(RevealMode::Unlabeled);
    const Vec2 vertex = *event.tracks[0].decayPoint;
    request.pointer_px = bubble::ChamberToScreen(vertex, request.view, request.viewport);

    const FrameOutput frame = bubble::RenderEvent(event, request);
    ASSERT_TRUE(frame.hover.has_value());
    EXPECT_EQ(frame.hover->address, (ParticleAddress{1, ParticleRole::Track, 0}));
    EXPECT_EQ(frame.hover->species, ParticleSpecies::Proton);

    const bubble::Polyline& last = frame.polylines.back();
    EXPECT_TRUE(last.highlighted);
    ASSERT_TRUE(last.owner.has_value());
    EXPECT_EQ(*last.owner, frame.hover->address);
    EXPECT_FLOAT_EQ(last.color.a, 1.0f);
    EXPECT_FLOAT_EQ(last.width_px, bubble::Describe(ParticleSpecies::Proton).strokeWidth * 1.5f);
}

TEST(RendererTest, RenderingIsIdempotent) {
    const Event event = NeutronEvent(11U);
    RenderRequest request = UnitRequest(RevealMode::Identified);
    request.view = bubble::ViewTransform{1.4, -20.0, 15.0};
    request.pointer_px = Vec2(480.0, 510.0);

    const FrameOutput first = bubble::RenderEvent(event, request);
    const FrameOutput second = bubble::RenderEvent(event, request);

    ASSERT_EQ(first.polylines.size(), second.polylines.size());
    for (std::size_t i = 0; i < first.polylines.size(); ++i) {
        ASSERT_EQ(first.polylines[i].points_px.size(), second.polylines[i].points_px.size());
        for (std::size_t j = 0; j < first.polylines[i].points_px.size(); ++j) {
            EXPECT_EQ(first.polylines[i].points_px[j].x, second.polylines[i].points_px[j].x);
            EXPECT_EQ(first.polylines[i].points_px[j].y, second.polylines[i].points_px[j].y);
        }
        EXPECT_EQ(first.polylines[i].highlighted, second.polylines[i].highlighted);
    }
    ASSERT_EQ(first.labels.size(), second.labels.size());
    for (std::size_t i = 0; i < first.labels.size(); ++i) {
        EXPECT_EQ(first.labels[i].text, second.labels[i].text);
        EXPECT_EQ(first.labels[i].position_px.x, second.labels[i].position_px.x);
        EXPECT_EQ(first.labels[i].position_px.y, second.labels[i].position_px.y);
    }
    EXPECT_EQ(first.hover.has_value(), second.hover.has_value());
}

TEST(RendererTest, DashSegmentsAlternateDashAndGap) {
    const std::vector<Vec2> line{Vec2(0.0, 0.0), Vec2(10.0, 0.0)};
    const std::vector<Vec2> segments = bubble::DashSegments(line, 3.0, 2.0);
    ASSERT_EQ(segments.size(), 4U);
    EXPECT_DOUBLE_EQ(segments[0].x, 0.0);
    EXPECT_DOUBLE_EQ(segments[1].x, 3.0);
    EXPECT_DOUBLE_EQ(segments[2].x, 5.0);
    EXPECT_DOUBLE_EQ(segments[3].x, 8.0);

    EXPECT_EQ(bubble::DashSegments(line, 0.0, 2.0).size(), 2U);
    EXPECT_TRUE(bubble::DashSegments({Vec2(1.0, 1.0)}, 3.0, 2.0).empty());
}
