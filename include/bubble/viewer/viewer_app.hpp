#pragma once

#include <memory>
#include <optional>

#include "bubble/cli_options.hpp"
#include "bubble/renderer.hpp"
#include "bubble/session.hpp"
#include "bubble/viewer/hover_throttle.hpp"

namespace bubble::viewer {

class ViewerApp {
public:
    explicit ViewerApp(ViewerCliOptions options);

    int Run();

private:
    // Re-runs RenderEvent only when one of its inputs changed.
    bool RefreshFrame();

    void DrawControls();
    void DrawIdentificationForm();
    void DrawLabels() const;
    void DrawHoverTooltip() const;

    ViewerCliOptions options_;
    ChamberSession session_;
    HoverThrottle hoverThrottle_;
    std::optional<Vec2> hoverPointer_px_;

    FrameOutput frame_;
    bool frameValid_ = false;
    std::shared_ptr<const Event> frameEvent_;
    RenderRequest frameRequest_;
};

}  // namespace bubble::viewer
