#pragma once

#include <array>

#include "bubble/renderer.hpp"

namespace bubble::viewer {

struct Mat4 {
    std::array<float, 16> elements{};

    const float* Data() const { return elements.data(); }
};

// Pan/zoom about the viewport center. Drags pan by raw pixel deltas unless the
// press landed on a label.
class PanZoomCamera {
public:
    PanZoomCamera();

    void SetViewport(int width, int height);
    void BeginDrag(double x, double y, bool pressedOnLabel);
    void EndDrag();
    // Returns true when the move panned the view.
    bool OnCursorMove(double x, double y);
    void OnScroll(double deltaY);

    void ZoomIn();
    void ZoomOut();
    void PanBy(double deltaX, double deltaY);
    void Reset();

    bool IsDragging() const { return dragging_; }
    const ViewTransform& Transform() const { return transform_; }
    Viewport ViewportSize() const;

    // Maps screen pixels (origin top-left, y down) to clip space.
    Mat4 ScreenProjectionMatrix() const;

private:
    void SetScale(double scale);

    int viewportWidth_ = 1280;
    int viewportHeight_ = 800;

    bool dragging_ = false;
    double lastCursorX_ = 0.0;
    double lastCursorY_ = 0.0;

    ViewTransform transform_;
};

Mat4 Orthographic(float left, float right, float bottom, float top);

}  // namespace bubble::viewer
