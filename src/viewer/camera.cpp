#include "bubble/viewer/camera.hpp"

#include <algorithm>

namespace bubble::viewer {

PanZoomCamera::PanZoomCamera() = default;

void PanZoomCamera::SetViewport(int width, int height) {
    viewportWidth_ = std::max(1, width);
    viewportHeight_ = std::max(1, height);
}

void PanZoomCamera::BeginDrag(double x, double y, bool pressedOnLabel) {
    if (pressedOnLabel) {
        return;
    }
    dragging_ = true;
    lastCursorX_ = x;
    lastCursorY_ = y;
}

void PanZoomCamera::EndDrag() {
    dragging_ = false;
}

bool PanZoomCamera::OnCursorMove(double x, double y) {
    if (!dragging_) {
        return false;
    }

    const double deltaX = x - lastCursorX_;
    const double deltaY = y - lastCursorY_;
    lastCursorX_ = x;
    lastCursorY_ = y;
    PanBy(deltaX, deltaY);
    return true;
}

void PanZoomCamera::OnScroll(double deltaY) {
    if (deltaY > 0.0) {
        ZoomIn();
    } else if (deltaY < 0.0) {
        ZoomOut();
    }
}

void PanZoomCamera::ZoomIn() {
    SetScale(transform_.scale * constants::kZoomFactor);
}

void PanZoomCamera::ZoomOut() {
    SetScale(transform_.scale / constants::kZoomFactor);
}

void PanZoomCamera::PanBy(double deltaX, double deltaY) {
    transform_.panX += deltaX;
    transform_.panY += deltaY;
}

void PanZoomCamera::Reset() {
    transform_ = ViewTransform{};
    dragging_ = false;
}

Viewport PanZoomCamera::ViewportSize() const {
    return Viewport{static_cast<double>(viewportWidth_), static_cast<double>(viewportHeight_)};
}

Mat4 PanZoomCamera::ScreenProjectionMatrix() const {
    return Orthographic(0.0f, static_cast<float>(viewportWidth_), static_cast<float>(viewportHeight_), 0.0f);
}

void PanZoomCamera::SetScale(double scale) {
    transform_.scale = std::max(constants::kMinViewScale, std::min(constants::kMaxViewScale, scale));
}

Mat4 Orthographic(float left, float right, float bottom, float top) {
    Mat4 out{};
    out.elements[0] = 2.0f / (right - left);
    out.elements[5] = 2.0f / (top - bottom);
    out.elements[10] = -1.0f;
    out.elements[12] = -(right + left) / (right - left);
    out.elements[13] = -(top + bottom) / (top - bottom);
    out.elements[15] = 1.0f;
    return out;
}

}  // namespace bubble::viewer
