#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "bubble/renderer.hpp"
#include "bubble/viewer/camera.hpp"

namespace bubble::viewer {

// Uploads one FrameOutput worth of screen-space geometry and draws it with an
// orthographic pixel projection.
class GlRenderer {
public:
    bool Initialize(std::string* errorOut);
    void Shutdown();

    void UploadFrame(const FrameOutput& frame);

    void Draw(const Mat4& screenProjection) const;

private:
    struct LineBatch {
        float width_px = 1.0f;
        int firstVertex = 0;
        int vertexCount = 0;
    };

    bool InitializeGrainPipeline(std::string* errorOut);
    bool InitializeLinePipeline(std::string* errorOut);

    unsigned int pointProgram_ = 0;
    unsigned int pointVao_ = 0;
    unsigned int pointVbo_ = 0;
    int pointProjectionLocation_ = -1;

    unsigned int lineProgram_ = 0;
    unsigned int lineVao_ = 0;
    unsigned int lineVbo_ = 0;
    int lineProjectionLocation_ = -1;

    int grainVertexCount_ = 0;
    std::vector<LineBatch> lineBatches_;
};

}  // namespace bubble::viewer
