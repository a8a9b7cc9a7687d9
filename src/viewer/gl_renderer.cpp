#include "bubble/viewer/gl_renderer.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include <glad/glad.h>

namespace bubble::viewer {
namespace {

constexpr double kDash_px = 6.0;
constexpr double kDashGap_px = 4.0;

unsigned int CompileShader(unsigned int shaderType, const char* source, std::string* errorOut) {
    const unsigned int shader = glCreateShader(shaderType);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);

    int compiled = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &compiled);
    if (compiled == GL_TRUE) {
        return shader;
    }

    int logLength = 0;
    glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &logLength);
    std::string log(static_cast<std::size_t>(std::max(logLength, 1)), '\0');
    glGetShaderInfoLog(shader, logLength, nullptr, log.data());

    glDeleteShader(shader);
    if (errorOut != nullptr) {
        *errorOut = "Shader compile failed: " + log;
    }
    return 0;
}

unsigned int CreateProgram(const char* vertexSource, const char* fragmentSource, std::string* errorOut) {
    const unsigned int vs = CompileShader(GL_VERTEX_SHADER, vertexSource, errorOut);
    if (vs == 0) {
        return 0;
    }

    const unsigned int fs = CompileShader(GL_FRAGMENT_SHADER, fragmentSource, errorOut);
    if (fs == 0) {
        glDeleteShader(vs);
        return 0;
    }

    const unsigned int program = glCreateProgram();
    glAttachShader(program, vs);
    glAttachShader(program, fs);
    glLinkProgram(program);

    glDeleteShader(vs);
    glDeleteShader(fs);

    int linked = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &linked);
    if (linked == GL_TRUE) {
        return program;
    }

    int logLength = 0;
    glGetProgramiv(program, GL_INFO_LOG_LENGTH, &logLength);
    std::string log(static_cast<std::size_t>(std::max(logLength, 1)), '\0');
    glGetProgramInfoLog(program, logLength, nullptr, log.data());
    glDeleteProgram(program);

    if (errorOut != nullptr) {
        *errorOut = "Program link failed: " + log;
    }
    return 0;
}

const char* kGrainVertexShader = R"GLSL(
#version 330 core
layout(location = 0) in vec2 aPosition;
layout(location = 1) in vec4 aColor;
layout(location = 2) in float aSize;

uniform mat4 uProjection;

out vec4 vColor;

void main() {
    gl_Position = uProjection * vec4(aPosition, 0.0, 1.0);
    gl_PointSize = aSize;
    vColor = aColor;
}
)GLSL";

const char* kGrainFragmentShader = R"GLSL(
#version 330 core
in vec4 vColor;
out vec4 fragColor;

void main() {
    vec2 centered = gl_PointCoord * 2.0 - 1.0;
    if (dot(centered, centered) > 1.0) {
        discard;
    }
    fragColor = vColor;
}
)GLSL";

const char* kLineVertexShader = R"GLSL(
#version 330 core
layout(location = 0) in vec2 aPosition;
layout(location = 1) in vec4 aColor;

uniform mat4 uProjection;
out vec4 vColor;

void main() {
    gl_Position = uProjection * vec4(aPosition, 0.0, 1.0);
    vColor = aColor;
}
)GLSL";

const char* kLineFragmentShader = R"GLSL(
#version 330 core
in vec4 vColor;
out vec4 fragColor;

void main() {
    fragColor = vColor;
}
)GLSL";

void PushVertex(std::vector<float>* out, const Vec2& position, const Rgba& color) {
    out->push_back(static_cast<float>(position.x));
    out->push_back(static_cast<float>(position.y));
    out->push_back(color.r);
    out->push_back(color.g);
    out->push_back(color.b);
    out->push_back(color.a);
}

void PushPolyline(std::vector<float>* out, const Polyline& polyline) {
    if (polyline.dashed) {
        for (const Vec2& point : DashSegments(polyline.points_px, kDash_px, kDashGap_px)) {
            PushVertex(out, point, polyline.color);
        }
        return;
    }
    for (std::size_t i = 1; i < polyline.points_px.size(); ++i) {
        PushVertex(out, polyline.points_px[i - 1], polyline.color);
        PushVertex(out, polyline.points_px[i], polyline.color);
    }
}

}  // namespace

bool GlRenderer::Initialize(std::string* errorOut) {
    if (!InitializeGrainPipeline(errorOut)) {
        Shutdown();
        return false;
    }

    if (!InitializeLinePipeline(errorOut)) {
        Shutdown();
        return false;
    }

    glDisable(GL_DEPTH_TEST);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    glEnable(GL_PROGRAM_POINT_SIZE);
    return true;
}

bool GlRenderer::InitializeGrainPipeline(std::string* errorOut) {
    pointProgram_ = CreateProgram(kGrainVertexShader, kGrainFragmentShader, errorOut);
    if (pointProgram_ == 0) {
        return false;
    }

    pointProjectionLocation_ = glGetUniformLocation(pointProgram_, "uProjection");

    glGenVertexArrays(1, &pointVao_);
    glGenBuffers(1, &pointVbo_);

    glBindVertexArray(pointVao_);
    glBindBuffer(GL_ARRAY_BUFFER, pointVbo_);
    glBufferData(GL_ARRAY_BUFFER, 0, nullptr, GL_DYNAMIC_DRAW);

    constexpr GLsizei stride = static_cast<GLsizei>(7 * sizeof(float));
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, stride, reinterpret_cast<void*>(0));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 4, GL_FLOAT, GL_FALSE, stride, reinterpret_cast<void*>(2 * sizeof(float)));
    glEnableVertexAttribArray(2);
    glVertexAttribPointer(2, 1, GL_FLOAT, GL_FALSE, stride, reinterpret_cast<void*>(6 * sizeof(float)));

    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);
    return true;
}

bool GlRenderer::InitializeLinePipeline(std::string* errorOut) {
    lineProgram_ = CreateProgram(kLineVertexShader, kLineFragmentShader, errorOut);
    if (lineProgram_ == 0) {
        return false;
    }

    lineProjectionLocation_ = glGetUniformLocation(lineProgram_, "uProjection");

    glGenVertexArrays(1, &lineVao_);
    glGenBuffers(1, &lineVbo_);

    glBindVertexArray(lineVao_);
    glBindBuffer(GL_ARRAY_BUFFER, lineVbo_);
    glBufferData(GL_ARRAY_BUFFER, 0, nullptr, GL_DYNAMIC_DRAW);

    constexpr GLsizei stride = static_cast<GLsizei>(6 * sizeof(float));
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, stride, reinterpret_cast<void*>(0));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 4, GL_FLOAT, GL_FALSE, stride, reinterpret_cast<void*>(2 * sizeof(float)));

    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);
    return true;
}

void GlRenderer::Shutdown() {
    if (pointVbo_ != 0) {
        glDeleteBuffers(1, &pointVbo_);
        pointVbo_ = 0;
    }
    if (pointVao_ != 0) {
        glDeleteVertexArrays(1, &pointVao_);
        pointVao_ = 0;
    }
    if (pointProgram_ != 0) {
        glDeleteProgram(pointProgram_);
        pointProgram_ = 0;
    }

    if (lineVbo_ != 0) {
        glDeleteBuffers(1, &lineVbo_);
        lineVbo_ = 0;
    }
    if (lineVao_ != 0) {
        glDeleteVertexArrays(1, &lineVao_);
        lineVao_ = 0;
    }
    if (lineProgram_ != 0) {
        glDeleteProgram(lineProgram_);
        lineProgram_ = 0;
    }

    grainVertexCount_ = 0;
    lineBatches_.clear();
}

void GlRenderer::UploadFrame(const FrameOutput& frame) {
    std::vector<float> grainVertices;
    grainVertices.reserve(frame.grain.size() * 7);
    for (const GrainSprite& sprite : frame.grain) {
        PushVertex(&grainVertices, sprite.position_px, sprite.color);
        grainVertices.push_back(sprite.size_px);
    }
    grainVertexCount_ = static_cast<int>(frame.grain.size());

    glBindBuffer(GL_ARRAY_BUFFER, pointVbo_);
    glBufferData(
        GL_ARRAY_BUFFER,
        static_cast<GLsizeiptr>(grainVertices.size() * sizeof(float)),
        grainVertices.data(),
        GL_DYNAMIC_DRAW);

    // One batch per polyline so each keeps its own line width.
    std::vector<float> lineVertices;
    lineBatches_.clear();
    for (const Polyline& polyline : frame.polylines) {
        LineBatch batch;
        batch.width_px = polyline.width_px;
        batch.firstVertex = static_cast<int>(lineVertices.size() / 6);
        PushPolyline(&lineVertices, polyline);
        batch.vertexCount = static_cast<int>(lineVertices.size() / 6) - batch.firstVertex;
        if (batch.vertexCount > 0) {
            lineBatches_.push_back(batch);
        }
    }

    glBindBuffer(GL_ARRAY_BUFFER, lineVbo_);
    glBufferData(
        GL_ARRAY_BUFFER,
        static_cast<GLsizeiptr>(lineVertices.size() * sizeof(float)),
        lineVertices.data(),
        GL_DYNAMIC_DRAW);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
}

void GlRenderer::Draw(const Mat4& screenProjection) const {
    glUseProgram(pointProgram_);
    glUniformMatrix4fv(pointProjectionLocation_, 1, GL_FALSE, screenProjection.Data());
    glBindVertexArray(pointVao_);
    glDrawArrays(GL_POINTS, 0, grainVertexCount_);
    glBindVertexArray(0);

    glUseProgram(lineProgram_);
    glUniformMatrix4fv(lineProjectionLocation_, 1, GL_FALSE, screenProjection.Data());
    glBindVertexArray(lineVao_);
    for (const LineBatch& batch : lineBatches_) {
        glLineWidth(batch.width_px);
        glDrawArrays(GL_LINES, batch.firstVertex, batch.vertexCount);
    }
    glBindVertexArray(0);

    glUseProgram(0);
}

}  // namespace bubble::viewer
