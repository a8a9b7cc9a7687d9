#include "bubble/viewer/viewer_app.hpp"

#include <array>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>

#include <glad/glad.h>
#include <GLFW/glfw3.h>

#include "imgui.h"
#include "backends/imgui_impl_glfw.h"
#include "backends/imgui_impl_opengl3.h"

#include "bubble/viewer/camera.hpp"
#include "bubble/viewer/gl_renderer.hpp"

namespace bubble::viewer {
namespace {

constexpr const char* kSymbolFontPath = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
constexpr float kFontSize_px = 16.0f;
constexpr float kBadgeRadius_px = 10.0f;

constexpr std::array<Scenario, 5> kScenarios = {
    Scenario::ProtonProton,
    Scenario::NeutronDecay,
    Scenario::MuonDecay,
    Scenario::PionDecay,
    Scenario::PhotonPairProduction,
};
constexpr std::array<const char*, 5> kScenarioLabels = {
    "Proton-proton collision",
    "Neutron decay",
    "Muon decay",
    "Pion decay",
    "Photon pair production",
};

// Choices offered for every numbered particle in the identification form.
constexpr std::array<ParticleSpecies, 10> kAnswerSpecies = {
    ParticleSpecies::Proton,
    ParticleSpecies::Neutron,
    ParticleSpecies::PionPlus,
    ParticleSpecies::PionMinus,
    ParticleSpecies::PionZero,
    ParticleSpecies::MuonPlus,
    ParticleSpecies::MuonMinus,
    ParticleSpecies::Electron,
    ParticleSpecies::Positron,
    ParticleSpecies::Photon,
};

struct WindowInputState {
    double scrollDeltaY = 0.0;
    double panX_px = 0.0;
    double panY_px = 0.0;
    int zoomSteps = 0;
    bool resetView = false;
};

void ScrollCallback(GLFWwindow* window, double /*xoffset*/, double yoffset) {
    WindowInputState* input = static_cast<WindowInputState*>(glfwGetWindowUserPointer(window));
    if (input != nullptr) {
        input->scrollDeltaY += yoffset;
    }
}

void KeyCallback(GLFWwindow* window, int key, int /*scancode*/, int action, int /*mods*/) {
    if (action != GLFW_PRESS && action != GLFW_REPEAT) {
        return;
    }
    if (ImGui::GetIO().WantCaptureKeyboard) {
        return;
    }
    WindowInputState* input = static_cast<WindowInputState*>(glfwGetWindowUserPointer(window));
    if (input == nullptr) {
        return;
    }
    switch (key) {
        case GLFW_KEY_LEFT:
            input->panX_px -= constants::kPanStep_px;
            break;
        case GLFW_KEY_RIGHT:
            input->panX_px += constants::kPanStep_px;
            break;
        case GLFW_KEY_UP:
            input->panY_px -= constants::kPanStep_px;
            break;
        case GLFW_KEY_DOWN:
            input->panY_px += constants::kPanStep_px;
            break;
        case GLFW_KEY_EQUAL:
        case GLFW_KEY_KP_ADD:
            ++input->zoomSteps;
            break;
        case GLFW_KEY_MINUS:
        case GLFW_KEY_KP_SUBTRACT:
            --input->zoomSteps;
            break;
        case GLFW_KEY_0:
            input->resetView = true;
            break;
        default:
            break;
    }
}

// Default ImGui font has no Greek or superscript glyphs.
void LoadSymbolFont() {
    ImGuiIO& io = ImGui::GetIO();
    if (!std::filesystem::exists(kSymbolFontPath)) {
        std::cerr << "Warning: " << kSymbolFontPath << " not found, particle symbols may not render.\n";
        io.Fonts->AddFontDefault();
        return;
    }

    static ImVector<ImWchar> ranges;
    ImFontGlyphRangesBuilder builder;
    builder.AddRanges(io.Fonts->GetGlyphRangesDefault());
    builder.AddRanges(io.Fonts->GetGlyphRangesGreek());
    for (std::size_t i = 0; i <= static_cast<std::size_t>(ParticleSpecies::MuonAntineutrino); ++i) {
        const ParticleInfo& info = Describe(static_cast<ParticleSpecies>(i));
        builder.AddText(info.symbol);
        builder.AddText(info.name);
    }
    builder.BuildRanges(&ranges);
    if (io.Fonts->AddFontFromFileTTF(kSymbolFontPath, kFontSize_px, nullptr, ranges.Data) == nullptr) {
        std::cerr << "Warning: failed to load " << kSymbolFontPath << ", using default font.\n";
        io.Fonts->AddFontDefault();
    }
}

ImU32 ToImColor(const Rgba& color) {
    return ImGui::ColorConvertFloat4ToU32(ImVec4(color.r, color.g, color.b, color.a));
}

bool SameRequest(const RenderRequest& a, const RenderRequest& b) {
    const bool sameView = a.view.scale == b.view.scale && a.view.panX == b.view.panX && a.view.panY == b.view.panY;
    const bool sameViewport = a.viewport.width == b.viewport.width && a.viewport.height == b.viewport.height;
    bool samePointer = a.pointer_px.has_value() == b.pointer_px.has_value();
    if (samePointer && a.pointer_px.has_value()) {
        samePointer = a.pointer_px->x == b.pointer_px->x && a.pointer_px->y == b.pointer_px->y;
    }
    return sameView && sameViewport && samePointer && a.mode == b.mode;
}

bool PointerOnLabel(const FrameOutput& frame, RevealMode mode, double x, double y) {
    if (mode != RevealMode::Identified) {
        return false;
    }
    for (const Label& label : frame.labels) {
        if (Vec2::Distance(label.position_px, Vec2(x, y)) <= constants::kLabelHitRadius_px) {
            return true;
        }
    }
    return false;
}

}  // namespace

ViewerApp::ViewerApp(ViewerCliOptions options)
    : options_(std::move(options)), session_(options_.config.seed) {}

bool ViewerApp::RefreshFrame() {
    const std::shared_ptr<const Event> event = session_.CurrentEvent();
    if (event == nullptr) {
        return false;
    }

    RenderRequest request;
    request.view = session_.Camera().Transform();
    request.viewport = session_.Camera().ViewportSize();
    request.mode = session_.Mode();
    request.pointer_px = hoverPointer_px_;

    if (frameValid_ && frameEvent_ == event && SameRequest(request, frameRequest_)) {
        return false;
    }
    frame_ = RenderEvent(*event, request);
    frameEvent_ = event;
    frameRequest_ = request;
    frameValid_ = true;
    return true;
}

void ViewerApp::DrawControls() {
    static int scenarioIndex = 0;
    static int pionChargeIndex = 0;
    static bool initialized = false;
    if (!initialized) {
        for (std::size_t i = 0; i < kScenarios.size(); ++i) {
            if (kScenarios[i] == options_.config.scenario) {
                scenarioIndex = static_cast<int>(i);
            }
        }
        if (options_.config.pionCharge.has_value()) {
            pionChargeIndex = (*options_.config.pionCharge < 0) ? 1 : ((*options_.config.pionCharge > 0) ? 2 : 3);
        }
        initialized = true;
    }

    if (ImGui::Begin("Bubble Chamber")) {
        ImGui::Combo("Scenario", &scenarioIndex, kScenarioLabels.data(), static_cast<int>(kScenarioLabels.size()));
        const Scenario scenario = kScenarios[static_cast<std::size_t>(scenarioIndex)];
        if (scenario == Scenario::PionDecay) {
            const char* chargeLabels[] = {"Random", "π⁻", "π⁺", "π⁰"};
            ImGui::Combo("Pion", &pionChargeIndex, chargeLabels, 4);
        }

        if (ImGui::Button("New Event")) {
            GeneratorConfig config;
            config.scenario = scenario;
            if (scenario == Scenario::PionDecay && pionChargeIndex > 0) {
                config.pionCharge = (pionChargeIndex == 1) ? -1 : ((pionChargeIndex == 2) ? 1 : 0);
            }
            session_.GenerateNewEvent(config);
            hoverThrottle_.Reset();
            hoverPointer_px_.reset();
        }
        ImGui::SameLine();
        if (ImGui::Button("Identify Particles")) {
            session_.ShowIdentificationForm();
        }
        ImGui::SameLine();
        if (ImGui::Button("Reveal")) {
            session_.RevealIdentities();
        }

        PanZoomCamera& camera = session_.Camera();
        if (ImGui::Button("Zoom +")) {
            camera.ZoomIn();
        }
        ImGui::SameLine();
        if (ImGui::Button("Zoom -")) {
            camera.ZoomOut();
        }
        ImGui::SameLine();
        if (ImGui::Button("Reset View")) {
            camera.Reset();
        }
        ImGui::Text("Zoom: %.2fx", camera.Transform().scale);

        const std::shared_ptr<const Event> event = session_.CurrentEvent();
        if (event != nullptr) {
            ImGui::Separator();
            ImGui::Text("Scenario: %s", ScenarioName(event->scenario));
            ImGui::Text("Seed: %llu  Event #%llu",
                        static_cast<unsigned long long>(session_.ActiveSeed()),
                        static_cast<unsigned long long>(session_.EventsGenerated()));
            ImGui::Text("Particles to identify: %d", event->numbering.Total());
        }
        ImGui::TextUnformatted("Drag to pan, wheel or +/- to zoom, arrows to step, 0 to reset.");
    }
    ImGui::End();
}

void ViewerApp::DrawIdentificationForm() {
    const std::shared_ptr<const Event> event = session_.CurrentEvent();
    if (event == nullptr || !session_.FormVisible()) {
        return;
    }

    if (ImGui::Begin("Identify Particles")) {
        const Numbering& numbering = event->numbering;
        const std::optional<int> hint = numbering.FormHintDisplayIndex();
        if (hint.has_value()) {
            ImGui::TextWrapped("Hint: particle %d is an electron or a positron; tight spirals mean light leptons.", *hint);
        }

        const bool revealed = session_.Mode() == RevealMode::Identified;
        for (int display = 1; display <= numbering.Total(); ++display) {
            const AnswerMap& answers = session_.Answers();
            const auto existing = answers.find(display);
            const char* preview = (existing != answers.end()) ? existing->second.c_str() : "?";

            ImGui::PushID(display);
            const std::string label = "Particle " + std::to_string(display);
            if (ImGui::BeginCombo(label.c_str(), preview)) {
                if (ImGui::Selectable("?", existing == answers.end())) {
                    std::string error;
                    if (!session_.SetAnswer(display, "", &error)) {
                        std::cerr << error << "\n";
                    }
                }
                for (const ParticleSpecies species : kAnswerSpecies) {
                    const char* symbol = SymbolOf(species);
                    const bool selected = existing != answers.end() && existing->second == symbol;
                    if (ImGui::Selectable(Describe(species).name, selected)) {
                        std::string error;
                        if (!session_.SetAnswer(display, symbol, &error)) {
                            std::cerr << error << "\n";
                        }
                    }
                }
                ImGui::EndCombo();
            }
            if (revealed) {
                ImGui::SameLine();
                ImGui::Text("-> %s", numbering.SymbolForDisplayIndex(display));
            }
            ImGui::PopID();
        }

        static std::array<char, 16> guessBuffer{};
        if (session_.NeutrinoGuessText().empty()) {
            guessBuffer.fill('\0');
        }
        if (ImGui::InputText("Neutrinos produced", guessBuffer.data(), guessBuffer.size())) {
            session_.SetNeutrinoGuess(std::string(guessBuffer.data()));
        }

        if (!revealed) {
            if (ImGui::Button("Submit")) {
                session_.RevealIdentities();
            }
        } else {
            const ScoreBreakdown score = session_.ScoreDetails();
            ImGui::Separator();
            ImGui::Text("Correct: %d / %d", score.correct, score.total);
            ImGui::Text("Neutrinos: %d (%s)", numbering.NeutrinoCount(), score.neutrinoGuessCorrect ? "correct" : "missed");
            ImGui::Text("Score: %.1f", score.score);
        }
    }
    ImGui::End();
}

void ViewerApp::DrawLabels() const {
    ImDrawList* drawList = ImGui::GetBackgroundDrawList();
    for (const Label& label : frame_.labels) {
        const ImVec2 center(static_cast<float>(label.position_px.x), static_cast<float>(label.position_px.y));
        const ImVec2 textSize = ImGui::CalcTextSize(label.text.c_str());
        const ImVec2 textPos(center.x - (textSize.x * 0.5f), center.y - (textSize.y * 0.5f));
        if (label.style == LabelStyle::Badge) {
            drawList->AddCircleFilled(center, kBadgeRadius_px, IM_COL32(20, 24, 32, 220));
            drawList->AddCircle(center, kBadgeRadius_px, ToImColor(label.color));
        }
        drawList->AddText(textPos, ToImColor(label.color), label.text.c_str());
    }
}

void ViewerApp::DrawHoverTooltip() const {
    if (!frame_.hover.has_value() || session_.Mode() == RevealMode::Unlabeled) {
        return;
    }
    const HoverTarget& hover = *frame_.hover;
    ImGui::BeginTooltip();
    if (session_.Mode() == RevealMode::Identified) {
        const ParticleInfo& info = Describe(hover.species);
        ImGui::TextUnformatted(info.name);
        ImGui::Text("Class: %s  Charge: %+d", info.particleClass, info.charge);
        ImGui::TextUnformatted(info.description);
    } else if (hover.displayIndex.has_value()) {
        ImGui::Text("Particle %d", *hover.displayIndex);
    } else {
        ImGui::TextUnformatted("Unnumbered track");
    }
    ImGui::EndTooltip();
}

int ViewerApp::Run() {
    if (!glfwInit()) {
        std::cerr << "Failed to initialize GLFW\n";
        return 1;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    GLFWwindow* window = glfwCreateWindow(1280, 800, "Bubble Chamber", nullptr, nullptr);
    if (window == nullptr) {
        glfwTerminate();
        std::cerr << "Failed to create GLFW window\n";
        return 1;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    if (!gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress))) {
        std::cerr << "Failed to initialize GLAD\n";
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    LoadSymbolFont();

    WindowInputState inputState;
    glfwSetWindowUserPointer(window, &inputState);
    glfwSetScrollCallback(window, ScrollCallback);
    glfwSetKeyCallback(window, KeyCallback);

    // Installed after our callbacks so the backend chains to them.
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init("#version 330");

    GlRenderer renderer;
    std::string rendererError;
    if (!renderer.Initialize(&rendererError)) {
        std::cerr << "Failed to initialize renderer: " << rendererError << "\n";
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    session_.GenerateNewEvent(options_.config);
    std::cout << "VIEWER | scenario=" << ScenarioName(options_.config.scenario) << " seed=" << session_.ActiveSeed()
              << "\n";

    bool leftDownPrev = false;

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        int windowW = 0;
        int windowH = 0;
        glfwGetWindowSize(window, &windowW, &windowH);
        int frameBufferW = 0;
        int frameBufferH = 0;
        glfwGetFramebufferSize(window, &frameBufferW, &frameBufferH);
        glViewport(0, 0, frameBufferW, frameBufferH);

        PanZoomCamera& camera = session_.Camera();
        camera.SetViewport(windowW, windowH);

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        const ImGuiIO& io = ImGui::GetIO();
        double mouseX = 0.0;
        double mouseY = 0.0;
        glfwGetCursorPos(window, &mouseX, &mouseY);
        const bool leftDown = glfwGetMouseButton(window, GLFW_MOUSE_BUTTON_LEFT) == GLFW_PRESS;

        if (!io.WantCaptureMouse) {
            if (leftDown && !leftDownPrev) {
                camera.BeginDrag(mouseX, mouseY, PointerOnLabel(frame_, session_.Mode(), mouseX, mouseY));
            }
            if (!leftDown && leftDownPrev) {
                camera.EndDrag();
            }
            camera.OnCursorMove(mouseX, mouseY);
            if (inputState.scrollDeltaY != 0.0) {
                camera.OnScroll(inputState.scrollDeltaY);
                inputState.scrollDeltaY = 0.0;
            }
            if (hoverThrottle_.ShouldUpdate(HoverThrottle::Clock::now())) {
                hoverPointer_px_ = Vec2(mouseX, mouseY);
            }
        } else {
            camera.EndDrag();
            hoverPointer_px_.reset();
        }
        leftDownPrev = leftDown;

        if (inputState.panX_px != 0.0 || inputState.panY_px != 0.0) {
            camera.PanBy(inputState.panX_px, inputState.panY_px);
            inputState.panX_px = 0.0;
            inputState.panY_px = 0.0;
        }
        for (; inputState.zoomSteps > 0; --inputState.zoomSteps) {
            camera.ZoomIn();
        }
        for (; inputState.zoomSteps < 0; ++inputState.zoomSteps) {
            camera.ZoomOut();
        }
        if (inputState.resetView) {
            camera.Reset();
            inputState.resetView = false;
        }

        DrawControls();
        DrawIdentificationForm();

        if (RefreshFrame()) {
            renderer.UploadFrame(frame_);
        }
        DrawLabels();
        if (!io.WantCaptureMouse) {
            DrawHoverTooltip();
        }

        glClearColor(0.02f, 0.03f, 0.06f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        renderer.Draw(camera.ScreenProjectionMatrix());

        ImGui::Render();
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        glfwSwapBuffers(window);
    }

    renderer.Shutdown();
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}

}  // namespace bubble::viewer
