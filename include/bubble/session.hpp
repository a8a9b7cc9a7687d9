#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "bubble/event.hpp"
#include "bubble/random_source.hpp"
#include "bubble/renderer.hpp"
#include "bubble/scoring.hpp"
#include "bubble/viewer/camera.hpp"

namespace bubble {

// Owns the current immutable event plus everything the user has done to it.
// A new event replaces all of it at once.
class ChamberSession {
public:
    explicit ChamberSession(std::optional<uint32_t> seed = std::nullopt);
    explicit ChamberSession(std::unique_ptr<IRandomSource> rng);

    void GenerateNewEvent(Scenario scenario);
    void GenerateNewEvent(const GeneratorConfig& config);

    void RevealIdentities();
    void ShowIdentificationForm();

    // Empty symbol clears the answer for displayIndex.
    bool SetAnswer(int displayIndex, const std::string& symbol, std::string* errorOut);
    void SetNeutrinoGuess(const std::string& text);

    double Score() const;
    ScoreBreakdown ScoreDetails() const;

    std::shared_ptr<const Event> CurrentEvent() const { return event_; }
    RevealMode Mode() const { return mode_; }
    bool FormVisible() const { return formVisible_; }
    const AnswerMap& Answers() const { return answers_; }
    const std::string& NeutrinoGuessText() const { return neutrinoGuessText_; }
    std::optional<int> NeutrinoGuess() const { return ParseNeutrinoGuess(neutrinoGuessText_); }

    viewer::PanZoomCamera& Camera() { return camera_; }
    const viewer::PanZoomCamera& Camera() const { return camera_; }

    uint64_t ActiveSeed() const { return activeSeed_; }
    uint64_t EventsGenerated() const { return eventsGenerated_; }

private:
    std::unique_ptr<IRandomSource> rng_;
    uint64_t activeSeed_ = 0;
    uint64_t eventsGenerated_ = 0;

    std::shared_ptr<const Event> event_;
    RevealMode mode_ = RevealMode::Unlabeled;
    bool formVisible_ = false;
    AnswerMap answers_;
    std::string neutrinoGuessText_;
    viewer::PanZoomCamera camera_;
};

}  // namespace bubble
