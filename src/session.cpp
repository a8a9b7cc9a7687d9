#include "bubble/session.hpp"

#include <utility>

#include "bubble/event_generator.hpp"

namespace bubble {

ChamberSession::ChamberSession(std::optional<uint32_t> seed) {
    auto rng = std::make_unique<MersenneRandomSource>(seed);
    activeSeed_ = rng->ActiveSeed();
    rng_ = std::move(rng);
}

ChamberSession::ChamberSession(std::unique_ptr<IRandomSource> rng)
    : rng_((rng != nullptr) ? std::move(rng) : std::make_unique<MersenneRandomSource>()) {}

void ChamberSession::GenerateNewEvent(Scenario scenario) {
    GeneratorConfig config;
    config.scenario = scenario;
    GenerateNewEvent(config);
}

void ChamberSession::GenerateNewEvent(const GeneratorConfig& config) {
    // Build completely before publishing so no partial event is observable.
    std::shared_ptr<const Event> next = std::make_shared<Event>(GenerateEvent(config, *rng_));
    event_ = std::move(next);
    ++eventsGenerated_;

    mode_ = RevealMode::Unlabeled;
    formVisible_ = false;
    answers_.clear();
    neutrinoGuessText_.clear();
    camera_.Reset();
}

void ChamberSession::RevealIdentities() {
    if (event_ == nullptr) {
        return;
    }
    mode_ = RevealMode::Identified;
}

void ChamberSession::ShowIdentificationForm() {
    if (event_ == nullptr) {
        return;
    }
    formVisible_ = true;
    if (mode_ == RevealMode::Unlabeled) {
        mode_ = RevealMode::Numbered;
    }
}

bool ChamberSession::SetAnswer(int displayIndex, const std::string& symbol, std::string* errorOut) {
    if (event_ == nullptr) {
        if (errorOut != nullptr) {
            *errorOut = "No event has been generated";
        }
        return false;
    }
    if (displayIndex < 1 || displayIndex > event_->numbering.Total()) {
        if (errorOut != nullptr) {
            *errorOut = "Particle number " + std::to_string(displayIndex) + " is out of range 1.." +
                        std::to_string(event_->numbering.Total());
        }
        return false;
    }
    if (symbol.empty()) {
        answers_.erase(displayIndex);
        return true;
    }
    if (!SpeciesFromSymbol(symbol).has_value()) {
        if (errorOut != nullptr) {
            *errorOut = "Unknown particle symbol: " + symbol;
        }
        return false;
    }
    answers_[displayIndex] = symbol;
    return true;
}

void ChamberSession::SetNeutrinoGuess(const std::string& text) {
    neutrinoGuessText_ = text;
}

double ChamberSession::Score() const {
    return ScoreDetails().score;
}

ScoreBreakdown ChamberSession::ScoreDetails() const {
    if (event_ == nullptr) {
        return ScoreBreakdown{};
    }
    return ScoreAnswers(event_->numbering, answers_, NeutrinoGuess());
}

}  // namespace bubble
