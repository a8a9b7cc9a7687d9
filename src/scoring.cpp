#include "bubble/scoring.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace bubble {

std::optional<int> ParseNeutrinoGuess(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    int value = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    const auto result = std::from_chars(begin, end, value);
    if (result.ec != std::errc() || result.ptr != end || value < 0) {
        return std::nullopt;
    }
    return value;
}

ScoreBreakdown ScoreAnswers(const Numbering& numbering, const AnswerMap& answers, std::optional<int> neutrinoGuess) {
    ScoreBreakdown breakdown;
    breakdown.total = numbering.Total();
    if (breakdown.total == 0) {
        return breakdown;
    }

    for (const auto& [displayIndex, symbol] : answers) {
        const NumberedParticle* particle = numbering.ByDisplayIndex(displayIndex);
        if (particle != nullptr && symbol == SymbolOf(particle->species)) {
            ++breakdown.correct;
        }
    }
    breakdown.neutrinoGuessCorrect = neutrinoGuess.has_value() && *neutrinoGuess == numbering.NeutrinoCount();

    const double perParticle = 100.0 / static_cast<double>(breakdown.total + 2);
    double score = static_cast<double>(breakdown.correct) * perParticle;
    if (breakdown.neutrinoGuessCorrect) {
        score += 100.0 - perParticle;
    }
    breakdown.score = std::clamp(score, 0.0, 100.0);
    return breakdown;
}

}  // namespace bubble
