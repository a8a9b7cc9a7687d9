#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "bubble/numbering.hpp"

namespace bubble {

// User identifications keyed by shuffled display index; values are symbols
// such as "π⁺" or "e⁻".
using AnswerMap = std::map<int, std::string>;

struct ScoreBreakdown {
    int correct = 0;
    int total = 0;
    bool neutrinoGuessCorrect = false;
    double score = 0.0;
};

// Empty or non-numeric text is no guess.
std::optional<int> ParseNeutrinoGuess(std::string_view text);

ScoreBreakdown ScoreAnswers(const Numbering& numbering, const AnswerMap& answers, std::optional<int> neutrinoGuess);

inline double Score(const Numbering& numbering, const AnswerMap& answers, std::optional<int> neutrinoGuess) {
    return ScoreAnswers(numbering, answers, neutrinoGuess).score;
}

}  // namespace bubble
