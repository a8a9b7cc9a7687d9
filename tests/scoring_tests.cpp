#include <vector>

#include "gtest/gtest.h"
#include "bubble/scoring.hpp"
#include "validation_harness.hpp"

namespace {

using bubble::AnswerMap;
using bubble::ParticleSpecies;

bubble::Track StraightTrack(ParticleSpecies species) {
    bubble::Track track;
    track.species = species;
    track.momentum = 1.0;
    track.shape = bubble::MakeStraight(bubble::Vec2(0.5, 0.5), 0.0, 0.1);
    return track;
}

// Display order after the scripted shuffle: 1 p, 2 e⁺, 3 γ, 4 e⁻.
bubble::Numbering FourParticleNumbering() {
    const std::vector<bubble::Track> tracks{
        StraightTrack(ParticleSpecies::Proton),
        StraightTrack(ParticleSpecies::Photon),
        StraightTrack(ParticleSpecies::Electron),
        StraightTrack(ParticleSpecies::Positron),
    };
    bubble_validation::ScriptedRandomSource rng({0.0});
    return bubble::BuildNumbering(tracks, rng);
}

}  // namespace

TEST(ScoringTest, PerfectAnswersScoreHundred) {
    const bubble::Numbering numbering = FourParticleNumbering();
    const AnswerMap answers{{1, "p"}, {2, "e⁺"}, {3, "γ"}, {4, "e⁻"}};
    const bubble::ScoreBreakdown breakdown = bubble::ScoreAnswers(numbering, answers, 0);
    EXPECT_EQ(breakdown.correct, 4);
    EXPECT_EQ(breakdown.total, 4);
    EXPECT_TRUE(breakdown.neutrinoGuessCorrect);
    EXPECT_NEAR(breakdown.score, 100.0, 1.0e-9);
}

TEST(ScoringTest, EmptyAnswersScoreZero) {
    const bubble::Numbering numbering = FourParticleNumbering();
    EXPECT_DOUBLE_EQ(bubble::Score(numbering, {}, bubble::ParseNeutrinoGuess("")), 0.0);
}

TEST(ScoringTest, WrongNeutrinoCountLeavesPerParticleCredit) {
    const bubble::Numbering numbering = FourParticleNumbering();
    const AnswerMap answers{{1, "p"}, {2, "e⁻"}, {3, "γ"}, {4, "e⁺"}};
    for (const int guess : {1, 2, 7}) {
        const bubble::ScoreBreakdown breakdown = bubble::ScoreAnswers(numbering, answers, guess);
        EXPECT_EQ(breakdown.correct, 2);
        EXPECT_FALSE(breakdown.neutrinoGuessCorrect);
        EXPECT_NEAR(breakdown.score, 2.0 * 100.0 / 6.0, 1.0e-9);
    }
}

TEST(ScoringTest, NeutrinoCountAloneEarnsRemainingBudget) {
    const bubble::Numbering numbering = FourParticleNumbering();
    EXPECT_NEAR(bubble::Score(numbering, {}, 0), 100.0 - (100.0 / 6.0), 1.0e-9);
}

TEST(ScoringTest, UnknownIndicesAndSymbolsEarnNothing) {
    const bubble::Numbering numbering = FourParticleNumbering();
    const AnswerMap answers{{0, "p"}, {9, "γ"}, {1, "proton"}, {3, "γ"}};
    const bubble::ScoreBreakdown breakdown = bubble::ScoreAnswers(numbering, answers, std::nullopt);
    EXPECT_EQ(breakdown.correct, 1);
    EXPECT_NEAR(breakdown.score, 100.0 / 6.0, 1.0e-9);
}

TEST(ScoringTest, EmptyEventScoresZero) {
    const bubble::Numbering empty;
    const bubble::ScoreBreakdown breakdown = bubble::ScoreAnswers(empty, {{1, "p"}}, 0);
    EXPECT_EQ(breakdown.total, 0);
    EXPECT_DOUBLE_EQ(breakdown.score, 0.0);
}

TEST(ScoringTest, ParsesNeutrinoGuessText) {
    EXPECT_EQ(bubble::ParseNeutrinoGuess("3"), 3);
    EXPECT_EQ(bubble::ParseNeutrinoGuess("  0 "), 0);
    EXPECT_FALSE(bubble::ParseNeutrinoGuess("").has_value());
    EXPECT_FALSE(bubble::ParseNeutrinoGuess("   ").has_value());
    EXPECT_FALSE(bubble::ParseNeutrinoGuess("two").has_value());
    EXPECT_FALSE(bubble::ParseNeutrinoGuess("2.5").has_value());
    EXPECT_FALSE(bubble::ParseNeutrinoGuess("-1").has_value());
}
