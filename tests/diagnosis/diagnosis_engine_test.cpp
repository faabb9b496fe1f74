// File: tests/diagnosis/diagnosis_engine_test.cpp

#include <gtest/gtest.h>
#include <cmath>
#include <limits>

#include "fixtures.hpp"
#include "diagnosis/diagnosis_engine.hpp"

using diagnosis::DiagnosisEngine;
using fixtures::match;
using types::Category;
using types::DiagnosisStatus;

class DiagnosisEngineTest : public ::testing::Test {
protected:
    DiagnosisEngine engine;
};

// Unanimous neighbors give full confidence and agreement
TEST_F(DiagnosisEngineTest, UnanimousVote) {
    const auto result = engine.diagnose({match("a", "Healthy", 0.1), match("b", "Healthy", 0.2),
                                         match("c", "Healthy", 0.3), match("d", "Healthy", 0.4),
                                         match("e", "Healthy", 0.5)});

    EXPECT_EQ(result.category, Category::healthy());
    EXPECT_DOUBLE_EQ(result.confidence, 100.0);
    EXPECT_DOUBLE_EQ(result.agreement, 1.0);
    EXPECT_EQ(result.status, DiagnosisStatus::Reliable);
    EXPECT_FALSE(result.decided_by_tie_break);
    EXPECT_EQ(result.neighbors.size(), 5u);
    EXPECT_DOUBLE_EQ(result.nearest_distance, 0.1);
    EXPECT_DOUBLE_EQ(result.max_distance, 0.5);
    EXPECT_NEAR(result.mean_distance, 0.3, 1e-12);
}

// Close neighbors outweigh a distant majority
TEST_F(DiagnosisEngineTest, InverseDistanceWeighting) {
    const auto result = engine.diagnose({match("h1", "Healthy", 0.1), match("h2", "Healthy", 0.1),
                                         match("d1", "Diseased", 1.0), match("d2", "Diseased", 1.0),
                                         match("d3", "Diseased", 1.0)});

    EXPECT_EQ(result.category, Category::healthy());
    EXPECT_DOUBLE_EQ(result.agreement, 0.4);

    const double healthy = 2.0 / (0.1 + 1e-6);
    const double diseased = 3.0 / (1.0 + 1e-6);
    EXPECT_NEAR(result.confidence, 100.0 * healthy / (healthy + diseased), 1e-6);

    ASSERT_EQ(result.votes.size(), 2u);
    EXPECT_EQ(result.votes[0].category, Category::healthy());
    EXPECT_EQ(result.votes[0].count, 2u);
    EXPECT_EQ(result.votes[1].count, 3u);
    EXPECT_NEAR(result.votes[0].share + result.votes[1].share, 1.0, 1e-12);
}

// A 3-2 split at equal distances gives 60% confidence
TEST_F(DiagnosisEngineTest, ThreeTwoSplit) {
    const auto result = engine.diagnose({match("d1", "Diseased", 0.2), match("h1", "Healthy", 0.2),
                                         match("d2", "Diseased", 0.2), match("h2", "Healthy", 0.2),
                                         match("d3", "Diseased", 0.2)});

    EXPECT_EQ(result.category, Category::diseased());
    EXPECT_DOUBLE_EQ(result.confidence, 60.0);
    EXPECT_DOUBLE_EQ(result.agreement, 0.6);
    EXPECT_EQ(result.status, DiagnosisStatus::Probable);
}

// An exact tie goes to the nearest neighbor's category at the lowest share
TEST_F(DiagnosisEngineTest, TieGoesToNearestNeighbor) {
    const auto result = engine.diagnose({match("d", "Diseased", 0.5), match("h", "Healthy", 0.5)});

    EXPECT_EQ(result.category, Category::diseased()); // first of the equally near neighbors
    EXPECT_TRUE(result.decided_by_tie_break);
    EXPECT_DOUBLE_EQ(result.confidence, 50.0);
    EXPECT_EQ(result.status, DiagnosisStatus::Probable);

    const auto swapped = engine.diagnose({match("h", "Healthy", 0.5), match("d", "Diseased", 0.5)});
    EXPECT_EQ(swapped.category, Category::healthy());
}

// A tie that excludes the nearest neighbor's category goes to the smallest label
TEST_F(DiagnosisEngineTest, TieWithoutNearestGoesToSmallestLabel) {
    const auto result = engine.diagnose({match("z", "Zeta", 0.1), match("b1", "Beta", 0.15),
                                         match("a1", "Alpha", 0.15), match("b2", "Beta", 0.15),
                                         match("a2", "Alpha", 0.15), match("b3", "Beta", 0.15),
                                         match("a3", "Alpha", 0.15)});

    EXPECT_EQ(result.category, Category("Alpha"));
    EXPECT_TRUE(result.decided_by_tie_break);
    EXPECT_NEAR(result.confidence, 40.0, 1e-3);
}

// A zero-distance neighbor dominates the vote
TEST_F(DiagnosisEngineTest, ExactMatchDominates) {
    const auto result = engine.diagnose({match("x", "Diseased", 0.0), match("h1", "Healthy", 0.1),
                                         match("h2", "Healthy", 0.1), match("h3", "Healthy", 0.1),
                                         match("h4", "Healthy", 0.1)});

    EXPECT_EQ(result.category, Category::diseased());
    EXPECT_GT(result.confidence, 99.0);
    EXPECT_LE(result.confidence, 100.0);
    EXPECT_DOUBLE_EQ(result.agreement, 0.2);
}

// Empty input and invalid distances are rejected
TEST_F(DiagnosisEngineTest, RejectsInvalidInput) {
    EXPECT_THROW((void) engine.diagnose({}), std::invalid_argument);
    EXPECT_THROW((void) engine.diagnose({match("a", "Healthy", -0.1)}), std::invalid_argument);
    EXPECT_THROW((void) engine.diagnose({match("a", "Healthy", std::numeric_limits<double>::infinity())}),
                 std::invalid_argument);
}

// Status boundaries are inclusive at 80 and 50
TEST_F(DiagnosisEngineTest, StatusBoundaries) {
    EXPECT_EQ(engine.classify(80.0), DiagnosisStatus::Reliable);
    EXPECT_EQ(engine.classify(79.999), DiagnosisStatus::Probable);
    EXPECT_EQ(engine.classify(50.0), DiagnosisStatus::Probable);
    EXPECT_EQ(engine.classify(49.999), DiagnosisStatus::Uncertain);
}

// Confidence is rounded to micro-percent resolution
TEST_F(DiagnosisEngineTest, ConfidenceRounding) {
    const auto result = engine.diagnose({match("a", "A", 1.0), match("b", "B", 2.0), match("c", "B", 4.0)});

    EXPECT_NEAR(result.confidence * 1e6, std::round(result.confidence * 1e6), 1e-6);
}

// Epsilon must be positive
TEST(DiagnosisEngineConfigTest, RejectsNonPositiveEpsilon) {
    DiagnosisEngine::Config config;
    config.distance_epsilon = 0.0;

    EXPECT_THROW(DiagnosisEngine{config}, std::invalid_argument);
}
