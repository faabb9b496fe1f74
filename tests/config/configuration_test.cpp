// File: tests/config/configuration_test.cpp

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

#include "config/configuration.hpp"
#include "diagnosis/diagnosis_engine.hpp"
#include "retrieval/similarity_index.hpp"
#include "risk/risk_predictor.hpp"

namespace {
    std::filesystem::path writeTempFile(const std::string &name, const std::string &content) {
        const auto path = std::filesystem::temp_directory_path() / name;
        std::ofstream(path) << content;
        return path;
    }
} // namespace

// Nested YAML maps are flattened into dotted keys
TEST(ConfigurationTest, LoadsNestedKeys) {
    const auto path = writeTempFile("leafscan_config_test.yaml", "risk:\n"
                                                                 "  thresholds:\n"
                                                                 "    confidence_low: 55.5\n"
                                                                 "retrieval:\n"
                                                                 "  k: 7\n"
                                                                 "evaluation:\n"
                                                                 "  collapse_to_binary: true\n");
    const config::Configuration configuration(path.string());

    EXPECT_TRUE(configuration.contains("risk.thresholds.confidence_low"));
    EXPECT_DOUBLE_EQ(configuration.get("risk.thresholds.confidence_low", 60.0), 55.5);
    EXPECT_EQ(configuration.get<int>("retrieval.k", 5), 7);
    EXPECT_TRUE(configuration.get("evaluation.collapse_to_binary", false));
    EXPECT_FALSE(configuration.get<double>("risk.levels.high").has_value());
    EXPECT_DOUBLE_EQ(configuration.get("risk.levels.high", 0.7), 0.7);

    std::filesystem::remove(path);
}

// A missing file leaves every key at its default
TEST(ConfigurationTest, MissingFileUsesDefaults) {
    const config::Configuration configuration("does/not/exist/leafscan.yaml");

    EXPECT_FALSE(configuration.contains("retrieval.k"));
    EXPECT_EQ(configuration.get<int>("retrieval.k", 5), 5);
    EXPECT_EQ(configuration.get("logging.level", "debug"), "debug");
}

// A malformed document is an error
TEST(ConfigurationTest, InvalidYamlThrows) {
    const auto path = writeTempFile("leafscan_config_invalid.yaml", "risk: [unclosed\n");

    EXPECT_THROW(config::Configuration{path.string()}, std::runtime_error);

    std::filesystem::remove(path);
}

// A value of the wrong type falls back to the default
TEST(ConfigurationTest, TypeMismatchFallsBack) {
    const auto path = writeTempFile("leafscan_config_types.yaml", "retrieval:\n  k: many\n");
    const config::Configuration configuration(path.string());

    EXPECT_EQ(configuration.get<int>("retrieval.k", 5), 5);

    std::filesystem::remove(path);
}

// Values set at runtime are seen by component configuration structs
TEST(ConfigurationTest, OverridesReachComponents) {
    config::set("retrieval.k", 3);
    config::set("risk.thresholds.similarity_gap_max", 0.5);
    config::set("diagnosis.status.reliable", 90.0);

    EXPECT_EQ(retrieval::SimilarityIndexClient::Config().k, 3u);
    EXPECT_DOUBLE_EQ(risk::RiskPredictor::Config().similarity_gap_max, 0.5);
    EXPECT_EQ(diagnosis::DiagnosisEngine().classify(85.0), types::DiagnosisStatus::Probable);

    config::erase("retrieval.k");
    config::erase("risk.thresholds.similarity_gap_max");
    config::erase("diagnosis.status.reliable");

    EXPECT_EQ(retrieval::SimilarityIndexClient::Config().k, 5u);
    EXPECT_DOUBLE_EQ(risk::RiskPredictor::Config().similarity_gap_max, 0.35);
}

// Change callbacks observe set()
TEST(ConfigurationTest, ChangeCallback) {
    config::Configuration configuration("does/not/exist/leafscan.yaml");
    std::string changed_key;
    double changed_value = 0.0;
    configuration.registerChangeCallback([&](const std::string &key, const YAML::Node &value) {
        changed_key = key;
        changed_value = value.as<double>();
    });

    EXPECT_TRUE(configuration.set("risk.levels.medium", 0.45));
    EXPECT_EQ(changed_key, "risk.levels.medium");
    EXPECT_DOUBLE_EQ(changed_value, 0.45);
    EXPECT_TRUE(configuration.erase("risk.levels.medium"));
    EXPECT_FALSE(configuration.contains("risk.levels.medium"));
}
