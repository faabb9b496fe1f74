// File: risk/risk_predictor.hpp

#ifndef RISK_PREDICTOR_HPP
#define RISK_PREDICTOR_HPP

#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "config/configuration.hpp"
#include "types/diagnosis_result.hpp"
#include "types/feature_vector.hpp"

namespace risk {

    enum class RiskLevel { LOW, MEDIUM, HIGH };

    [[nodiscard]] constexpr std::string_view toString(const RiskLevel level) noexcept {
        switch (level) {
            case RiskLevel::LOW:
                return "LOW";
            case RiskLevel::MEDIUM:
                return "MEDIUM";
            case RiskLevel::HIGH:
                return "HIGH";
        }
        return "UNKNOWN";
    }

    struct RiskFactor {
        std::string code;
        std::string explanation;
    };

    struct RiskAssessment {
        RiskLevel level{RiskLevel::LOW};
        double score{};                  // in [0, 1]
        std::vector<RiskFactor> factors; // in evaluation order
    };

    // Signals the predictor scores. Distances are the neighbor distances of the diagnosis.
    struct RiskInputs {
        double confidence{};
        std::vector<double> distances;
        double agreement{1.0};
        double feature_variability{};

        // Derives the inputs from a diagnosis. Feature variability is the population standard
        // deviation of the shape-band distances between the query and each live neighbor record.
        [[nodiscard]] static RiskInputs from(const types::DiagnosisResult &result, const types::FeatureVector &query);
    };

    /*
     * Deterministic revocation-risk scoring. Each triggered condition adds a fixed delta:
     *   confidence < confidence_low                  +0.40  low confidence
     *   confidence_low <= conf < confidence_moderate +0.20  moderate confidence
     *   agreement <= agreement_min                   +0.25  low category consistency
     *   max - min distance > similarity_gap_max      +0.20  high similarity variance
     *   feature variability > feature_variability_max +0.15 high feature variability
     * The sum is clipped to [0, 1] and mapped to a level by level_medium and level_high.
     */
    class RiskPredictor {
    public:
        struct Config {
            double confidence_low;
            double confidence_moderate;
            double agreement_min;
            double similarity_gap_max;
            double feature_variability_max;
            double level_medium;
            double level_high;

            Config() :
                confidence_low(config::get("risk.thresholds.confidence_low", 60.0)),
                confidence_moderate(config::get("risk.thresholds.confidence_moderate", 80.0)),
                agreement_min(config::get("risk.thresholds.agreement_min", 0.6)),
                similarity_gap_max(config::get("risk.thresholds.similarity_gap_max", 0.35)),
                feature_variability_max(config::get("risk.thresholds.feature_variability_max", 0.25)),
                level_medium(config::get("risk.levels.medium", 0.4)),
                level_high(config::get("risk.levels.high", 0.7)) {}
        };

        static constexpr double kLowConfidenceDelta = 0.40;
        static constexpr double kModerateConfidenceDelta = 0.20;
        static constexpr double kLowConsistencyDelta = 0.25;
        static constexpr double kSimilarityVarianceDelta = 0.20;
        static constexpr double kFeatureVariabilityDelta = 0.15;

        explicit RiskPredictor(const Config &config = Config());

        virtual ~RiskPredictor() = default;

        [[nodiscard]] virtual RiskAssessment assess(const RiskInputs &inputs) const;

        [[nodiscard]] RiskAssessment assess(const types::DiagnosisResult &result,
                                            const types::FeatureVector &query) const {
            return assess(RiskInputs::from(result, query));
        }

        [[nodiscard]] RiskLevel levelFor(double score) const noexcept;

        [[nodiscard]] const Config &config() const noexcept { return config_; }

    private:
        Config config_;
    };

} // namespace risk

template<>
struct fmt::formatter<risk::RiskLevel> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const risk::RiskLevel level, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(risk::toString(level), ctx);
    }
};

#endif // RISK_PREDICTOR_HPP
