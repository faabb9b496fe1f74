// File: risk/risk_predictor.cpp

#include "risk/risk_predictor.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "common/logging/logger.hpp"

namespace risk {

    namespace {
        constexpr double kLevelTolerance = 1e-9;
    } // namespace

    RiskInputs RiskInputs::from(const types::DiagnosisResult &result, const types::FeatureVector &query) {
        RiskInputs inputs;
        inputs.confidence = result.confidence;
        inputs.agreement = result.agreement;
        inputs.distances.reserve(result.neighbors.size());

        std::vector<double> shape_distances;
        shape_distances.reserve(result.neighbors.size());
        for (const auto &neighbor: result.neighbors) {
            inputs.distances.push_back(neighbor.distance);
            if (const auto record = neighbor.record.lock()) {
                shape_distances.push_back(query.shapeDistance(record->features()));
            } else {
                LOG_DEBUG("Neighbor '{}' expired, left out of feature variability.", neighbor.id);
            }
        }

        if (!shape_distances.empty()) {
            const Eigen::Map<const Eigen::ArrayXd> values(shape_distances.data(),
                                                          static_cast<Eigen::Index>(shape_distances.size()));
            const double mean = values.mean();
            inputs.feature_variability = std::sqrt((values - mean).square().mean());
        }
        return inputs;
    }

    RiskPredictor::RiskPredictor(const Config &config) : config_(config) {
        if (config_.confidence_low > config_.confidence_moderate) {
            throw std::invalid_argument(fmt::format("risk confidence_low {} exceeds confidence_moderate {}",
                                                    config_.confidence_low, config_.confidence_moderate));
        }
        if (config_.level_medium > config_.level_high) {
            throw std::invalid_argument(fmt::format("risk level bound medium {} exceeds high {}",
                                                    config_.level_medium, config_.level_high));
        }
    }

    RiskLevel RiskPredictor::levelFor(const double score) const noexcept {
        if (score >= config_.level_high - kLevelTolerance) {
            return RiskLevel::HIGH;
        }
        if (score >= config_.level_medium - kLevelTolerance) {
            return RiskLevel::MEDIUM;
        }
        return RiskLevel::LOW;
    }

    RiskAssessment RiskPredictor::assess(const RiskInputs &inputs) const {
        RiskAssessment assessment;
        double score = 0.0;

        if (inputs.confidence < config_.confidence_low) {
            score += kLowConfidenceDelta;
            assessment.factors.push_back(
                    {"low confidence", fmt::format("confidence {:.2f}% is below {:.0f}%", inputs.confidence,
                                                   config_.confidence_low)});
        } else if (inputs.confidence < config_.confidence_moderate) {
            score += kModerateConfidenceDelta;
            assessment.factors.push_back({"moderate confidence",
                                          fmt::format("confidence {:.2f}% is below {:.0f}%", inputs.confidence,
                                                      config_.confidence_moderate)});
        }

        if (inputs.agreement <= config_.agreement_min + kLevelTolerance) {
            score += kLowConsistencyDelta;
            assessment.factors.push_back({"low category consistency",
                                          fmt::format("only {:.0f}% of neighbors agree with the diagnosis",
                                                      100.0 * inputs.agreement)});
        }

        if (!inputs.distances.empty()) {
            const auto [min_it, max_it] = std::ranges::minmax_element(inputs.distances);
            const double gap = *max_it - *min_it;
            if (gap > config_.similarity_gap_max) {
                score += kSimilarityVarianceDelta;
                assessment.factors.push_back(
                        {"high similarity variance", fmt::format("neighbor distances span {:.3f} (limit {:.3f})",
                                                                 gap, config_.similarity_gap_max)});
            }
        }

        if (inputs.feature_variability > config_.feature_variability_max) {
            score += kFeatureVariabilityDelta;
            assessment.factors.push_back({"high feature variability",
                                          fmt::format("shape variability {:.3f} exceeds {:.3f}",
                                                      inputs.feature_variability,
                                                      config_.feature_variability_max)});
        }

        assessment.score = std::clamp(score, 0.0, 1.0);
        assessment.level = levelFor(assessment.score);

        LOG_DEBUG("Risk {} (score {:.2f}, {} factor(s))", assessment.level, assessment.score,
                  assessment.factors.size());
        return assessment;
    }

} // namespace risk
