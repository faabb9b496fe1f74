// File: diagnosis/diagnosis_engine.cpp

#include "diagnosis/diagnosis_engine.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

#include "common/logging/logger.hpp"

namespace diagnosis {

    namespace {
        // Confidence is reported with micro-percent resolution so threshold checks are stable.
        double roundConfidence(const double percentage) { return std::round(percentage * 1e6) / 1e6; }
    } // namespace

    DiagnosisEngine::DiagnosisEngine(const Config &config) : config_(config) {
        if (!(config_.distance_epsilon > 0.0)) {
            throw std::invalid_argument("diagnosis.distance_epsilon must be positive");
        }
        if (config_.tie_tolerance < 0.0) {
            throw std::invalid_argument("diagnosis.tie_tolerance must not be negative");
        }
    }

    types::DiagnosisStatus DiagnosisEngine::classify(const double confidence) const noexcept {
        if (confidence >= config_.reliable_confidence) {
            return types::DiagnosisStatus::Reliable;
        }
        if (confidence >= config_.probable_confidence) {
            return types::DiagnosisStatus::Probable;
        }
        return types::DiagnosisStatus::Uncertain;
    }

    types::DiagnosisResult DiagnosisEngine::diagnose(const types::NeighborMatches &neighbors) const {
        if (neighbors.empty()) {
            LOG_ERROR("Cannot diagnose without neighbors.");
            throw std::invalid_argument("Cannot diagnose without neighbors");
        }

        struct Tally {
            double weight = 0.0;
            std::size_t count = 0;
        };
        std::map<types::Category, Tally> tallies;

        double total_weight = 0.0;
        double distance_sum = 0.0;
        double max_distance = 0.0;
        const types::NeighborMatch *nearest = &neighbors.front();

        for (const auto &neighbor: neighbors) {
            if (!std::isfinite(neighbor.distance) || neighbor.distance < 0.0) {
                LOG_ERROR("Neighbor '{}' has invalid distance {}.", neighbor.id, neighbor.distance);
                throw std::invalid_argument(
                        fmt::format("Neighbor '{}' has invalid distance {}", neighbor.id, neighbor.distance));
            }

            const double weight = 1.0 / (neighbor.distance + config_.distance_epsilon);
            auto &tally = tallies[neighbor.category];
            tally.weight += weight;
            ++tally.count;
            total_weight += weight;

            distance_sum += neighbor.distance;
            max_distance = std::max(max_distance, neighbor.distance);
            if (neighbor.distance < nearest->distance) {
                nearest = &neighbor;
            }
        }

        double max_weight = 0.0;
        for (const auto &[category, tally]: tallies) {
            max_weight = std::max(max_weight, tally.weight);
        }

        std::vector<types::Category> tied;
        for (const auto &[category, tally]: tallies) {
            if (tally.weight >= max_weight * (1.0 - config_.tie_tolerance)) {
                tied.push_back(category);
            }
        }

        types::DiagnosisResult result;
        if (tied.size() == 1) {
            result.category = tied.front();
        } else if (std::ranges::find(tied, nearest->category) != tied.end()) {
            result.category = nearest->category;
            result.decided_by_tie_break = true;
        } else {
            result.category = tied.front(); // smallest label, map order
            result.decided_by_tie_break = true;
        }

        for (const auto &[category, tally]: tallies) {
            result.votes.push_back({category, tally.weight, tally.weight / total_weight, tally.count});
        }
        std::ranges::stable_sort(result.votes, std::ranges::greater{}, &types::CategoryVote::weight);

        const double winner_share = tallies.at(result.category).weight / total_weight;
        if (tallies.size() > 1 && tied.size() == tallies.size()) {
            // Maximum-entropy tie: report the lowest competing share
            const auto lowest = std::ranges::min_element(result.votes, {}, &types::CategoryVote::share);
            result.confidence = roundConfidence(100.0 * lowest->share);
        } else {
            result.confidence = roundConfidence(100.0 * winner_share);
        }
        result.confidence = std::clamp(result.confidence, 0.0, 100.0);

        const auto count = static_cast<double>(neighbors.size());
        result.agreement = static_cast<double>(tallies.at(result.category).count) / count;
        result.nearest_distance = nearest->distance;
        result.mean_distance = distance_sum / count;
        result.max_distance = max_distance;
        result.status = classify(result.confidence);
        result.neighbors = neighbors;

        LOG_DEBUG("Diagnosis: {} ({:.2f}% confidence, agreement {:.2f}, {} categories, {})", result.category,
                  result.confidence, result.agreement, tallies.size(), result.status);
        return result;
    }

} // namespace diagnosis
