// File: evaluation/evaluation_engine.cpp

#include "evaluation/evaluation_engine.hpp"

#include <cmath>
#include <stdexcept>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"

namespace evaluation {

    namespace {
        void addToBucket(BucketStats &bucket, const EvaluationItem &item) {
            ++bucket.count;
            bucket.correct += item.correct() ? 1 : 0;
            bucket.mean_confidence += item.confidence;
            bucket.mean_risk_score += item.risk_score;
        }

        void finalizeBucket(BucketStats &bucket) {
            if (bucket.count == 0) {
                return;
            }
            const auto count = static_cast<double>(bucket.count);
            bucket.accuracy = static_cast<double>(bucket.correct) / count;
            bucket.mean_confidence /= count;
            bucket.mean_risk_score /= count;
        }
    } // namespace

    EvaluationEngine::EvaluationEngine(std::shared_ptr<processing::image::LeafFeatureExtractor> extractor,
                                       std::shared_ptr<retrieval::SimilarityIndexClient> index,
                                       std::shared_ptr<diagnosis::DiagnosisEngine> diagnosis,
                                       std::shared_ptr<risk::RiskPredictor> predictor, const Config &config) :
        extractor_(std::move(extractor)), index_(std::move(index)), diagnosis_(std::move(diagnosis)),
        predictor_(std::move(predictor)), config_(config) {
        if (!extractor_ || !index_ || !diagnosis_ || !predictor_) {
            throw std::invalid_argument("EvaluationEngine requires extractor, index, diagnosis and risk components.");
        }
        if (config_.k == 0) {
            LOG_WARN("Evaluation k of 0 is invalid, using the index default {}.", index_->defaultK());
            config_.k = index_->defaultK();
        }
    }

    EvaluationItem EvaluationEngine::evaluateSample(const LabeledSample &sample) const {
        const types::FeatureVector features = extractor_->extract(sample.image);
        const types::NeighborMatches neighbors = index_->query(features, config_.k, sample.id);
        const types::DiagnosisResult result = diagnosis_->diagnose(neighbors);
        const risk::RiskAssessment assessment = predictor_->assess(risk::RiskInputs::from(result, features));

        EvaluationItem item;
        item.id = sample.id;
        item.predicted = config_.collapse_to_binary ? result.category.toBinary() : result.category;
        item.truth = config_.collapse_to_binary ? sample.category.toBinary() : sample.category;
        item.confidence = result.confidence;
        item.risk_level = assessment.level;
        item.risk_score = assessment.score;
        return item;
    }

    EvaluationReport EvaluationEngine::evaluate(const std::vector<LabeledSample> &samples) {
        EvaluationReport report;
        LOG_INFO("Evaluating {} sample(s) with k = {}.", samples.size(), config_.k);

        for (std::size_t i = 0; i < samples.size(); ++i) {
            const auto &sample = samples[i];
            try {
                report.items.push_back(evaluateSample(sample));
            } catch (const common::InvalidImageError &e) {
                LOG_WARN("Skipping '{}': {}", sample.id, e.what());
                report.skipped.push_back({sample.id, e.what()});
            } catch (const common::DegenerateFeatureError &e) {
                LOG_WARN("Skipping '{}': {}", sample.id, e.what());
                report.skipped.push_back({sample.id, e.what()});
            } catch (const common::NoNeighborsError &e) {
                LOG_WARN("Skipping '{}': {}", sample.id, e.what());
                report.skipped.push_back({sample.id, e.what()});
            }

            if (stop_requested_.load() && i + 1 < samples.size()) {
                LOG_WARN("Evaluation stopped after {} of {} sample(s).", i + 1, samples.size());
                report.terminated_early = true;
                break;
            }
        }

        stop_requested_.store(false);

        aggregate(report);
        LOG_INFO("Evaluation finished: {} evaluated, {} skipped, accuracy {:.2f}%.", report.items.size(),
                 report.skipped.size(), 100.0 * report.aggregate.accuracy);
        return report;
    }

    void EvaluationEngine::aggregate(EvaluationReport &report) const {
        for (const auto level: {risk::RiskLevel::LOW, risk::RiskLevel::MEDIUM, risk::RiskLevel::HIGH}) {
            report.risk_buckets[level] = BucketStats{};
        }

        double confidence_sum = 0.0;
        double risk_sum = 0.0;
        for (const auto &item: report.items) {
            report.confusion.add(item.truth, item.predicted);
            addToBucket(report.risk_buckets[item.risk_level], item);

            if (item.confidence >= config_.band_high) {
                addToBucket(report.confidence_bands.high, item);
            } else if (item.confidence >= config_.band_medium) {
                addToBucket(report.confidence_bands.medium, item);
            } else {
                addToBucket(report.confidence_bands.low, item);
            }

            confidence_sum += item.confidence;
            risk_sum += item.risk_score;
        }

        for (auto &[level, bucket]: report.risk_buckets) {
            finalizeBucket(bucket);
        }
        finalizeBucket(report.confidence_bands.high);
        finalizeBucket(report.confidence_bands.medium);
        finalizeBucket(report.confidence_bands.low);

        report.per_class = computeClassMetrics(report.confusion);
        report.aggregate = computeAggregateMetrics(report.confusion, report.per_class);

        if (report.items.empty()) {
            return;
        }
        const auto count = static_cast<double>(report.items.size());
        report.confidence_mean = confidence_sum / count;
        report.mean_risk_score = risk_sum / count;

        double squared = 0.0;
        for (const auto &item: report.items) {
            squared += (item.confidence - report.confidence_mean) * (item.confidence - report.confidence_mean);
        }
        report.confidence_std = std::sqrt(squared / count);
    }

} // namespace evaluation
