// File: executor.cpp

#include "executor.hpp"

#include <exception>
#include <vector>

#include "common/errors.hpp"
#include "common/io/dataset.hpp"
#include "common/io/image.hpp"
#include "common/logging/logger.hpp"
#include "retrieval/in_memory_vector_store.hpp"

std::shared_ptr<processing::image::LeafFeatureExtractor> Executor::extractor_;
std::shared_ptr<retrieval::SimilarityIndexClient> Executor::index_;
std::shared_ptr<diagnosis::DiagnosisEngine> Executor::diagnosis_;
std::shared_ptr<risk::RiskPredictor> Executor::predictor_;
common::io::IndexedPaths Executor::indexed_paths_;

void Executor::initialize(const Options &options) {
    LOG_INFO("Initializing executor.");
    if (options.k) {
        config::set("retrieval.k", *options.k);
    }
    config::show();

    extractor_ = std::make_shared<processing::image::LeafFeatureExtractor>();
    index_ = std::make_shared<retrieval::SimilarityIndexClient>(std::make_shared<retrieval::InMemoryVectorStore>());
    diagnosis_ = std::make_shared<diagnosis::DiagnosisEngine>();
    predictor_ = std::make_shared<risk::RiskPredictor>();
}

Executor::IndexSummary Executor::indexReferences(const std::string &reference_dir) {
    IndexSummary summary;
    for (const auto &entry: common::io::listDataset(reference_dir)) {
        try {
            const cv::Mat image = common::io::image::readImage(entry.path.string());
            index_->index(types::ImageRecord(entry.id, entry.category, extractor_->extract(image),
                                             entry.path.string()));
            indexed_paths_[common::io::canonicalPath(entry.path)] = entry.id;
            ++summary.indexed;
        } catch (const common::InvalidImageError &e) {
            LOG_WARN("Reference image '{}' rejected: {}", entry.id, e.what());
            ++summary.rejected;
        } catch (const common::DegenerateFeatureError &e) {
            LOG_WARN("Reference image '{}' rejected: {}", entry.id, e.what());
            ++summary.rejected;
        }
    }

    const auto stats = index_->stats();
    LOG_INFO("Indexed {} reference image(s), rejected {}.", summary.indexed, summary.rejected);
    for (const auto &[category, count]: stats.categories) {
        LOG_INFO("  {}: {}", category, count);
    }
    return summary;
}

void Executor::diagnose(const std::string &image_path) {
    const cv::Mat image = common::io::image::readImage(image_path);
    const types::FeatureVector features = extractor_->extract(image);
    const types::DiagnosisResult result = diagnosis_->diagnose(index_->query(features));
    const risk::RiskAssessment assessment = predictor_->assess(result, features);

    LOG_INFO("Diagnosis for '{}': {} ({:.2f}% confidence, {})", image_path, result.category, result.confidence,
             result.status);
    for (const auto &vote: result.votes) {
        LOG_INFO("  {}: {:.2f}% of the vote from {} neighbor(s)", vote.category, 100.0 * vote.share, vote.count);
    }
    for (const auto &neighbor: result.neighbors) {
        LOG_DEBUG("  neighbor {} [{}] at distance {:.4f}", neighbor.id, neighbor.category, neighbor.distance);
    }

    LOG_INFO("Revocation risk: {} (score {:.2f})", assessment.level, assessment.score);
    for (const auto &factor: assessment.factors) {
        LOG_INFO("  {}: {}", factor.code, factor.explanation);
    }
}

void Executor::evaluate(const std::string &test_dir) {
    std::vector<evaluation::LabeledSample> samples;
    std::size_t unreadable = 0;
    for (const auto &entry: common::io::listDataset(test_dir)) {
        try {
            samples.push_back({common::io::sampleId(entry, indexed_paths_), entry.category,
                               common::io::image::readImage(entry.path.string())});
        } catch (const common::InvalidImageError &e) {
            LOG_WARN("Test image '{}' unreadable: {}", entry.id, e.what());
            ++unreadable;
        }
    }

    evaluation::EvaluationEngine engine(extractor_, index_, diagnosis_, predictor_);
    const evaluation::EvaluationReport report = engine.evaluate(samples);

    LOG_INFO("Evaluated {} image(s), skipped {}, unreadable {}.", report.items.size(), report.skipped.size(),
             unreadable);
    LOG_INFO("Accuracy {:.2f}%, macro F1 {:.3f}, weighted F1 {:.3f}", 100.0 * report.aggregate.accuracy,
             report.aggregate.f1, report.aggregate.weighted_f1);
    for (const auto &metrics: report.per_class) {
        LOG_INFO("  {}: precision {:.3f}, recall {:.3f}, F1 {:.3f}, support {}{}", metrics.category,
                 metrics.precision, metrics.recall, metrics.f1, metrics.support,
                 metrics.unsupported ? " (unsupported)" : "");
    }
    LOG_INFO("Confidence {:.2f} +/- {:.2f}, mean risk score {:.3f}", report.confidence_mean, report.confidence_std,
             report.mean_risk_score);
    for (const auto &[level, bucket]: report.risk_buckets) {
        LOG_INFO("  risk {}: {} item(s), accuracy {:.2f}%, mean confidence {:.2f}", level, bucket.count,
                 100.0 * bucket.accuracy, bucket.mean_confidence);
    }
    const auto &bands = report.confidence_bands;
    LOG_INFO("Confidence bands: high {} ({:.2f}%), medium {} ({:.2f}%), low {} ({:.2f}%)", bands.high.count,
             100.0 * bands.high.accuracy, bands.medium.count, 100.0 * bands.medium.accuracy, bands.low.count,
             100.0 * bands.low.accuracy);
}

int Executor::execute(const Options &options) {
    try {
        initialize(options);

        const IndexSummary summary = indexReferences(options.reference_dir);
        if (summary.indexed == 0) {
            LOG_ERROR("No usable reference images in '{}'.", options.reference_dir);
            return 1;
        }

        if (options.query_image) {
            diagnose(*options.query_image);
        } else if (options.test_dir) {
            evaluate(*options.test_dir);
        }
        return 0;
    } catch (const common::InvalidImageError &e) {
        LOG_ERROR("Invalid image: {}", e.what());
    } catch (const common::EmptyIndexError &e) {
        LOG_ERROR("Index is empty: {}", e.what());
    } catch (const common::StorageError &e) {
        LOG_ERROR("Storage failure: {}", e.what());
    } catch (const std::exception &e) {
        LOG_CRITICAL("Fatal error: {}", e.what());
    }
    return 1;
}
