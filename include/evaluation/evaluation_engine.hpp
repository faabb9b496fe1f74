// File: evaluation/evaluation_engine.hpp

#ifndef EVALUATION_ENGINE_HPP
#define EVALUATION_ENGINE_HPP

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "config/configuration.hpp"
#include "diagnosis/diagnosis_engine.hpp"
#include "evaluation/metrics.hpp"
#include "processing/image/leaf_feature_extractor.hpp"
#include "retrieval/similarity_index.hpp"
#include "risk/risk_predictor.hpp"
#include "types/category.hpp"

namespace evaluation {

    struct LabeledSample {
        std::string id;
        types::Category category;
        cv::Mat image;
    };

    struct EvaluationItem {
        std::string id;
        types::Category predicted;
        types::Category truth;
        double confidence{};
        risk::RiskLevel risk_level{risk::RiskLevel::LOW};
        double risk_score{};

        [[nodiscard]] bool correct() const { return predicted == truth; }
    };

    struct SkippedItem {
        std::string id;
        std::string reason;
    };

    // Accuracy table row for a group of items (a risk level or a confidence band).
    struct BucketStats {
        std::size_t count{};
        std::size_t correct{};
        double accuracy{};
        double mean_confidence{};
        double mean_risk_score{};
    };

    struct ConfidenceBands {
        BucketStats high;   // confidence >= 80
        BucketStats medium; // 60 <= confidence < 80
        BucketStats low;    // confidence < 60
    };

    struct EvaluationReport {
        std::vector<EvaluationItem> items;
        std::vector<SkippedItem> skipped;
        ConfusionMatrix confusion;
        std::vector<ClassMetrics> per_class;
        AggregateMetrics aggregate;
        std::map<risk::RiskLevel, BucketStats> risk_buckets; // every level present, possibly empty
        ConfidenceBands confidence_bands;
        double confidence_mean{};
        double confidence_std{};
        double mean_risk_score{};
        bool terminated_early{};
    };

    /*
     * Runs extraction, leakage-free retrieval, diagnosis and risk scoring over labeled samples.
     * Per-item image failures are recorded as skipped, store failures propagate.
     */
    class EvaluationEngine {
    public:
        struct Config {
            bool collapse_to_binary; // score on Healthy/Diseased instead of the raw labels
            std::size_t k;
            double band_high;
            double band_medium;

            Config() :
                collapse_to_binary(config::get("evaluation.collapse_to_binary", false)),
                k(config::get<std::size_t>("retrieval.k", 5)),
                band_high(config::get("evaluation.confidence_bands.high", 80.0)),
                band_medium(config::get("evaluation.confidence_bands.medium", 60.0)) {}
        };

        EvaluationEngine(std::shared_ptr<processing::image::LeafFeatureExtractor> extractor,
                         std::shared_ptr<retrieval::SimilarityIndexClient> index,
                         std::shared_ptr<diagnosis::DiagnosisEngine> diagnosis,
                         std::shared_ptr<risk::RiskPredictor> predictor, const Config &config = Config());

        [[nodiscard]] EvaluationReport evaluate(const std::vector<LabeledSample> &samples);

        // Thread-safe; the running evaluation stops after its current item. A request made before
        // evaluate() applies to the next run, which stops after its first item. The flag clears when a run returns.
        void requestStop() noexcept { stop_requested_.store(true); }

        [[nodiscard]] bool stopRequested() const noexcept { return stop_requested_.load(); }

    private:
        std::shared_ptr<processing::image::LeafFeatureExtractor> extractor_;
        std::shared_ptr<retrieval::SimilarityIndexClient> index_;
        std::shared_ptr<diagnosis::DiagnosisEngine> diagnosis_;
        std::shared_ptr<risk::RiskPredictor> predictor_;
        Config config_;
        std::atomic<bool> stop_requested_{false};

        [[nodiscard]] EvaluationItem evaluateSample(const LabeledSample &sample) const;

        void aggregate(EvaluationReport &report) const;
    };

} // namespace evaluation

#endif // EVALUATION_ENGINE_HPP
