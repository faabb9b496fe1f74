// File: executor.hpp

#ifndef EXECUTOR_HPP
#define EXECUTOR_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "common/io/dataset.hpp"
#include "diagnosis/diagnosis_engine.hpp"
#include "evaluation/evaluation_engine.hpp"
#include "processing/image/leaf_feature_extractor.hpp"
#include "retrieval/similarity_index.hpp"
#include "risk/risk_predictor.hpp"

/*
 * Command-line driver: indexes a reference dataset, then diagnoses a single image or evaluates
 * a labeled test dataset and logs the outcome.
 */
class Executor {
public:
    struct Options {
        std::string reference_dir;
        std::optional<std::string> query_image;
        std::optional<std::string> test_dir;
        std::optional<std::size_t> k;
    };

    struct IndexSummary {
        std::size_t indexed{};
        std::size_t rejected{};
    };

    // Returns the process exit code.
    static int execute(const Options &options);

    Executor(const Executor &) = delete;
    Executor &operator=(const Executor &) = delete;
    Executor(Executor &&) = delete;
    Executor &operator=(Executor &&) = delete;
    ~Executor() = default;

    Executor() = delete;

private:
    static std::shared_ptr<processing::image::LeafFeatureExtractor> extractor_;
    static std::shared_ptr<retrieval::SimilarityIndexClient> index_;
    static std::shared_ptr<diagnosis::DiagnosisEngine> diagnosis_;
    static std::shared_ptr<risk::RiskPredictor> predictor_;
    static common::io::IndexedPaths indexed_paths_;

    static void initialize(const Options &options);

    static IndexSummary indexReferences(const std::string &reference_dir);

    static void diagnose(const std::string &image_path);

    static void evaluate(const std::string &test_dir);
};

#endif // EXECUTOR_HPP
