// File: processing/image/leaf_feature_extractor.hpp

#ifndef LEAF_FEATURE_EXTRACTOR_HPP
#define LEAF_FEATURE_EXTRACTOR_HPP

#include <memory>
#include <opencv2/core.hpp>

#include "config/configuration.hpp"
#include "processing/image/feature/extractor.hpp"
#include "types/feature_vector.hpp"

namespace processing::image {

    /*
     * Image -> 106-value FeatureVector (color, texture, shape bands in that order).
     *
     * Accepts 8-bit images with at least three channels (BGR order; a fourth channel is
     * ignored) whose width and height are both >= min_image_size. Anything else raises
     * common::InvalidImageError. A non-finite result raises common::DegenerateFeatureError.
     */
    class LeafFeatureExtractor {
    public:
        struct Config {
            int min_image_size;

            Config() : min_image_size(config::get("feature.min_image_size", 32)) {}
        };

        explicit LeafFeatureExtractor(const Config &config = Config());

        LeafFeatureExtractor(std::shared_ptr<FeatureExtractor> color, std::shared_ptr<FeatureExtractor> texture,
                             std::shared_ptr<FeatureExtractor> shape, const Config &config = Config());

        virtual ~LeafFeatureExtractor() = default;

        [[nodiscard]] virtual types::FeatureVector extract(const cv::Mat &image) const;

        [[nodiscard]] int minImageSize() const noexcept { return config_.min_image_size; }

    private:
        Config config_;
        std::shared_ptr<FeatureExtractor> color_;
        std::shared_ptr<FeatureExtractor> texture_;
        std::shared_ptr<FeatureExtractor> shape_;

        // Validates the input and returns a 3-channel BGR view of it.
        [[nodiscard]] cv::Mat prepare(const cv::Mat &image) const;
    };

} // namespace processing::image

#endif // LEAF_FEATURE_EXTRACTOR_HPP
