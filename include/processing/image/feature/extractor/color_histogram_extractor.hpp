// File: processing/image/feature/extractor/color_histogram_extractor.hpp

#ifndef COLOR_HISTOGRAM_EXTRACTOR_HPP
#define COLOR_HISTOGRAM_EXTRACTOR_HPP

#include <opencv2/imgproc.hpp>

#include "config/configuration.hpp"
#include "processing/image/feature/extractor.hpp"
#include "types/feature_vector.hpp"

namespace processing::image {

    // HSV histograms, 32 bins per channel, each channel normalized to sum to 1.
    class ColorHistogramExtractor final : public FeatureExtractor {
    public:
        struct Config {
            // Pixels are sampled on a grid with this stride; 1 uses every pixel.
            int sample_step;

            Config() : sample_step(config::get("feature.color.sample_step", 1)) {}
        };

        explicit ColorHistogramExtractor(const Config &config = Config());

        [[nodiscard]] Eigen::VectorXd extract(const cv::Mat &image) const override;

        [[nodiscard]] Eigen::Index size() const noexcept override { return types::FeatureVector::kColorSize; }

        [[nodiscard]] std::string_view name() const noexcept override { return "color"; }

    private:
        Config config_;

        [[nodiscard]] cv::Mat samplingMask(const cv::Size &size) const;
    };

} // namespace processing::image

#endif // COLOR_HISTOGRAM_EXTRACTOR_HPP
