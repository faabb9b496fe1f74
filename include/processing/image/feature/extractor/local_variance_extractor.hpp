// File: processing/image/feature/extractor/local_variance_extractor.hpp

#ifndef LOCAL_VARIANCE_EXTRACTOR_HPP
#define LOCAL_VARIANCE_EXTRACTOR_HPP

#include <array>
#include <opencv2/imgproc.hpp>

#include "processing/image/feature/extractor.hpp"
#include "types/feature_vector.hpp"

namespace processing::image {

    /*
     * Texture band. For each window size the local variance of grayscale intensity (scaled to
     * [0, 1]) is computed as E[x^2] - E[x]^2 over a normalized box filter with reflected
     * borders, then reduced to its mean and standard deviation.
     * Output order: mean3, std3, mean5, std5, mean7, std7.
     */
    class LocalVarianceExtractor final : public FeatureExtractor {
    public:
        static constexpr std::array<int, 3> kWindowSizes = {3, 5, 7};

        [[nodiscard]] Eigen::VectorXd extract(const cv::Mat &image) const override;

        [[nodiscard]] Eigen::Index size() const noexcept override { return types::FeatureVector::kTextureSize; }

        [[nodiscard]] std::string_view name() const noexcept override { return "texture"; }

        [[nodiscard]] static cv::Mat varianceMap(const cv::Mat &intensity, int window);
    };

} // namespace processing::image

#endif // LOCAL_VARIANCE_EXTRACTOR_HPP
