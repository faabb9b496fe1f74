// File: processing/image/feature/extractor.hpp

#ifndef FEATURE_EXTRACTOR_HPP
#define FEATURE_EXTRACTOR_HPP

#include <Eigen/Core>
#include <memory>
#include <opencv2/core.hpp>
#include <string_view>

namespace processing::image {

    /*
     * Computes one contiguous band of the leaf feature vector from an 8-bit, 3-channel BGR image.
     * Implementations are deterministic and stateless after construction.
     */
    class FeatureExtractor {
    public:
        virtual ~FeatureExtractor() = default;

        [[nodiscard]] virtual Eigen::VectorXd extract(const cv::Mat &image) const = 0;

        // Number of values produced by extract().
        [[nodiscard]] virtual Eigen::Index size() const noexcept = 0;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        // Create a band extractor by name ("color", "texture" or "shape") configured from config::get.
        static std::shared_ptr<FeatureExtractor> create(std::string_view band);

        template<typename T>
        static std::shared_ptr<FeatureExtractor> create() {
            static_assert(std::is_base_of_v<FeatureExtractor, T>, "T must derive from FeatureExtractor");
            return std::make_shared<T>();
        }
    };
} // namespace processing::image

#endif // FEATURE_EXTRACTOR_HPP
