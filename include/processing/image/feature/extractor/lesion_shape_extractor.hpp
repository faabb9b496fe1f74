// File: processing/image/feature/extractor/lesion_shape_extractor.hpp

#ifndef LESION_SHAPE_EXTRACTOR_HPP
#define LESION_SHAPE_EXTRACTOR_HPP

#include <opencv2/imgproc.hpp>

#include "config/configuration.hpp"
#include "processing/image/feature/extractor.hpp"
#include "types/feature_vector.hpp"

namespace processing::image {

    /*
     * Shape band from lesion blobs.
     *
     * Thresholding rule (HSV, OpenCV 8-bit scale):
     *   leaf pixel   : S >= leaf_saturation_min and V >= leaf_value_min
     *   lesion pixel : leaf pixel whose hue lies outside [baseline_hue_min, baseline_hue_max]
     * The lesion mask is cleaned with a morphological opening (elliptic kernel of open_kernel
     * pixels, disabled when <= 1) and split into 8-connected blobs; blobs smaller than
     * min_blob_area pixels are ignored.
     *
     * Output: blob count, mean blob area, population std of blob area, largest blob area. The
     * three area values are fractions of the leaf area. No blobs (or no leaf) gives zeros.
     */
    class LesionShapeExtractor final : public FeatureExtractor {
    public:
        struct Config {
            int leaf_saturation_min;
            int leaf_value_min;
            int baseline_hue_min;
            int baseline_hue_max;
            int open_kernel;
            int min_blob_area;

            Config() :
                leaf_saturation_min(config::get("feature.shape.leaf_saturation_min", 40)),
                leaf_value_min(config::get("feature.shape.leaf_value_min", 40)),
                baseline_hue_min(config::get("feature.shape.baseline_hue_min", 35)),
                baseline_hue_max(config::get("feature.shape.baseline_hue_max", 85)),
                open_kernel(config::get("feature.shape.open_kernel", 3)),
                min_blob_area(config::get("feature.shape.min_blob_area", 4)) {}
        };

        struct Masks {
            cv::Mat leaf;
            cv::Mat lesion;
        };

        explicit LesionShapeExtractor(const Config &config = Config());

        [[nodiscard]] Eigen::VectorXd extract(const cv::Mat &image) const override;

        [[nodiscard]] Eigen::Index size() const noexcept override { return types::FeatureVector::kShapeSize; }

        [[nodiscard]] std::string_view name() const noexcept override { return "shape"; }

        // Leaf and cleaned lesion masks (CV_8UC1, 255 = set) for a BGR image.
        [[nodiscard]] Masks segment(const cv::Mat &image) const;

        [[nodiscard]] const Config &config() const noexcept { return config_; }

    private:
        Config config_;
    };

} // namespace processing::image

#endif // LESION_SHAPE_EXTRACTOR_HPP
