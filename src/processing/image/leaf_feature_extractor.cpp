// File: processing/image/leaf_feature_extractor.cpp

#include "processing/image/leaf_feature_extractor.hpp"

#include <algorithm>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <vector>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"
#include "processing/image/feature/extractor/local_variance_extractor.hpp"

namespace processing::image {

    LeafFeatureExtractor::LeafFeatureExtractor(const Config &config) :
        LeafFeatureExtractor(FeatureExtractor::create("color"), FeatureExtractor::create("texture"),
                             FeatureExtractor::create("shape"), config) {}

    LeafFeatureExtractor::LeafFeatureExtractor(std::shared_ptr<FeatureExtractor> color,
                                               std::shared_ptr<FeatureExtractor> texture,
                                               std::shared_ptr<FeatureExtractor> shape, const Config &config) :
        config_(config), color_(std::move(color)), texture_(std::move(texture)), shape_(std::move(shape)) {
        if (!color_ || !texture_ || !shape_) {
            throw std::invalid_argument("LeafFeatureExtractor requires color, texture and shape extractors.");
        }
        if (color_->size() != types::FeatureVector::kColorSize ||
            texture_->size() != types::FeatureVector::kTextureSize ||
            shape_->size() != types::FeatureVector::kShapeSize) {
            throw std::invalid_argument(fmt::format("Band sizes {}/{}/{} do not match the feature layout {}/{}/{}",
                                                    color_->size(), texture_->size(), shape_->size(),
                                                    types::FeatureVector::kColorSize,
                                                    types::FeatureVector::kTextureSize,
                                                    types::FeatureVector::kShapeSize));
        }

        // The texture windows must fit inside the smallest accepted image
        const int largest_window = *std::ranges::max_element(LocalVarianceExtractor::kWindowSizes);
        if (config_.min_image_size < largest_window) {
            LOG_WARN("Minimum image size {} is below the largest texture window, raising it to {}.",
                     config_.min_image_size, largest_window);
            config_.min_image_size = largest_window;
        }
    }

    cv::Mat LeafFeatureExtractor::prepare(const cv::Mat &image) const {
        if (image.empty()) {
            LOG_ERROR("Input image is empty.");
            throw common::InvalidImageError("Input image is empty");
        }
        if (image.depth() != CV_8U) {
            LOG_ERROR("Unsupported image depth {}, expected 8-bit.", image.depth());
            throw common::InvalidImageError(fmt::format("Unsupported image depth {}, expected 8-bit", image.depth()));
        }
        if (image.channels() < 3) {
            LOG_ERROR("Image has {} channel(s), at least 3 are required.", image.channels());
            throw common::InvalidImageError(
                    fmt::format("Image has {} channel(s), at least 3 are required", image.channels()));
        }
        if (image.cols < config_.min_image_size || image.rows < config_.min_image_size) {
            LOG_ERROR("Image {}x{} is smaller than the minimum {}x{}.", image.cols, image.rows,
                      config_.min_image_size, config_.min_image_size);
            throw common::InvalidImageError(fmt::format("Image {}x{} is smaller than the minimum {}x{}", image.cols,
                                                        image.rows, config_.min_image_size,
                                                        config_.min_image_size));
        }

        if (image.channels() == 3) {
            return image;
        }
        if (image.channels() == 4) {
            cv::Mat bgr;
            cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
            return bgr;
        }

        std::vector<cv::Mat> channels;
        cv::split(image, channels);
        channels.resize(3);
        cv::Mat bgr;
        cv::merge(channels, bgr);
        return bgr;
    }

    types::FeatureVector LeafFeatureExtractor::extract(const cv::Mat &image) const {
        const cv::Mat bgr = prepare(image);

        Eigen::VectorXd values(types::FeatureVector::kSize);
        Eigen::Index offset = 0;
        for (const auto &extractor: {color_, texture_, shape_}) {
            Eigen::VectorXd band;
            try {
                band = extractor->extract(bgr);
            } catch (const cv::Exception &e) {
                LOG_ERROR("OpenCV exception in {} extraction: {}", extractor->name(), e.what());
                throw common::InvalidImageError(
                        fmt::format("{} extraction failed: {}", extractor->name(), e.what()));
            }
            if (band.size() != extractor->size()) {
                throw std::logic_error(fmt::format("{} extractor returned {} values, expected {}", extractor->name(),
                                                   band.size(), extractor->size()));
            }
            values.segment(offset, band.size()) = band;
            offset += band.size();
        }

        if (!values.allFinite()) {
            LOG_ERROR("Feature extraction produced non-finite values for a {}x{} image.", bgr.cols, bgr.rows);
            throw common::DegenerateFeatureError("Feature extraction produced non-finite values");
        }

        LOG_DEBUG("Extracted {} features from a {}x{} image.", values.size(), bgr.cols, bgr.rows);
        return types::FeatureVector(std::move(values));
    }

} // namespace processing::image
