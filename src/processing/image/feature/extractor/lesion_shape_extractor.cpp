// File: processing/image/feature/extractor/lesion_shape_extractor.cpp

#include "processing/image/feature/extractor/lesion_shape_extractor.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "common/logging/logger.hpp"

namespace processing::image {

    LesionShapeExtractor::LesionShapeExtractor(const Config &config) : config_(config) {
        if (config_.baseline_hue_min > config_.baseline_hue_max || config_.baseline_hue_min < 0 ||
            config_.baseline_hue_max > 179) {
            throw std::invalid_argument(fmt::format("Invalid baseline hue range [{}, {}]", config_.baseline_hue_min,
                                                    config_.baseline_hue_max));
        }
        config_.min_blob_area = std::max(config_.min_blob_area, 1);
        LOG_DEBUG("Lesion thresholds: leaf S>={} V>={}, baseline hue [{}, {}], opening {}, min blob {} px",
                  config_.leaf_saturation_min, config_.leaf_value_min, config_.baseline_hue_min,
                  config_.baseline_hue_max, config_.open_kernel, config_.min_blob_area);
    }

    LesionShapeExtractor::Masks LesionShapeExtractor::segment(const cv::Mat &image) const {
        cv::Mat hsv;
        cv::cvtColor(image, hsv, cv::COLOR_BGR2HSV);

        Masks masks;
        cv::inRange(hsv, cv::Scalar(0, config_.leaf_saturation_min, config_.leaf_value_min),
                    cv::Scalar(179, 255, 255), masks.leaf);

        cv::Mat baseline;
        cv::inRange(hsv, cv::Scalar(config_.baseline_hue_min, config_.leaf_saturation_min, config_.leaf_value_min),
                    cv::Scalar(config_.baseline_hue_max, 255, 255), baseline);

        cv::bitwise_and(masks.leaf, ~baseline, masks.lesion);

        if (config_.open_kernel > 1) {
            const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE,
                                                             cv::Size(config_.open_kernel, config_.open_kernel));
            cv::morphologyEx(masks.lesion, masks.lesion, cv::MORPH_OPEN, kernel);
        }
        return masks;
    }

    Eigen::VectorXd LesionShapeExtractor::extract(const cv::Mat &image) const {
        const auto [leaf, lesion] = segment(image);
        const double leaf_area = cv::countNonZero(leaf);

        cv::Mat labels, stats, centroids;
        const int label_count = cv::connectedComponentsWithStats(lesion, labels, stats, centroids, 8, CV_32S);

        std::vector<double> areas;
        for (int label = 1; label < label_count; ++label) { // label 0 is the background
            const int area = stats.at<int>(label, cv::CC_STAT_AREA);
            if (area >= config_.min_blob_area) {
                areas.push_back(static_cast<double>(area));
            }
        }

        Eigen::VectorXd band = Eigen::VectorXd::Zero(size());
        band(0) = static_cast<double>(areas.size());
        if (areas.empty() || leaf_area <= 0.0) {
            LOG_TRACE("No lesion blobs found (leaf area {} px).", leaf_area);
            return band;
        }

        const auto count = static_cast<double>(areas.size());
        double sum = 0.0;
        for (const double area: areas) {
            sum += area;
        }
        const double mean = sum / count;

        double squared_deviation = 0.0;
        for (const double area: areas) {
            squared_deviation += (area - mean) * (area - mean);
        }

        band(1) = mean / leaf_area;
        band(2) = std::sqrt(squared_deviation / count) / leaf_area;
        band(3) = *std::ranges::max_element(areas) / leaf_area;

        LOG_TRACE("Shape band: {} blobs over {} leaf px -> {:.6}", areas.size(), leaf_area, band);
        return band;
    }

} // namespace processing::image
