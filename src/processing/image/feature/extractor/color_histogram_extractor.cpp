// File: processing/image/feature/extractor/color_histogram_extractor.cpp

#include "processing/image/feature/extractor/color_histogram_extractor.hpp"

#include <array>

#include "common/errors.hpp"
#include "common/logging/logger.hpp"

namespace processing::image {

    ColorHistogramExtractor::ColorHistogramExtractor(const Config &config) : config_(config) {
        if (config_.sample_step < 1) {
            LOG_WARN("Invalid color sample step {}, using every pixel.", config_.sample_step);
            config_.sample_step = 1;
        }
    }

    Eigen::VectorXd ColorHistogramExtractor::extract(const cv::Mat &image) const {
        cv::Mat hsv;
        cv::cvtColor(image, hsv, cv::COLOR_BGR2HSV);

        // OpenCV 8-bit HSV: hue in [0, 180), saturation and value in [0, 256)
        constexpr std::array<float, 2> hue_range = {0.0f, 180.0f};
        constexpr std::array<float, 2> full_range = {0.0f, 256.0f};
        const int bins = static_cast<int>(types::FeatureVector::kColorBins);
        const cv::Mat mask = samplingMask(hsv.size());

        Eigen::VectorXd band(size());
        for (int channel = 0; channel < static_cast<int>(types::FeatureVector::kColorChannels); ++channel) {
            const float *range = channel == 0 ? hue_range.data() : full_range.data();
            cv::Mat hist;
            cv::calcHist(&hsv, 1, &channel, mask, hist, 1, &bins, &range, true, false);

            cv::Mat normalized;
            hist.convertTo(normalized, CV_64F);
            const double total = cv::sum(normalized)[0];
            if (total <= 0.0) {
                LOG_ERROR("Empty histogram for HSV channel {}.", channel);
                throw common::DegenerateFeatureError(fmt::format("Empty histogram for HSV channel {}", channel));
            }
            normalized /= total;

            for (int bin = 0; bin < bins; ++bin) {
                band(channel * bins + bin) = normalized.at<double>(bin);
            }
        }

        LOG_TRACE("Color band: {:.4}", band);
        return band;
    }

    cv::Mat ColorHistogramExtractor::samplingMask(const cv::Size &size) const {
        if (config_.sample_step <= 1) {
            return {};
        }

        cv::Mat mask = cv::Mat::zeros(size, CV_8UC1);
        for (int y = 0; y < size.height; y += config_.sample_step) {
            for (int x = 0; x < size.width; x += config_.sample_step) {
                mask.at<uchar>(y, x) = 255;
            }
        }
        return mask;
    }

} // namespace processing::image
