// File: processing/image/feature/extractor/local_variance_extractor.cpp

#include "processing/image/feature/extractor/local_variance_extractor.hpp"

#include "common/logging/logger.hpp"

namespace processing::image {

    Eigen::VectorXd LocalVarianceExtractor::extract(const cv::Mat &image) const {
        cv::Mat gray;
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);

        cv::Mat intensity;
        gray.convertTo(intensity, CV_64F, 1.0 / 255.0);

        Eigen::VectorXd band(size());
        Eigen::Index index = 0;
        for (const int window: kWindowSizes) {
            cv::Scalar mean, stddev;
            cv::meanStdDev(varianceMap(intensity, window), mean, stddev);
            band(index++) = mean[0];
            band(index++) = stddev[0];
        }

        LOG_TRACE("Texture band: {:.6}", band);
        return band;
    }

    cv::Mat LocalVarianceExtractor::varianceMap(const cv::Mat &intensity, const int window) {
        const cv::Size kernel(window, window);

        cv::Mat mean, mean_of_squares;
        cv::boxFilter(intensity, mean, CV_64F, kernel, cv::Point(-1, -1), true, cv::BORDER_REFLECT_101);
        cv::boxFilter(intensity.mul(intensity), mean_of_squares, CV_64F, kernel, cv::Point(-1, -1), true,
                      cv::BORDER_REFLECT_101);

        cv::Mat variance = mean_of_squares - mean.mul(mean);
        // Cancellation can leave tiny negative values on flat regions
        cv::max(variance, 0.0, variance);
        return variance;
    }

} // namespace processing::image
