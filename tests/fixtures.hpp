// File: tests/fixtures.hpp

#ifndef TESTS_FIXTURES_HPP
#define TESTS_FIXTURES_HPP

#include <Eigen/Dense>
#include <initializer_list>
#include <memory>
#include <opencv2/imgproc.hpp>
#include <string>

#include "types/feature_vector.hpp"
#include "types/image_record.hpp"
#include "types/neighbor_match.hpp"

namespace fixtures {

    /*
     * Valid feature vector with uniform color histograms. Only the first texture value and the
     * shape band vary, so the distance between two fixtures is controlled by `position` and `shape`.
     */
    inline types::FeatureVector features(const double position, const Eigen::Vector4d &shape = Eigen::Vector4d::Zero()) {
        Eigen::VectorXd values = Eigen::VectorXd::Zero(types::FeatureVector::kSize);
        values.head(types::FeatureVector::kColorSize).setConstant(1.0 / types::FeatureVector::kColorBins);
        values(types::FeatureVector::kTextureOffset) = position;
        values.segment(types::FeatureVector::kShapeOffset, types::FeatureVector::kShapeSize) = shape;
        return types::FeatureVector(values);
    }

    inline std::shared_ptr<const types::ImageRecord> record(const std::string &id, const std::string &label,
                                                            const double position,
                                                            const Eigen::Vector4d &shape = Eigen::Vector4d::Zero()) {
        return std::make_shared<types::ImageRecord>(id, types::Category(label), features(position, shape));
    }

    inline types::NeighborMatch match(const std::string &id, const std::string &label, const double distance) {
        return {{}, id, types::Category(label), distance};
    }

    // Uniformly green leaf (hue 60 on the OpenCV scale), inside the healthy baseline.
    inline cv::Mat healthyLeaf(const int size = 64) { return cv::Mat(size, size, CV_8UC3, cv::Scalar(0, 200, 0)); }

    // Green leaf with square brown lesions (hue about 8) of side `side` at the given top-left corners.
    inline cv::Mat spottedLeaf(const std::initializer_list<cv::Point> corners, const int side = 6,
                               const int size = 64) {
        cv::Mat image = healthyLeaf(size);
        for (const auto &corner: corners) {
            cv::rectangle(image, cv::Rect(corner.x, corner.y, side, side), cv::Scalar(30, 60, 140), cv::FILLED);
        }
        return image;
    }

} // namespace fixtures

#endif // TESTS_FIXTURES_HPP
