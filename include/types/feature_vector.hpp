// File: types/feature_vector.hpp

#ifndef TYPES_FEATURE_VECTOR_HPP
#define TYPES_FEATURE_VECTOR_HPP

#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

#include "common/errors.hpp"

namespace types {

    /*
     * Fixed-layout image descriptor of 106 doubles:
     *   [0, 96)    color band: H, S and V histograms of 32 bins each, every histogram sums to 1
     *   [96, 102)  texture band: mean and std of local variance for windows 3, 5 and 7
     *   [102, 106) shape band: blob count, mean blob area, blob area std, largest blob / leaf area
     * All values are finite. Construction validates length and finiteness.
     */
    class FeatureVector {
    public:
        static constexpr Eigen::Index kColorBins = 32;
        static constexpr Eigen::Index kColorChannels = 3;
        static constexpr Eigen::Index kColorSize = kColorBins * kColorChannels;
        static constexpr Eigen::Index kTextureSize = 6;
        static constexpr Eigen::Index kShapeSize = 4;
        static constexpr Eigen::Index kTextureOffset = kColorSize;
        static constexpr Eigen::Index kShapeOffset = kTextureOffset + kTextureSize;
        static constexpr Eigen::Index kSize = kShapeOffset + kShapeSize;

        explicit FeatureVector(Eigen::VectorXd values) : values_(std::move(values)) {
            if (values_.size() != kSize) {
                throw std::invalid_argument(
                        fmt::format("Feature vector must hold {} values, got {}", kSize, values_.size()));
            }
            if (!values_.allFinite()) {
                throw common::DegenerateFeatureError("Feature vector contains non-finite values");
            }
        }

        [[nodiscard]] const Eigen::VectorXd &values() const noexcept { return values_; }
        [[nodiscard]] double operator[](const Eigen::Index index) const { return values_(index); }
        [[nodiscard]] static constexpr Eigen::Index size() noexcept { return kSize; }

        [[nodiscard]] Eigen::VectorBlock<const Eigen::VectorXd> color() const {
            return values_.segment(0, kColorSize);
        }

        // channel: 0 = hue, 1 = saturation, 2 = value
        [[nodiscard]] Eigen::VectorBlock<const Eigen::VectorXd> colorChannel(const Eigen::Index channel) const {
            if (channel < 0 || channel >= kColorChannels) {
                throw std::out_of_range(fmt::format("Color channel {} out of range", channel));
            }
            return values_.segment(channel * kColorBins, kColorBins);
        }

        [[nodiscard]] Eigen::VectorBlock<const Eigen::VectorXd> texture() const {
            return values_.segment(kTextureOffset, kTextureSize);
        }

        [[nodiscard]] Eigen::VectorBlock<const Eigen::VectorXd> shape() const {
            return values_.segment(kShapeOffset, kShapeSize);
        }

        // Euclidean (L2) distance, the single metric used for indexing and querying.
        [[nodiscard]] double distance(const FeatureVector &other) const noexcept {
            return (values_ - other.values_).norm();
        }

        [[nodiscard]] double shapeDistance(const FeatureVector &other) const noexcept {
            return (shape() - other.shape()).norm();
        }

        [[nodiscard]] bool hasNormalizedColorBands(const double tolerance = 1e-6) const {
            for (Eigen::Index channel = 0; channel < kColorChannels; ++channel) {
                const auto band = colorChannel(channel);
                if (std::abs(band.sum() - 1.0) > tolerance || (band.array() < 0.0).any()) {
                    return false;
                }
            }
            return true;
        }

        bool operator==(const FeatureVector &other) const { return values_ == other.values_; }

    private:
        Eigen::VectorXd values_;
    };

} // namespace types

#endif // TYPES_FEATURE_VECTOR_HPP
