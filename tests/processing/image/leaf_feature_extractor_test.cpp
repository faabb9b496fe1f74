// File: tests/processing/image/leaf_feature_extractor_test.cpp

#include <gtest/gtest.h>
#include <limits>
#include <opencv2/imgproc.hpp>

#include "fixtures.hpp"
#include "common/errors.hpp"
#include "processing/image/feature/extractor/color_histogram_extractor.hpp"
#include "processing/image/feature/extractor/lesion_shape_extractor.hpp"
#include "processing/image/feature/extractor/local_variance_extractor.hpp"
#include "processing/image/leaf_feature_extractor.hpp"

using namespace processing::image;

namespace {
    // Texture band stand-in that always yields a NaN
    class NaNTextureExtractor final : public FeatureExtractor {
    public:
        [[nodiscard]] Eigen::VectorXd extract(const cv::Mat &) const override {
            Eigen::VectorXd band = Eigen::VectorXd::Zero(size());
            band(0) = std::numeric_limits<double>::quiet_NaN();
            return band;
        }
        [[nodiscard]] Eigen::Index size() const noexcept override { return types::FeatureVector::kTextureSize; }
        [[nodiscard]] std::string_view name() const noexcept override { return "nan"; }
    };

    LesionShapeExtractor::Config withoutOpening() {
        LesionShapeExtractor::Config config;
        config.open_kernel = 1;
        return config;
    }
} // namespace

class LeafFeatureExtractorTest : public ::testing::Test {
protected:
    LeafFeatureExtractor extractor;
};

// Output always has 106 values and normalized color bands
TEST_F(LeafFeatureExtractorTest, LengthAndColorNormalization) {
    const auto features = extractor.extract(fixtures::spottedLeaf({{8, 8}, {40, 40}}));

    EXPECT_EQ(features.values().size(), 106);
    for (Eigen::Index channel = 0; channel < 3; ++channel) {
        EXPECT_NEAR(features.colorChannel(channel).sum(), 1.0, 1e-6);
    }
    EXPECT_TRUE(features.hasNormalizedColorBands());
}

// Extracting the same image twice gives identical vectors
TEST_F(LeafFeatureExtractorTest, Deterministic) {
    cv::Mat image(48, 40, CV_8UC3);
    cv::randu(image, cv::Scalar::all(0), cv::Scalar::all(255));

    EXPECT_EQ(extractor.extract(image), extractor.extract(image));
}

// A fourth channel is ignored
TEST_F(LeafFeatureExtractorTest, AcceptsBGRA) {
    const cv::Mat bgr = fixtures::spottedLeaf({{10, 10}});
    cv::Mat bgra;
    cv::cvtColor(bgr, bgra, cv::COLOR_BGR2BGRA);

    EXPECT_EQ(extractor.extract(bgr), extractor.extract(bgra));
}

// Empty, grayscale, non 8-bit and undersized inputs are rejected
TEST_F(LeafFeatureExtractorTest, RejectsInvalidImages) {
    EXPECT_THROW((void) extractor.extract(cv::Mat()), common::InvalidImageError);
    EXPECT_THROW((void) extractor.extract(cv::Mat(64, 64, CV_8UC1, cv::Scalar(128))), common::InvalidImageError);
    EXPECT_THROW((void) extractor.extract(cv::Mat(64, 64, CV_32FC3, cv::Scalar::all(0.5))),
                 common::InvalidImageError);
    EXPECT_THROW((void) extractor.extract(fixtures::healthyLeaf(16)), common::InvalidImageError);
    EXPECT_THROW((void) extractor.extract(cv::Mat(64, 8, CV_8UC3, cv::Scalar::all(100))), common::InvalidImageError);

    // The invalid-image error is an invalid_argument
    EXPECT_THROW((void) extractor.extract(cv::Mat()), std::invalid_argument);
}

// The minimum size never drops below the largest texture window
TEST(LeafFeatureExtractorConfigTest, MinimumSizeRaisedToTextureWindow) {
    LeafFeatureExtractor::Config config;
    config.min_image_size = 2;
    const LeafFeatureExtractor extractor(config);

    EXPECT_EQ(extractor.minImageSize(), 7);
    EXPECT_THROW((void) extractor.extract(fixtures::healthyLeaf(6)), common::InvalidImageError);
    EXPECT_NO_THROW((void) extractor.extract(fixtures::healthyLeaf(8)));
}

// A non-finite band value surfaces as a degenerate feature error
TEST(LeafFeatureExtractorConfigTest, NonFiniteBandIsDegenerate) {
    const LeafFeatureExtractor extractor(FeatureExtractor::create("color"), std::make_shared<NaNTextureExtractor>(),
                                         FeatureExtractor::create("shape"));

    EXPECT_THROW((void) extractor.extract(fixtures::healthyLeaf()), common::DegenerateFeatureError);
}

// Band extractors must match the feature layout
TEST(LeafFeatureExtractorConfigTest, RejectsMismatchedBands) {
    EXPECT_THROW(LeafFeatureExtractor(FeatureExtractor::create("texture"), FeatureExtractor::create("texture"),
                                      FeatureExtractor::create("shape")),
                 std::invalid_argument);
    EXPECT_THROW(LeafFeatureExtractor(nullptr, FeatureExtractor::create("texture"), FeatureExtractor::create("shape")),
                 std::invalid_argument);
}

// Factory resolves band names case-insensitively and rejects unknown ones
TEST(FeatureExtractorFactoryTest, CreateByName) {
    EXPECT_EQ(FeatureExtractor::create("COLOR")->size(), 96);
    EXPECT_EQ(FeatureExtractor::create("texture")->size(), 6);
    EXPECT_EQ(FeatureExtractor::create("shape")->name(), "shape");
    EXPECT_THROW((void) FeatureExtractor::create("sift"), std::invalid_argument);
}

// A uniform image has no local variance
TEST(LocalVarianceExtractorTest, UniformImageHasNoTexture) {
    const LocalVarianceExtractor extractor;
    const Eigen::VectorXd band = extractor.extract(fixtures::healthyLeaf());

    ASSERT_EQ(band.size(), 6);
    for (Eigen::Index i = 0; i < band.size(); ++i) {
        EXPECT_NEAR(band(i), 0.0, 1e-12);
    }
}

// A checkerboard has positive variance in every window
TEST(LocalVarianceExtractorTest, CheckerboardHasTexture) {
    cv::Mat image(32, 32, CV_8UC3);
    for (int y = 0; y < image.rows; ++y) {
        for (int x = 0; x < image.cols; ++x) {
            image.at<cv::Vec3b>(y, x) = (x + y) % 2 == 0 ? cv::Vec3b(255, 255, 255) : cv::Vec3b(0, 0, 0);
        }
    }
    const Eigen::VectorXd band = LocalVarianceExtractor().extract(image);

    EXPECT_GT(band(0), 0.1); // mean variance, window 3
    EXPECT_GT(band(2), 0.1); // window 5
    EXPECT_GT(band(4), 0.1); // window 7
    EXPECT_TRUE((band.array() >= 0.0).all());
}

// Every HSV histogram sums to one
TEST(ColorHistogramExtractorTest, ChannelsSumToOne) {
    cv::Mat image(40, 40, CV_8UC3);
    cv::randu(image, cv::Scalar::all(0), cv::Scalar::all(255));
    const Eigen::VectorXd band = ColorHistogramExtractor().extract(image);

    ASSERT_EQ(band.size(), 96);
    EXPECT_NEAR(band.segment(0, 32).sum(), 1.0, 1e-9);
    EXPECT_NEAR(band.segment(32, 32).sum(), 1.0, 1e-9);
    EXPECT_NEAR(band.segment(64, 32).sum(), 1.0, 1e-9);
}

// A solid green leaf has every hue in one bin
TEST(ColorHistogramExtractorTest, SolidColorFillsOneBin) {
    const Eigen::VectorXd band = ColorHistogramExtractor().extract(fixtures::healthyLeaf());

    // Hue 60 of 180 falls in bin 60 * 32 / 180 = 10
    EXPECT_DOUBLE_EQ(band(10), 1.0);
    EXPECT_DOUBLE_EQ(band.segment(0, 32).maxCoeff(), 1.0);
}

// A healthy leaf has no lesion blobs
TEST(LesionShapeExtractorTest, ZeroBlobs) {
    const Eigen::VectorXd band = LesionShapeExtractor().extract(fixtures::healthyLeaf());

    EXPECT_EQ(band, Eigen::Vector4d::Zero());
}

// Two separated lesions are counted with their areas relative to the leaf
TEST(LesionShapeExtractorTest, CountsBlobs) {
    const LesionShapeExtractor extractor(withoutOpening());
    const Eigen::VectorXd band = extractor.extract(fixtures::spottedLeaf({{8, 8}, {40, 40}}));

    const double ratio = 36.0 / (64.0 * 64.0);
    EXPECT_DOUBLE_EQ(band(0), 2.0);
    EXPECT_DOUBLE_EQ(band(1), ratio);
    EXPECT_DOUBLE_EQ(band(2), 0.0);
    EXPECT_DOUBLE_EQ(band(3), ratio);
}

// Blob areas of different sizes yield the largest-blob ratio and a positive spread
TEST(LesionShapeExtractorTest, UnequalBlobs) {
    cv::Mat image = fixtures::spottedLeaf({{4, 4}}, 10);
    cv::rectangle(image, cv::Rect(40, 40, 4, 4), cv::Scalar(30, 60, 140), cv::FILLED);
    const Eigen::VectorXd band = LesionShapeExtractor(withoutOpening()).extract(image);

    EXPECT_DOUBLE_EQ(band(0), 2.0);
    EXPECT_DOUBLE_EQ(band(3), 100.0 / 4096.0);
    EXPECT_DOUBLE_EQ(band(2), 42.0 / 4096.0); // population std of {100, 16}
}

// The opening removes single-pixel specks
TEST(LesionShapeExtractorTest, OpeningRemovesSpecks) {
    const Eigen::VectorXd band = LesionShapeExtractor().extract(fixtures::spottedLeaf({{20, 20}}, 1));

    EXPECT_DOUBLE_EQ(band(0), 0.0);
}

// Blobs below the minimum area are ignored
TEST(LesionShapeExtractorTest, MinimumBlobArea) {
    auto config = withoutOpening();
    config.min_blob_area = 50;
    const Eigen::VectorXd band = LesionShapeExtractor(config).extract(fixtures::spottedLeaf({{8, 8}, {40, 40}}));

    EXPECT_DOUBLE_EQ(band(0), 0.0);
}

// Dark background pixels are not part of the leaf
TEST(LesionShapeExtractorTest, BackgroundExcludedFromLeaf) {
    cv::Mat image(64, 64, CV_8UC3, cv::Scalar(0, 0, 0));
    cv::rectangle(image, cv::Rect(0, 0, 32, 64), cv::Scalar(0, 200, 0), cv::FILLED);
    cv::rectangle(image, cv::Rect(8, 8, 6, 6), cv::Scalar(30, 60, 140), cv::FILLED);

    const LesionShapeExtractor extractor(withoutOpening());
    const auto masks = extractor.segment(image);
    EXPECT_EQ(cv::countNonZero(masks.leaf), 32 * 64);
    EXPECT_EQ(cv::countNonZero(masks.lesion), 36);

    const Eigen::VectorXd band = extractor.extract(image);
    EXPECT_DOUBLE_EQ(band(3), 36.0 / (32.0 * 64.0));
}
