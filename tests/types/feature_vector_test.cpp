// File: tests/types/feature_vector_test.cpp

#include <gtest/gtest.h>
#include <cmath>
#include <limits>

#include "fixtures.hpp"
#include "common/errors.hpp"
#include "types/category.hpp"
#include "types/feature_vector.hpp"

using types::FeatureVector;

// The layout is 96 color, 6 texture and 4 shape values
TEST(FeatureVectorTest, Layout) {
    EXPECT_EQ(FeatureVector::size(), 106);
    EXPECT_EQ(FeatureVector::kTextureOffset, 96);
    EXPECT_EQ(FeatureVector::kShapeOffset, 102);

    const auto vector = fixtures::features(0.5, Eigen::Vector4d(1, 2, 3, 4));
    EXPECT_EQ(vector.color().size(), 96);
    EXPECT_EQ(vector.texture().size(), 6);
    EXPECT_DOUBLE_EQ(vector.texture()(0), 0.5);
    EXPECT_EQ(vector.shape(), Eigen::Vector4d(1, 2, 3, 4));
    EXPECT_TRUE(vector.hasNormalizedColorBands());
    EXPECT_THROW((void) vector.colorChannel(3), std::out_of_range);
}

// Wrong length and non-finite values are rejected at construction
TEST(FeatureVectorTest, ConstructionValidates) {
    EXPECT_THROW(FeatureVector{Eigen::VectorXd::Zero(105)}, std::invalid_argument);

    Eigen::VectorXd values = Eigen::VectorXd::Zero(FeatureVector::kSize);
    values(10) = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(FeatureVector{values}, common::DegenerateFeatureError);

    values(10) = std::numeric_limits<double>::infinity();
    EXPECT_THROW(FeatureVector{values}, common::DegenerateFeatureError);
}

// Distance is Euclidean over the whole vector, shape distance over the shape band only
TEST(FeatureVectorTest, Distances) {
    const auto a = fixtures::features(0.0, Eigen::Vector4d(0, 0, 0, 0));
    const auto b = fixtures::features(3.0, Eigen::Vector4d(4, 0, 0, 0));

    EXPECT_DOUBLE_EQ(a.distance(b), 5.0);
    EXPECT_DOUBLE_EQ(b.distance(a), 5.0);
    EXPECT_DOUBLE_EQ(a.distance(a), 0.0);
    EXPECT_DOUBLE_EQ(a.shapeDistance(b), 4.0);
}

// Healthy detection and binary collapse work on dataset-style labels
TEST(CategoryTest, BinaryCollapse) {
    EXPECT_TRUE(types::Category("Tomato___healthy").isHealthy());
    EXPECT_FALSE(types::Category("Tomato___Late_blight").isHealthy());
    EXPECT_EQ(types::Category("leaf_Healthy").toBinary(), types::Category::healthy());
    EXPECT_EQ(types::Category("rust").toBinary(), types::Category::diseased());
    EXPECT_LT(types::Category("Diseased"), types::Category("Healthy"));
}
