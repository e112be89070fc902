#include <gtest/gtest.h>
#include "point_sample.h"

namespace F = torch::nn::functional;

class PointSampleTest : public ::testing::Test {
protected:
    void SetUp() override {
        torch::manual_seed(42);
    }
};

TEST_F(PointSampleTest, FlatListShape) {
    auto input = torch::randn({2, 3, 8, 8});
    auto coords = torch::rand({2, 17, 2});

    auto output = point_sample(input, coords);

    EXPECT_EQ(output.sizes(), torch::IntArrayRef({2, 3, 17}));
}

TEST_F(PointSampleTest, GridShape) {
    auto input = torch::randn({2, 3, 8, 8});
    auto coords = torch::rand({2, 4, 5, 2});

    auto output = point_sample(input, coords);

    EXPECT_EQ(output.sizes(), torch::IntArrayRef({2, 3, 4, 5}));
}

TEST_F(PointSampleTest, ConstantMapInterior) {
    auto input = torch::full({2, 3, 8, 8}, 5.0f);
    // Pixel centres of the outer ring are at 0.5/8 and 1 - 0.5/8.
    auto coords = torch::rand({2, 64, 2}) * 0.875 + 0.0625;

    auto output = point_sample(input, coords);

    EXPECT_TRUE(torch::allclose(output, torch::full_like(output, 5.0f), 1e-5, 1e-5));
}

TEST_F(PointSampleTest, ConstantMapBoundaryWithBorderPadding) {
    auto input = torch::full({1, 1, 6, 6}, -3.0f);
    auto coords = torch::tensor({0.0f, 0.0f, 1.0f, 1.0f, 0.0f, 1.0f, 0.5f, 0.5f}).view({1, 4, 2});

    auto output = point_sample(input, coords,
        F::GridSampleFuncOptions().align_corners(false).padding_mode(torch::kBorder));

    EXPECT_TRUE(torch::allclose(output, torch::full_like(output, -3.0f)));
}

TEST_F(PointSampleTest, BilinearCentre) {
    auto input = torch::tensor({0.0f, 1.0f, 2.0f, 3.0f}).view({1, 1, 2, 2});
    auto coords = torch::tensor({0.5f, 0.5f}).view({1, 1, 2});

    auto output = point_sample(input, coords);

    EXPECT_NEAR(output[0][0][0].item<float>(), 1.5f, 1e-6);
}

TEST_F(PointSampleTest, UncertaintyIsNegativeAbs) {
    auto logits = torch::tensor({-2.0f, 0.0f, 3.0f}).view({1, 1, 3});

    auto u = calculate_uncertainty(logits);

    EXPECT_FLOAT_EQ(u[0][0][0].item<float>(), -2.0f);
    EXPECT_FLOAT_EQ(u[0][0][1].item<float>(), 0.0f);
    EXPECT_FLOAT_EQ(u[0][0][2].item<float>(), -3.0f);
    EXPECT_THROW(calculate_uncertainty(torch::zeros({1, 2, 3})), c10::Error);
}

TEST_F(PointSampleTest, AdaptiveCoordsCount) {
    auto logits = torch::randn({3, 1, 16, 16});

    auto coords = get_uncertain_point_coords_with_randomness(logits, calculate_uncertainty, 50, 3.0, 0.75);

    EXPECT_EQ(coords.sizes(), torch::IntArrayRef({3, 50, 2}));
    EXPECT_GE(coords.min().item<float>(), 0.0f);
    EXPECT_LE(coords.max().item<float>(), 1.0f);
}

TEST_F(PointSampleTest, DegenerateRatiosReuseSingleDraw) {
    auto logits = torch::randn({2, 1, 8, 8});

    torch::manual_seed(7);
    auto draw = torch::rand({2, 20, 2});
    torch::manual_seed(7);
    auto coords = get_uncertain_point_coords_with_randomness(logits, calculate_uncertainty, 20, 1.0, 1.0);

    ASSERT_EQ(coords.sizes(), torch::IntArrayRef({2, 20, 2}));
    // Every returned point is one of the candidates of the first draw.
    auto dist = (coords.unsqueeze(2) - draw.unsqueeze(1)).abs().sum(-1);  // (2,20,20)
    auto nearest = std::get<0>(dist.min(-1));
    EXPECT_EQ(nearest.max().item<float>(), 0.0f);
}

TEST_F(PointSampleTest, ImportancePointsFollowDecisionBoundary) {
    // Logits ramp along x and cross zero at x = 0.5.
    const int64_t W = 64;
    auto xs = (torch::arange(W, torch::kFloat) + 0.5) / W;
    auto ramp = ((xs - 0.5) * 20).view({1, 1, 1, W}).expand({1, 1, W, W}).contiguous();

    auto coords = get_uncertain_point_coords_with_randomness(ramp, calculate_uncertainty, 200, 4.0, 0.5);

    auto important_x = coords.index({0, torch::indexing::Slice(0, 100), 0});
    auto random_x = coords.index({0, torch::indexing::Slice(100, 200), 0});
    EXPECT_LT((important_x - 0.5).abs().max().item<float>(), 0.2f);
    EXPECT_LT((important_x - 0.5).abs().mean().item<float>(),
              (random_x - 0.5).abs().mean().item<float>());
}

TEST_F(PointSampleTest, InvalidRatiosThrow) {
    auto logits = torch::randn({1, 1, 4, 4});

    EXPECT_THROW(get_uncertain_point_coords_with_randomness(logits, calculate_uncertainty, 8, 0.5, 0.5), c10::Error);
    EXPECT_THROW(get_uncertain_point_coords_with_randomness(logits, calculate_uncertainty, 8, 2.0, 1.5), c10::Error);
}
