#include <gtest/gtest.h>
#include "losses.h"

#include <cmath>
#include <limits>

class LossesTest : public ::testing::Test {
protected:
    void SetUp() override {
        torch::manual_seed(3);
    }

    static MatchIndices single_match(int64_t pred, int64_t tgt) {
        return {{torch::tensor({pred}, torch::kLong), torch::tensor({tgt}, torch::kLong)}};
    }

    static Target make_target(std::vector<int64_t> labels, std::vector<float> boxes) {
        Target t;
        const int64_t m = static_cast<int64_t>(labels.size());
        t.labels = torch::tensor(labels, torch::kLong);
        t.boxes = m > 0 ? torch::tensor(boxes).view({m, 4}) : torch::zeros({0, 4});
        return t;
    }
};

TEST_F(LossesTest, DiceZeroOnExactAgreement) {
    auto targets = torch::tensor({1.0f, 0.0f, 1.0f, 1.0f, 0.0f, 0.0f}).view({2, 3});
    auto logits = targets * 200 - 100;

    EXPECT_NEAR(dice_loss(logits, targets, 1.0).item<float>(), 0.0f, 1e-5);
}

TEST_F(LossesTest, BceDecreasesTowardConfidentLogits) {
    auto targets = torch::tensor({1.0f, 0.0f, 1.0f, 0.0f}).view({1, 4});
    auto direction = targets * 2 - 1;

    float previous = std::numeric_limits<float>::infinity();
    for (float scale : {0.5f, 1.0f, 2.0f, 4.0f, 8.0f, 16.0f}) {
        float loss = sigmoid_ce_loss(direction * scale, targets, 1.0).item<float>();
        EXPECT_LT(loss, previous);
        previous = loss;
    }
    EXPECT_LT(previous, 1e-3f);
}

TEST_F(LossesTest, FocalWithoutModulationIsBce) {
    auto logits = torch::randn({4, 5});
    auto targets = (torch::rand({4, 5}) > 0.5).to(torch::kFloat);

    auto focal = sigmoid_focal_loss(logits, targets, /*alpha=*/-1.0, /*gamma=*/0.0);
    auto bce = torch::nn::functional::binary_cross_entropy_with_logits(
        logits, targets,
        torch::nn::functional::BinaryCrossEntropyWithLogitsFuncOptions().reduction(torch::kNone));

    EXPECT_TRUE(torch::allclose(focal, bce));
}

TEST_F(LossesTest, AccuracyTopOne) {
    auto logits = torch::tensor({2.0f, 1.0f, 0.0f, 0.0f, 3.0f, 1.0f}).view({2, 3});

    EXPECT_FLOAT_EQ(accuracy(logits, torch::tensor({0, 1}, torch::kLong)).item<float>(), 100.0f);
    EXPECT_FLOAT_EQ(accuracy(logits, torch::tensor({0, 2}, torch::kLong)).item<float>(), 50.0f);
    EXPECT_FLOAT_EQ(accuracy(logits, torch::zeros({0}, torch::kLong)).item<float>(), 0.0f);
}

TEST_F(LossesTest, CardinalityZeroWhenCountsAgree) {
    // 2 images, 5 queries, 2 classes + no-object in the last column.
    auto logits = torch::zeros({2, 5, 3});
    logits.index_put_({torch::indexing::Slice(), torch::indexing::Slice(), 2}, 5.0);
    for (int64_t q = 0; q < 3; ++q) {
        logits[0][q][0] = 10.0;
    }
    LayerOutputs outputs;
    outputs.pred_logits = logits;
    std::vector<Target> targets{
        make_target({0, 1, 1}, {0.5f, 0.5f, 0.1f, 0.1f, 0.3f, 0.3f, 0.1f, 0.1f, 0.7f, 0.7f, 0.1f, 0.1f}),
        make_target({}, {}),
    };

    auto losses = loss_cardinality(outputs, targets);

    EXPECT_FLOAT_EQ(losses.at("cardinality_error").item<float>(), 0.0f);

    targets[0] = make_target({0}, {0.5f, 0.5f, 0.1f, 0.1f});
    EXPECT_FLOAT_EQ(loss_cardinality(outputs, targets).at("cardinality_error").item<float>(), 1.0f);
}

TEST_F(LossesTest, CrossEntropyReportsClassError) {
    const int64_t num_classes = 2;
    auto logits = torch::zeros({1, 3, num_classes + 1});
    logits[0][0][1] = 10.0;  // matched, correct
    logits[0][1][0] = 10.0;  // matched, wrong
    logits[0][2][2] = 10.0;  // background
    LayerOutputs outputs;
    outputs.pred_logits = logits;
    std::vector<Target> targets{make_target({1, 1}, {0.5f, 0.5f, 0.1f, 0.1f, 0.2f, 0.2f, 0.1f, 0.1f})};
    MatchIndices indices{{torch::tensor({0, 1}, torch::kLong), torch::tensor({0, 1}, torch::kLong)}};
    auto empty_weight = torch::ones({num_classes + 1});
    empty_weight[num_classes] = 0.1;

    auto losses = loss_labels(outputs, targets, indices, empty_weight, num_classes, /*log=*/true);

    EXPECT_FLOAT_EQ(losses.at("class_error").item<float>(), 50.0f);
    EXPECT_GT(losses.at("loss_ce").item<float>(), 0.0f);

    auto quiet = loss_labels(outputs, targets, indices, empty_weight, num_classes, /*log=*/false);
    EXPECT_EQ(quiet.count("class_error"), 0u);
}

TEST_F(LossesTest, ClassErrorZeroWithoutMatches) {
    const int64_t num_classes = 2;
    LayerOutputs outputs;
    outputs.pred_logits = torch::randn({1, 3, num_classes + 1});
    std::vector<Target> targets{make_target({}, {})};
    MatchIndices indices{{torch::zeros({0}, torch::kLong), torch::zeros({0}, torch::kLong)}};

    auto losses = loss_labels(outputs, targets, indices, torch::ones({num_classes + 1}), num_classes, true);

    EXPECT_FLOAT_EQ(losses.at("class_error").item<float>(), 0.0f);
}

TEST_F(LossesTest, FocalReduction) {
    LayerOutputs outputs;
    outputs.pred_logits = torch::zeros({1, 2, 2});
    std::vector<Target> targets{make_target({1}, {0.5f, 0.5f, 0.2f, 0.2f})};

    auto losses = loss_labels_focal(outputs, targets, single_match(0, 0), 1.0, 2, 0.2, 2.0);

    // p = 0.5 everywhere: one positive weighted 0.2 * 0.25, three negatives 0.8 * 0.25.
    EXPECT_NEAR(losses.at("loss_focal").item<float>(), 0.65f * std::log(2.0f), 1e-5);
}

TEST_F(LossesTest, VarifocalUsesIouAsTarget) {
    LayerOutputs outputs;
    outputs.pred_logits = torch::zeros({1, 2, 2});
    outputs.pred_boxes = torch::tensor({0.5f, 0.5f, 0.2f, 0.2f, 0.1f, 0.1f, 0.1f, 0.1f}).view({1, 2, 4});
    std::vector<Target> targets{make_target({1}, {0.5f, 0.5f, 0.2f, 0.2f})};

    auto losses = loss_labels_vfl(outputs, targets, single_match(0, 0), 1.0, 2, 0.2, 2.0);

    // IoU 1 on the matched slot (weight 1), three negatives weighted 0.2 * 0.25.
    EXPECT_NEAR(losses.at("loss_vfl").item<float>(), 1.15f * std::log(2.0f), 1e-5);
}

TEST_F(LossesTest, BoxLosses) {
    LayerOutputs outputs;
    outputs.pred_boxes = torch::tensor({0.5f, 0.5f, 0.2f, 0.2f, 0.9f, 0.9f, 0.1f, 0.1f}).view({1, 2, 4});
    std::vector<Target> targets{make_target({0}, {0.6f, 0.5f, 0.2f, 0.2f})};

    auto losses = loss_boxes(outputs, targets, single_match(0, 0), 1.0);

    EXPECT_NEAR(losses.at("loss_bbox").item<float>(), 0.1f, 1e-5);
    // IoU 1/3, enclosing box equals the union, so GIoU = 1/3.
    EXPECT_NEAR(losses.at("loss_giou").item<float>(), 2.0f / 3.0f, 1e-5);

    auto halved = loss_boxes(outputs, targets, single_match(0, 0), 2.0);
    EXPECT_NEAR(halved.at("loss_bbox").item<float>(), 0.05f, 1e-5);
}

TEST_F(LossesTest, PadTargetMasksToCommonSize) {
    auto padded = pad_target_masks({torch::ones({2, 8, 8}), torch::ones({1, 6, 10})});

    EXPECT_EQ(padded.sizes(), torch::IntArrayRef({2, 2, 8, 10}));
    EXPECT_FLOAT_EQ(padded[1][0].sum().item<float>(), 60.0f);
    EXPECT_FLOAT_EQ(padded[1][1].sum().item<float>(), 0.0f);
    EXPECT_FLOAT_EQ(padded[0][0].sum().item<float>(), 64.0f);
}

TEST_F(LossesTest, MaskLossPrefersMatchingPrediction) {
    auto target_mask = torch::zeros({1, 16, 16});
    target_mask.index_put_({0, torch::indexing::Slice(4, 12), torch::indexing::Slice(4, 12)}, 1.0);
    std::vector<Target> targets{make_target({0}, {0.5f, 0.5f, 0.5f, 0.5f})};
    targets[0].masks = target_mask;

    LayerOutputs good;
    good.pred_masks = (target_mask * 20 - 10).unsqueeze(0).expand({1, 3, 16, 16}).contiguous();
    LayerOutputs bad;
    bad.pred_masks = -good.pred_masks;

    PointSamplingOptions sampling;
    sampling.num_points = 256;

    auto good_losses = loss_masks(good, targets, single_match(1, 0), 1.0, sampling);
    auto bad_losses = loss_masks(bad, targets, single_match(1, 0), 1.0, sampling);

    EXPECT_LT(good_losses.at("loss_mask_bce").item<float>(), bad_losses.at("loss_mask_bce").item<float>());
    EXPECT_LT(good_losses.at("loss_mask_dice").item<float>(), bad_losses.at("loss_mask_dice").item<float>());
    EXPECT_GE(good_losses.at("loss_mask_dice").item<float>(), 0.0f);
}

TEST_F(LossesTest, MaskLossZeroWithoutMatches) {
    std::vector<Target> targets{make_target({}, {})};
    targets[0].masks = torch::zeros({0, 16, 16});
    LayerOutputs outputs;
    outputs.pred_masks = torch::randn({1, 3, 16, 16});
    MatchIndices indices{{torch::zeros({0}, torch::kLong), torch::zeros({0}, torch::kLong)}};

    auto losses = loss_masks(outputs, targets, indices, 1.0, PointSamplingOptions{});

    EXPECT_FLOAT_EQ(losses.at("loss_mask_bce").item<float>(), 0.0f);
    EXPECT_FLOAT_EQ(losses.at("loss_mask_dice").item<float>(), 0.0f);
}

TEST_F(LossesTest, MaskLossRequiresPredMasks) {
    std::vector<Target> targets{make_target({0}, {0.5f, 0.5f, 0.5f, 0.5f})};
    targets[0].masks = torch::ones({1, 4, 4});
    LayerOutputs outputs;
    outputs.pred_logits = torch::zeros({1, 2, 2});

    EXPECT_THROW(loss_masks(outputs, targets, single_match(0, 0), 1.0, PointSamplingOptions{}), c10::Error);
}
