#pragma once

#include "types.h"

#include <vector>

// Computes the one-to-one assignment between the predictions of a single
// layer and the ground truth of every image.
class Matcher {
public:
    virtual ~Matcher() = default;
    virtual MatchResult operator()(const LayerOutputs& outputs, const std::vector<Target>& targets) = 0;
};

struct HungarianMatcherOptions {
    double cost_class = 2.0;
    double cost_bbox = 5.0;
    double cost_giou = 2.0;
    bool use_focal_loss = true;
    double alpha = 0.25;
    double gamma = 2.0;
};

// RT-DETR matcher: class cost (focal or softmax probability) + L1 box
// distance + negative GIoU, solved exactly per image.
class HungarianMatcher : public Matcher {
public:
    explicit HungarianMatcher(const HungarianMatcherOptions& options = HungarianMatcherOptions{});

    MatchResult operator()(const LayerOutputs& outputs, const std::vector<Target>& targets) override;

    // (B,N,sum M_i) matching cost, on the CPU in double precision.
    torch::Tensor cost_matrix(const LayerOutputs& outputs, const std::vector<Target>& targets) const;

    const HungarianMatcherOptions& options() const { return options_; }

private:
    HungarianMatcherOptions options_;
};

// Minimum-cost assignment of a dense (R,C) cost matrix. Returns
// {row_indices, col_indices}, int64, sorted by row, min(R,C) entries.
// Non-finite costs are treated as forbidden but still assignable.
std::pair<torch::Tensor, torch::Tensor> linear_sum_assignment(const torch::Tensor& cost);
