#pragma once

#include "types.h"

#include <map>
#include <string>
#include <vector>

using LossDict = std::map<std::string, torch::Tensor>;

struct PointSamplingOptions {
    int64_t num_points = 12544;
    double oversample_ratio = 3.0;
    double importance_sample_ratio = 0.75;
};

// Mean BCE-with-logits over points, summed over masks, divided by num_masks.
torch::Tensor sigmoid_ce_loss(
    const torch::Tensor& inputs,   // (K,P), logits
    const torch::Tensor& targets,  // (K,P), {0,1}
    double num_masks
);

// 1 - (2*I + 1) / (sum_p + sum_t + 1) per mask, summed, divided by num_masks.
torch::Tensor dice_loss(
    const torch::Tensor& inputs,   // (K,...), logits
    const torch::Tensor& targets,  // (K,...), {0,1}
    double num_masks
);

// Elementwise sigmoid focal loss (no reduction). alpha < 0 disables the
// class-balancing term.
torch::Tensor sigmoid_focal_loss(
    const torch::Tensor& inputs,
    const torch::Tensor& targets,
    double alpha,
    double gamma
);

// Top-1 precision in percent; 0 when there are no targets.
torch::Tensor accuracy(const torch::Tensor& output, const torch::Tensor& target);

// Zero-pads per-image (M_i,h_i,w_i) masks into (B,max M,max h,max w).
torch::Tensor pad_target_masks(const std::vector<torch::Tensor>& masks);

// (B,N) class targets: ``num_classes`` everywhere except matched slots.
torch::Tensor build_target_classes(
    const torch::Tensor& src_logits,
    const std::vector<Target>& targets,
    const MatchIndices& indices,
    int64_t num_classes
);

// {"loss_ce"} and, with log set, {"class_error"} (0 when nothing is matched).
LossDict loss_labels(
    const LayerOutputs& outputs,
    const std::vector<Target>& targets,
    const MatchIndices& indices,
    const torch::Tensor& empty_weight,  // (num_classes+1,)
    int64_t num_classes,
    bool log
);

// {"loss_focal"}
LossDict loss_labels_focal(
    const LayerOutputs& outputs,
    const std::vector<Target>& targets,
    const MatchIndices& indices,
    double num_boxes,
    int64_t num_classes,
    double alpha,
    double gamma
);

// {"loss_vfl"}
LossDict loss_labels_vfl(
    const LayerOutputs& outputs,
    const std::vector<Target>& targets,
    const MatchIndices& indices,
    double num_boxes,
    int64_t num_classes,
    double alpha,
    double gamma
);

// {"loss_bbox", "loss_giou"}
LossDict loss_boxes(
    const LayerOutputs& outputs,
    const std::vector<Target>& targets,
    const MatchIndices& indices,
    double num_boxes
);

// {"cardinality_error"}, logging only, no gradient.
LossDict loss_cardinality(const LayerOutputs& outputs, const std::vector<Target>& targets);

// {"loss_mask_bce", "loss_mask_dice"}
LossDict loss_masks(
    const LayerOutputs& outputs,
    const std::vector<Target>& targets,
    const MatchIndices& indices,
    double num_masks,
    const PointSamplingOptions& sampling
);
