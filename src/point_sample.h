#pragma once

#include <torch/torch.h>
#include <functional>

using UncertaintyFn = std::function<torch::Tensor(const torch::Tensor&)>;

// Bilinear sampling at [0,1] x [0,1] normalized coordinates. Wraps
// grid_sample with coordinates rescaled to [-1,1].
//
// Arguments:
//   input        : (N,C,H,W) feature map.
//   point_coords : (N,P,2) flat list or (N,Hg,Wg,2) grid of (x,y) coordinates.
//   options      : forwarded to grid_sample (mode, padding_mode, align_corners).
//
// Returns (N,C,P) for a flat list and (N,C,Hg,Wg) for a grid.
torch::Tensor point_sample(
    const torch::Tensor& input,
    const torch::Tensor& point_coords,
    const torch::nn::functional::GridSampleFuncOptions& options =
        torch::nn::functional::GridSampleFuncOptions().align_corners(false)
);

// -|logits|: locations closest to the decision boundary score highest.
torch::Tensor calculate_uncertainty(const torch::Tensor& logits);  // (R,1,...)

// Draws num_points * oversample_ratio uniform candidates per box, keeps the
// importance_sample_ratio * num_points most uncertain ones and fills the rest
// with fresh uniform coordinates. Output order is [uncertain..., random...].
torch::Tensor get_uncertain_point_coords_with_randomness(
    const torch::Tensor& coarse_logits,  // (N,1,H,W)
    const UncertaintyFn& uncertainty_func,
    int64_t num_points,
    double oversample_ratio,
    double importance_sample_ratio
);
