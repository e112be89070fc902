#include "point_sample.h"

namespace F = torch::nn::functional;

torch::Tensor point_sample(
    const torch::Tensor& input,
    const torch::Tensor& point_coords,
    const F::GridSampleFuncOptions& options
) {
    TORCH_CHECK(input.dim() == 4, "point_sample: input must be (N,C,H,W)");
    TORCH_CHECK(point_coords.dim() == 3 || point_coords.dim() == 4,
        "point_sample: point_coords must be (N,P,2) or (N,Hg,Wg,2)");
    TORCH_CHECK(point_coords.size(-1) == 2, "point_sample: point_coords last dimension must be 2");

    const bool add_dim = point_coords.dim() == 3;
    torch::Tensor grid = add_dim ? point_coords.unsqueeze(2) : point_coords;
    torch::Tensor output = F::grid_sample(input, 2.0 * grid - 1.0, options);
    if (add_dim) {
        output = output.squeeze(3);
    }
    return output;
}

torch::Tensor calculate_uncertainty(const torch::Tensor& logits) {
    TORCH_CHECK(logits.dim() >= 2 && logits.size(1) == 1,
        "calculate_uncertainty: expected a single logit channel");
    return -torch::abs(logits);
}

torch::Tensor get_uncertain_point_coords_with_randomness(
    const torch::Tensor& coarse_logits,
    const UncertaintyFn& uncertainty_func,
    int64_t num_points,
    double oversample_ratio,
    double importance_sample_ratio
) {
    TORCH_CHECK(oversample_ratio >= 1.0,
        "get_uncertain_point_coords_with_randomness: oversample_ratio must be >= 1");
    TORCH_CHECK(importance_sample_ratio >= 0.0 && importance_sample_ratio <= 1.0,
        "get_uncertain_point_coords_with_randomness: importance_sample_ratio must be in [0,1]");
    TORCH_CHECK(num_points >= 0, "get_uncertain_point_coords_with_randomness: num_points must be non-negative");

    const int64_t num_boxes = coarse_logits.size(0);
    const int64_t num_sampled = static_cast<int64_t>(num_points * oversample_ratio);
    const auto opts = coarse_logits.options();

    torch::Tensor point_coords = torch::rand({num_boxes, num_sampled, 2}, opts);
    torch::Tensor point_logits = point_sample(coarse_logits, point_coords);

    // Score the sampled logits, not the coarse grid: a point between coarse
    // logits -1 and 1 interpolates to 0 and must come out as most uncertain.
    torch::Tensor point_uncertainties = uncertainty_func(point_logits);  // (N,1,S)

    const int64_t num_uncertain_points = static_cast<int64_t>(importance_sample_ratio * num_points);
    const int64_t num_random_points = num_points - num_uncertain_points;

    torch::Tensor idx = std::get<1>(torch::topk(point_uncertainties.select(1, 0), num_uncertain_points, 1));
    torch::Tensor shift = num_sampled * torch::arange(num_boxes, opts.dtype(torch::kLong));
    idx = idx + shift.unsqueeze(1);
    point_coords = point_coords.view({-1, 2}).index_select(0, idx.view(-1))
                       .view({num_boxes, num_uncertain_points, 2});

    if (num_random_points > 0) {
        torch::Tensor random_coords = torch::rand({num_boxes, num_random_points, 2}, opts);
        point_coords = torch::cat({point_coords, random_coords}, 1);
    }
    return point_coords;
}
