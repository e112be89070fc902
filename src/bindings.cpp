
#include <torch/extension.h>

#include "box_ops.h"
#include "losses.h"
#include "matcher.h"
#include "point_sample.h"

#include <tuple>

static torch::Tensor point_sample_binding(
    const torch::Tensor& input,         // (N,C,H,W), float
    const torch::Tensor& point_coords,  // (N,P,2) or (N,Hg,Wg,2), float in [0,1]
    bool align_corners = false
) {
    return point_sample(input, point_coords,
        torch::nn::functional::GridSampleFuncOptions().align_corners(align_corners));
}

static torch::Tensor uncertain_point_coords(
    const torch::Tensor& coarse_logits,  // (N,1,H,W), float
    int64_t num_points,
    double oversample_ratio = 3.0,
    double importance_sample_ratio = 0.75
) {
    return get_uncertain_point_coords_with_randomness(
        coarse_logits, calculate_uncertainty, num_points, oversample_ratio, importance_sample_ratio);
}

static torch::Tensor pairwise_generalized_box_iou(
    const torch::Tensor& boxes1,  // (K,4), cxcywh
    const torch::Tensor& boxes2   // (M,4), cxcywh
) {
    return generalized_box_iou(box_cxcywh_to_xyxy(boxes1), box_cxcywh_to_xyxy(boxes2));
}

static std::tuple<torch::Tensor, torch::Tensor> linear_sum_assignment_binding(
    const torch::Tensor& cost  // (R,C)
) {
    auto result = linear_sum_assignment(cost);
    return std::make_tuple(result.first, result.second);
}

PYBIND11_MODULE(TORCH_EXTENSION_NAME, m) {
    m.def("point_sample", &point_sample_binding, "Bilinear sampling at [0,1] coordinates",
          py::arg("input"), py::arg("point_coords"), py::arg("align_corners") = false);
    m.def("uncertain_point_coords", &uncertain_point_coords, "Uncertainty-guided point coordinates",
          py::arg("coarse_logits"), py::arg("num_points"),
          py::arg("oversample_ratio") = 3.0, py::arg("importance_sample_ratio") = 0.75);
    m.def("sigmoid_ce_loss", &sigmoid_ce_loss, "Point-wise sigmoid cross entropy mask loss");
    m.def("dice_loss", &dice_loss, "Dice mask loss");
    m.def("sigmoid_focal_loss", &sigmoid_focal_loss, "Elementwise sigmoid focal loss");
    m.def("generalized_box_iou", &pairwise_generalized_box_iou, "Pairwise GIoU of cxcywh boxes");
    m.def("linear_sum_assignment", &linear_sum_assignment_binding, "Hungarian assignment (CPU)");
}
