#pragma once

#include <torch/torch.h>
#include <utility>

torch::Tensor box_cxcywh_to_xyxy(const torch::Tensor& boxes);  // (...,4)

torch::Tensor box_area(const torch::Tensor& boxes);  // (K,4), xyxy

// Pairwise IoU of two xyxy box sets. Returns {iou (K,M), union (K,M)}.
std::pair<torch::Tensor, torch::Tensor> box_iou(
    const torch::Tensor& boxes1,  // (K,4), xyxy
    const torch::Tensor& boxes2   // (M,4), xyxy
);

// Pairwise generalized IoU, (K,M).
torch::Tensor generalized_box_iou(
    const torch::Tensor& boxes1,  // (K,4), xyxy
    const torch::Tensor& boxes2   // (M,4), xyxy
);

// Row-aligned variants: IoU / GIoU between boxes1[k] and boxes2[k], (K,).
torch::Tensor elementwise_box_iou(const torch::Tensor& boxes1, const torch::Tensor& boxes2);
torch::Tensor elementwise_generalized_box_iou(const torch::Tensor& boxes1, const torch::Tensor& boxes2);
