#include "box_ops.h"

#include <tuple>

using torch::indexing::None;
using torch::indexing::Slice;

torch::Tensor box_cxcywh_to_xyxy(const torch::Tensor& boxes) {
    TORCH_CHECK(boxes.size(-1) == 4, "box_cxcywh_to_xyxy: last dimension must be 4");
    auto parts = boxes.unbind(-1);
    const auto& cx = parts[0];
    const auto& cy = parts[1];
    const auto& w = parts[2];
    const auto& h = parts[3];
    return torch::stack({cx - 0.5 * w, cy - 0.5 * h, cx + 0.5 * w, cy + 0.5 * h}, -1);
}

torch::Tensor box_area(const torch::Tensor& boxes) {
    return (boxes.select(-1, 2) - boxes.select(-1, 0)) * (boxes.select(-1, 3) - boxes.select(-1, 1));
}

std::pair<torch::Tensor, torch::Tensor> box_iou(
    const torch::Tensor& boxes1,
    const torch::Tensor& boxes2
) {
    auto area1 = box_area(boxes1);
    auto area2 = box_area(boxes2);

    auto lt = torch::max(boxes1.index({Slice(), None, Slice(None, 2)}), boxes2.index({Slice(), Slice(None, 2)}));
    auto rb = torch::min(boxes1.index({Slice(), None, Slice(2)}), boxes2.index({Slice(), Slice(2)}));

    auto wh = (rb - lt).clamp_min(0);                    // (K,M,2)
    auto inter = wh.select(-1, 0) * wh.select(-1, 1);    // (K,M)
    auto unioned = area1.index({Slice(), None}) + area2 - inter;

    return {inter / unioned, unioned};
}

// Degenerate boxes give inf / nan, so check before dividing.
torch::Tensor generalized_box_iou(
    const torch::Tensor& boxes1,
    const torch::Tensor& boxes2
) {
    TORCH_CHECK((boxes1.index({Slice(), Slice(2)}) >= boxes1.index({Slice(), Slice(None, 2)})).all().item<bool>(),
        "generalized_box_iou: boxes1 must be in xyxy format with x2 >= x1, y2 >= y1");
    TORCH_CHECK((boxes2.index({Slice(), Slice(2)}) >= boxes2.index({Slice(), Slice(None, 2)})).all().item<bool>(),
        "generalized_box_iou: boxes2 must be in xyxy format with x2 >= x1, y2 >= y1");

    torch::Tensor iou, unioned;
    std::tie(iou, unioned) = box_iou(boxes1, boxes2);

    auto lt = torch::min(boxes1.index({Slice(), None, Slice(None, 2)}), boxes2.index({Slice(), Slice(None, 2)}));
    auto rb = torch::max(boxes1.index({Slice(), None, Slice(2)}), boxes2.index({Slice(), Slice(2)}));

    auto wh = (rb - lt).clamp_min(0);
    auto area = wh.select(-1, 0) * wh.select(-1, 1);

    return iou - (area - unioned) / area;
}

static std::pair<torch::Tensor, torch::Tensor> elementwise_inter_union(
    const torch::Tensor& boxes1,
    const torch::Tensor& boxes2
) {
    TORCH_CHECK(boxes1.sizes() == boxes2.sizes(),
        "elementwise box ops: box sets must have the same shape");
    auto lt = torch::max(boxes1.index({Slice(), Slice(None, 2)}), boxes2.index({Slice(), Slice(None, 2)}));
    auto rb = torch::min(boxes1.index({Slice(), Slice(2)}), boxes2.index({Slice(), Slice(2)}));
    auto wh = (rb - lt).clamp_min(0);
    auto inter = wh.select(-1, 0) * wh.select(-1, 1);
    return {inter, box_area(boxes1) + box_area(boxes2) - inter};
}

torch::Tensor elementwise_box_iou(const torch::Tensor& boxes1, const torch::Tensor& boxes2) {
    auto iu = elementwise_inter_union(boxes1, boxes2);
    return iu.first / iu.second;
}

torch::Tensor elementwise_generalized_box_iou(const torch::Tensor& boxes1, const torch::Tensor& boxes2) {
    auto iu = elementwise_inter_union(boxes1, boxes2);
    auto iou = iu.first / iu.second;

    auto lt = torch::min(boxes1.index({Slice(), Slice(None, 2)}), boxes2.index({Slice(), Slice(None, 2)}));
    auto rb = torch::max(boxes1.index({Slice(), Slice(2)}), boxes2.index({Slice(), Slice(2)}));
    auto wh = (rb - lt).clamp_min(0);
    auto area = wh.select(-1, 0) * wh.select(-1, 1);

    return iou - (area - iu.second) / area;
}
