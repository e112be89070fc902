#include "losses.h"

#include "box_ops.h"
#include "matched_indices.h"
#include "point_sample.h"

#include <algorithm>

namespace F = torch::nn::functional;
using torch::indexing::Slice;

torch::Tensor sigmoid_ce_loss(
    const torch::Tensor& inputs,
    const torch::Tensor& targets,
    double num_masks
) {
    torch::Tensor loss = F::binary_cross_entropy_with_logits(
        inputs, targets, F::BinaryCrossEntropyWithLogitsFuncOptions().reduction(torch::kNone));
    return loss.mean(1).sum() / num_masks;
}

torch::Tensor dice_loss(
    const torch::Tensor& inputs,
    const torch::Tensor& targets,
    double num_masks
) {
    torch::Tensor probs = inputs.sigmoid().flatten(1);
    torch::Tensor flat_targets = targets.flatten(1);
    torch::Tensor numerator = 2 * (probs * flat_targets).sum(-1);
    torch::Tensor denominator = probs.sum(-1) + flat_targets.sum(-1);
    torch::Tensor loss = 1 - (numerator + 1) / (denominator + 1);
    return loss.sum() / num_masks;
}

torch::Tensor sigmoid_focal_loss(
    const torch::Tensor& inputs,
    const torch::Tensor& targets,
    double alpha,
    double gamma
) {
    torch::Tensor p = torch::sigmoid(inputs);
    torch::Tensor ce_loss = F::binary_cross_entropy_with_logits(
        inputs, targets, F::BinaryCrossEntropyWithLogitsFuncOptions().reduction(torch::kNone));
    torch::Tensor p_t = p * targets + (1 - p) * (1 - targets);
    torch::Tensor loss = ce_loss * (1 - p_t).pow(gamma);
    if (alpha >= 0) {
        torch::Tensor alpha_t = alpha * targets + (1 - alpha) * (1 - targets);
        loss = alpha_t * loss;
    }
    return loss;
}

torch::Tensor accuracy(const torch::Tensor& output, const torch::Tensor& target) {
    torch::NoGradGuard no_grad;
    if (target.numel() == 0) {
        return torch::zeros({}, output.options());
    }
    const int64_t batch_size = target.size(0);
    torch::Tensor pred = std::get<1>(output.topk(1, 1, /*largest=*/true, /*sorted=*/true));  // (K,1)
    torch::Tensor correct = pred.eq(target.view({-1, 1}).expand_as(pred));
    return correct.to(output.scalar_type()).sum() * (100.0 / batch_size);
}

torch::Tensor pad_target_masks(const std::vector<torch::Tensor>& masks) {
    TORCH_CHECK(!masks.empty(), "pad_target_masks: expected at least one image");
    int64_t max_m = 0, max_h = 0, max_w = 0;
    for (const auto& m : masks) {
        TORCH_CHECK(m.defined(), "pad_target_masks: every target must carry masks");
        TORCH_CHECK(m.dim() == 3, "pad_target_masks: masks must be (M,h,w)");
        max_m = std::max(max_m, m.size(0));
        max_h = std::max(max_h, m.size(1));
        max_w = std::max(max_w, m.size(2));
    }

    const int64_t B = static_cast<int64_t>(masks.size());
    torch::Tensor padded = torch::zeros({B, max_m, max_h, max_w}, masks[0].options());
    for (int64_t b = 0; b < B; ++b) {
        const auto& m = masks[b];
        padded.index({b, Slice(0, m.size(0)), Slice(0, m.size(1)), Slice(0, m.size(2))})
            .copy_(m);
    }
    return padded;
}

static torch::Tensor gather_target_labels(const std::vector<Target>& targets, const MatchIndices& indices) {
    std::vector<torch::Tensor> parts;
    parts.reserve(targets.size());
    for (size_t i = 0; i < targets.size(); ++i) {
        parts.push_back(targets[i].labels.index_select(0, indices[i].second.to(targets[i].labels.device())));
    }
    return torch::cat(parts);
}

static torch::Tensor gather_target_boxes(const std::vector<Target>& targets, const MatchIndices& indices) {
    std::vector<torch::Tensor> parts;
    parts.reserve(targets.size());
    for (size_t i = 0; i < targets.size(); ++i) {
        TORCH_CHECK(targets[i].boxes.defined(), "target ", i, " is missing boxes");
        parts.push_back(targets[i].boxes.index_select(0, indices[i].second.to(targets[i].boxes.device())));
    }
    return torch::cat(parts, 0);
}

static void check_indices(const std::vector<Target>& targets, const MatchIndices& indices) {
    TORCH_CHECK(!targets.empty(), "losses: expected at least one target image");
    TORCH_CHECK(targets.size() == indices.size(),
        "losses: got ", indices.size(), " index pairs for ", targets.size(), " images");
}

torch::Tensor build_target_classes(
    const torch::Tensor& src_logits,
    const std::vector<Target>& targets,
    const MatchIndices& indices,
    int64_t num_classes
) {
    auto idx = get_src_permutation_idx(indices);
    torch::Tensor target_classes_o = gather_target_labels(targets, indices).to(src_logits.device(), torch::kLong);
    torch::Tensor target_classes = torch::full(
        {src_logits.size(0), src_logits.size(1)}, num_classes,
        torch::TensorOptions().dtype(torch::kLong).device(src_logits.device()));
    target_classes.index_put_({idx.first.to(src_logits.device()), idx.second.to(src_logits.device())},
        target_classes_o);
    return target_classes;
}

LossDict loss_labels(
    const LayerOutputs& outputs,
    const std::vector<Target>& targets,
    const MatchIndices& indices,
    const torch::Tensor& empty_weight,
    int64_t num_classes,
    bool log
) {
    TORCH_CHECK(outputs.pred_logits.defined(), "loss_labels: outputs must contain pred_logits");
    check_indices(targets, indices);
    const torch::Tensor& src_logits = outputs.pred_logits;  // (B,N,C+1)
    TORCH_CHECK(src_logits.size(-1) == num_classes + 1,
        "loss_labels: pred_logits must have num_classes + 1 (", num_classes + 1, ") columns, got ",
        src_logits.size(-1));

    torch::Tensor target_classes = build_target_classes(src_logits, targets, indices, num_classes);
    torch::Tensor loss_ce = F::cross_entropy(
        src_logits.transpose(1, 2), target_classes,
        F::CrossEntropyFuncOptions().weight(empty_weight.to(src_logits.device(), src_logits.scalar_type())));

    LossDict losses{{"loss_ce", loss_ce}};
    if (log) {
        auto idx = get_src_permutation_idx(indices);
        torch::Tensor matched_logits = src_logits.index({idx.first.to(src_logits.device()),
                                                         idx.second.to(src_logits.device())});
        torch::Tensor target_classes_o = gather_target_labels(targets, indices).to(src_logits.device());
        if (target_classes_o.numel() == 0) {
            losses["class_error"] = torch::zeros({}, src_logits.options().requires_grad(false));
        } else {
            losses["class_error"] = 100 - accuracy(matched_logits, target_classes_o);
        }
    }
    return losses;
}

// Shared by focal and varifocal: one-hot over the real classes, the
// no-object column dropped so unmatched slots become all-zero rows.
static torch::Tensor one_hot_targets(const torch::Tensor& target_classes, int64_t num_classes) {
    return torch::one_hot(target_classes, num_classes + 1).narrow(-1, 0, num_classes);
}

LossDict loss_labels_focal(
    const LayerOutputs& outputs,
    const std::vector<Target>& targets,
    const MatchIndices& indices,
    double num_boxes,
    int64_t num_classes,
    double alpha,
    double gamma
) {
    TORCH_CHECK(outputs.pred_logits.defined(), "loss_labels_focal: outputs must contain pred_logits");
    check_indices(targets, indices);
    const torch::Tensor& src_logits = outputs.pred_logits;  // (B,N,C)
    TORCH_CHECK(src_logits.size(-1) == num_classes,
        "loss_labels_focal: pred_logits must have num_classes (", num_classes, ") columns, got ",
        src_logits.size(-1));

    torch::Tensor target_classes = build_target_classes(src_logits, targets, indices, num_classes);
    torch::Tensor target = one_hot_targets(target_classes, num_classes).to(src_logits.scalar_type());

    torch::Tensor loss = sigmoid_focal_loss(src_logits, target, alpha, gamma);
    loss = loss.mean(1).sum() * src_logits.size(1) / num_boxes;
    return {{"loss_focal", loss}};
}

LossDict loss_labels_vfl(
    const LayerOutputs& outputs,
    const std::vector<Target>& targets,
    const MatchIndices& indices,
    double num_boxes,
    int64_t num_classes,
    double alpha,
    double gamma
) {
    TORCH_CHECK(outputs.pred_boxes.defined(), "loss_labels_vfl: outputs must contain pred_boxes");
    TORCH_CHECK(outputs.pred_logits.defined(), "loss_labels_vfl: outputs must contain pred_logits");
    check_indices(targets, indices);
    const torch::Tensor& src_logits = outputs.pred_logits;  // (B,N,C)
    TORCH_CHECK(src_logits.size(-1) == num_classes,
        "loss_labels_vfl: pred_logits must have num_classes (", num_classes, ") columns, got ",
        src_logits.size(-1));
    const auto device = src_logits.device();

    auto idx = get_src_permutation_idx(indices);
    torch::Tensor batch_idx = idx.first.to(device);
    torch::Tensor src_idx = idx.second.to(device);

    torch::Tensor src_boxes = outputs.pred_boxes.index({batch_idx, src_idx});
    torch::Tensor target_boxes = gather_target_boxes(targets, indices).to(src_boxes.device(), src_boxes.scalar_type());
    torch::Tensor ious = elementwise_box_iou(box_cxcywh_to_xyxy(src_boxes), box_cxcywh_to_xyxy(target_boxes)).detach();

    torch::Tensor target_classes = build_target_classes(src_logits, targets, indices, num_classes);
    torch::Tensor target = one_hot_targets(target_classes, num_classes).to(src_logits.scalar_type());

    torch::Tensor target_score_o = torch::zeros(target_classes.sizes(), src_logits.options().requires_grad(false));
    target_score_o.index_put_({batch_idx, src_idx}, ious.to(target_score_o.scalar_type()));
    torch::Tensor target_score = target_score_o.unsqueeze(-1) * target;

    torch::Tensor pred_score = torch::sigmoid(src_logits).detach();
    torch::Tensor weight = alpha * pred_score.pow(gamma) * (1 - target) + target_score;

    torch::Tensor loss = F::binary_cross_entropy_with_logits(
        src_logits, target_score,
        F::BinaryCrossEntropyWithLogitsFuncOptions().weight(weight).reduction(torch::kNone));
    loss = loss.mean(1).sum() * src_logits.size(1) / num_boxes;
    return {{"loss_vfl", loss}};
}

LossDict loss_boxes(
    const LayerOutputs& outputs,
    const std::vector<Target>& targets,
    const MatchIndices& indices,
    double num_boxes
) {
    TORCH_CHECK(outputs.pred_boxes.defined(), "loss_boxes: outputs must contain pred_boxes");
    check_indices(targets, indices);
    const auto device = outputs.pred_boxes.device();

    auto idx = get_src_permutation_idx(indices);
    torch::Tensor src_boxes = outputs.pred_boxes.index({idx.first.to(device), idx.second.to(device)});
    torch::Tensor target_boxes = gather_target_boxes(targets, indices).to(device, src_boxes.scalar_type());

    LossDict losses;
    torch::Tensor loss_bbox = F::l1_loss(src_boxes, target_boxes, F::L1LossFuncOptions().reduction(torch::kNone));
    losses["loss_bbox"] = loss_bbox.sum() / num_boxes;

    torch::Tensor loss_giou = 1 - elementwise_generalized_box_iou(
        box_cxcywh_to_xyxy(src_boxes), box_cxcywh_to_xyxy(target_boxes));
    losses["loss_giou"] = loss_giou.sum() / num_boxes;
    return losses;
}

LossDict loss_cardinality(const LayerOutputs& outputs, const std::vector<Target>& targets) {
    torch::NoGradGuard no_grad;
    TORCH_CHECK(outputs.pred_logits.defined(), "loss_cardinality: outputs must contain pred_logits");
    const torch::Tensor& pred_logits = outputs.pred_logits;  // (B,N,C)
    TORCH_CHECK(static_cast<int64_t>(targets.size()) == pred_logits.size(0),
        "loss_cardinality: got ", targets.size(), " targets for a batch of ", pred_logits.size(0));

    std::vector<int64_t> lengths;
    lengths.reserve(targets.size());
    for (const auto& t : targets) {
        lengths.push_back(t.labels.numel());
    }
    torch::Tensor tgt_lengths = torch::tensor(lengths, torch::kLong).to(pred_logits.device());

    // The last logit column is the no-object slot.
    torch::Tensor card_pred = (pred_logits.argmax(-1) != pred_logits.size(-1) - 1).sum(1);
    torch::Tensor card_err = F::l1_loss(card_pred.to(torch::kFloat), tgt_lengths.to(torch::kFloat));
    return {{"cardinality_error", card_err}};
}

LossDict loss_masks(
    const LayerOutputs& outputs,
    const std::vector<Target>& targets,
    const MatchIndices& indices,
    double num_masks,
    const PointSamplingOptions& sampling
) {
    TORCH_CHECK(outputs.has_masks(), "loss_masks: outputs must contain pred_masks");
    check_indices(targets, indices);
    const auto device = outputs.pred_masks.device();

    auto src_idx = get_src_permutation_idx(indices);
    auto tgt_idx = get_tgt_permutation_idx(indices);
    torch::Tensor src_masks = outputs.pred_masks.index({src_idx.first.to(device), src_idx.second.to(device)});  // (K,H,W)

    std::vector<torch::Tensor> masks;
    masks.reserve(targets.size());
    for (const auto& t : targets) {
        masks.push_back(t.masks);
    }
    torch::Tensor target_masks = pad_target_masks(masks).to(device, src_masks.scalar_type());
    target_masks = target_masks.index({tgt_idx.first.to(device), tgt_idx.second.to(device)});  // (K,Ht,Wt)

    if (src_masks.size(0) == 0) {
        torch::Tensor zero = src_masks.sum() * 0.0;
        return {{"loss_mask_bce", zero}, {"loss_mask_dice", zero.clone()}};
    }

    // Predictions stay at their own resolution; normalized coordinates make
    // the two grids comparable.
    src_masks = src_masks.unsqueeze(1);
    target_masks = target_masks.unsqueeze(1);

    torch::Tensor point_coords;
    torch::Tensor point_labels;
    {
        torch::NoGradGuard no_grad;
        point_coords = get_uncertain_point_coords_with_randomness(
            src_masks,
            calculate_uncertainty,
            sampling.num_points,
            sampling.oversample_ratio,
            sampling.importance_sample_ratio
        );
        point_labels = point_sample(target_masks, point_coords).squeeze(1);
    }

    torch::Tensor point_logits = point_sample(src_masks, point_coords).squeeze(1);
    // Keep within float16 range.
    point_logits = torch::clamp(point_logits, -15.0, 15.0);

    return {
        {"loss_mask_bce", sigmoid_ce_loss(point_logits, point_labels, num_masks)},
        {"loss_mask_dice", dice_loss(point_logits, point_labels, num_masks)},
    };
}
