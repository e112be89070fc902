#include "matched_indices.h"

static std::pair<torch::Tensor, torch::Tensor> permutation_idx(const MatchIndices& indices, bool target_side) {
    std::vector<torch::Tensor> batch_parts;
    std::vector<torch::Tensor> idx_parts;
    batch_parts.reserve(indices.size());
    idx_parts.reserve(indices.size());

    for (size_t i = 0; i < indices.size(); ++i) {
        const torch::Tensor& idx = target_side ? indices[i].second : indices[i].first;
        batch_parts.push_back(torch::full_like(idx, static_cast<int64_t>(i)));
        idx_parts.push_back(idx);
    }
    if (idx_parts.empty()) {
        auto empty = torch::zeros({0}, torch::kLong);
        return {empty, empty.clone()};
    }
    return {torch::cat(batch_parts), torch::cat(idx_parts)};
}

std::pair<torch::Tensor, torch::Tensor> get_src_permutation_idx(const MatchIndices& indices) {
    return permutation_idx(indices, /*target_side=*/false);
}

std::pair<torch::Tensor, torch::Tensor> get_tgt_permutation_idx(const MatchIndices& indices) {
    return permutation_idx(indices, /*target_side=*/true);
}

// MaskDINO layout: ``scalar`` groups of ``single_pad`` queries each; the
// j-th query of group g denoises ground truth j.
static MatchIndices known_indice_map_indices(const DenoisingMeta& dn_meta, const std::vector<Target>& targets) {
    TORCH_CHECK(dn_meta.scalar.has_value() && *dn_meta.scalar > 0,
        "get_cdn_matched_indices: scalar must be a positive group count");
    const int64_t scalar = *dn_meta.scalar;
    TORCH_CHECK(dn_meta.pad_size % scalar == 0,
        "get_cdn_matched_indices: pad_size (", dn_meta.pad_size, ") must be divisible by scalar (", scalar, ")");
    const int64_t single_pad = dn_meta.pad_size / scalar;

    MatchIndices out;
    out.reserve(targets.size());
    for (const auto& target : targets) {
        const auto device = target.labels.device();
        const auto long_opts = torch::TensorOptions().dtype(torch::kLong).device(device);
        const int64_t num_gt = target.labels.numel();
        TORCH_CHECK(num_gt <= single_pad,
            "get_cdn_matched_indices: image has ", num_gt, " ground truths but denoising groups hold only ",
            single_pad, " queries (pad_size ", dn_meta.pad_size, ", scalar ", scalar, ")");
        if (num_gt > 0) {
            torch::Tensor t = torch::arange(num_gt, long_opts).unsqueeze(0).repeat({scalar, 1});  // (S,num_gt)
            torch::Tensor tgt_idx = t.flatten();
            torch::Tensor output_idx = (torch::arange(scalar, long_opts) * single_pad).unsqueeze(1) + t;
            out.emplace_back(output_idx.flatten(), tgt_idx);
        } else {
            out.emplace_back(torch::zeros({0}, long_opts), torch::zeros({0}, long_opts));
        }
    }
    return out;
}

// RT-DETR layout: the generator already reports the positive query indices of
// every image; group g lines up with ground truths 0..num_gt-1 in order.
static MatchIndices positive_idx_indices(const DenoisingMeta& dn_meta, const std::vector<Target>& targets) {
    TORCH_CHECK(dn_meta.dn_positive_idx.size() == targets.size(),
        "get_cdn_matched_indices: dn_positive_idx has ", dn_meta.dn_positive_idx.size(),
        " entries for ", targets.size(), " images");

    MatchIndices out;
    out.reserve(targets.size());
    for (size_t i = 0; i < targets.size(); ++i) {
        const auto device = targets[i].labels.device();
        const auto long_opts = torch::TensorOptions().dtype(torch::kLong).device(device);
        const int64_t num_gt = targets[i].labels.numel();
        if (num_gt > 0) {
            torch::Tensor gt_idx = torch::arange(num_gt, long_opts).repeat({dn_meta.dn_num_group});
            const torch::Tensor& positive = dn_meta.dn_positive_idx[i];
            TORCH_CHECK(positive.numel() == gt_idx.numel(),
                "get_cdn_matched_indices: image ", i, " has ", positive.numel(),
                " positive denoising queries, expected ", gt_idx.numel());
            out.emplace_back(positive.to(long_opts), gt_idx);
        } else {
            out.emplace_back(torch::zeros({0}, long_opts), torch::zeros({0}, long_opts));
        }
    }
    return out;
}

MatchIndices get_cdn_matched_indices(const DenoisingMeta& dn_meta, const std::vector<Target>& targets) {
    if (dn_meta.uses_known_indice_map()) {
        return known_indice_map_indices(dn_meta, targets);
    }
    return positive_idx_indices(dn_meta, targets);
}
