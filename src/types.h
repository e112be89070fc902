#pragma once

#include <torch/torch.h>
#include <c10/util/Optional.h>
#include <cstdint>
#include <utility>
#include <vector>

// Predictions of a single decoder layer.
struct LayerOutputs {
    torch::Tensor pred_logits;   // (B,N,C), float
    torch::Tensor pred_boxes;    // (B,N,4), float, cxcywh in [0,1]
    torch::Tensor pred_masks;    // (B,N,H,W), float, undefined without mask head

    bool has_masks() const { return pred_masks.defined(); }
};

struct DenoisingOutputs : LayerOutputs {
    std::vector<LayerOutputs> aux_outputs;
};

// Two layouts are supported. The map-known-indice layout is selected when
// ``map_known_indice`` is defined, otherwise ``dn_positive_idx`` and
// ``dn_num_group`` are used.
struct DenoisingMeta {
    std::vector<torch::Tensor> dn_positive_idx;  // per image, (G*num_gt,), int64
    int64_t dn_num_group = 0;

    torch::Tensor map_known_indice;  // (K,), int64
    int64_t pad_size = 0;
    c10::optional<int64_t> scalar;

    bool uses_known_indice_map() const { return map_known_indice.defined(); }
};

struct ModelOutputs : LayerOutputs {
    std::vector<LayerOutputs> aux_outputs;
    c10::optional<DenoisingOutputs> dn_outputs;
    c10::optional<DenoisingMeta> dn_meta;

    LayerOutputs without_aux() const {
        return LayerOutputs{pred_logits, pred_boxes, pred_masks};
    }
};

struct Target {
    torch::Tensor labels;  // (M,), int64
    torch::Tensor boxes;   // (M,4), float, cxcywh in [0,1]
    torch::Tensor masks;   // (M,h,w), undefined when masks are not supervised
};

// One (prediction-indices, target-indices) pair per image.
using MatchIndices = std::vector<std::pair<torch::Tensor, torch::Tensor>>;

struct MatchResult {
    MatchIndices indices;
};
