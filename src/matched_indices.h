#pragma once

#include "types.h"

#include <utility>
#include <vector>

// Flatten per-image match indices into (batch_idx, pred_idx) suitable for
// indexing (B,N,...) prediction tensors.
std::pair<torch::Tensor, torch::Tensor> get_src_permutation_idx(const MatchIndices& indices);

// Same as above for the target side: (batch_idx, tgt_idx).
std::pair<torch::Tensor, torch::Tensor> get_tgt_permutation_idx(const MatchIndices& indices);

// Builds the fixed prediction/target pairing of the denoising queries from
// the metadata produced by the denoising generator. No matcher is involved.
MatchIndices get_cdn_matched_indices(const DenoisingMeta& dn_meta, const std::vector<Target>& targets);
