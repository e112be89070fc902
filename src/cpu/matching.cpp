
#include "../matcher.h"
#include "../box_ops.h"

#include <ATen/Parallel.h>
#include <vector>
#include <limits>
#include <cmath>
#include <tuple>
#include <algorithm>
#include <numeric>
#include <utility>

// Finite substitute for +inf / nan costs, large enough to lose against any
// real pairing.
static inline double big_from(const double* cost, int64_t n) {
    double max_abs = 0.0;
    for (int64_t i = 0; i < n; ++i) {
        if (std::isfinite(cost[i])) {
            max_abs = std::max(max_abs, std::abs(cost[i]));
        }
    }
    double b = (max_abs + 1.0) * 1e6;
    if (!std::isfinite(b) || b > 1e290) {
        b = 1e290;
    }
    return b;
}

// Run the Hungarian algorithm (shortest augmenting path with potentials) on
// a rows x cols matrix with rows <= cols.
//
// Arguments:
//   cost           : Pointer to the flattened (rows x cols) cost matrix.
//   rows / cols    : Matrix shape, rows <= cols.
//   transposed     : Read ``cost`` as (cols x rows) instead.
//   BIG            : Finite substitute for non-finite costs.
//   assignment_out : Output vector mapping every row to its column.
static void hungarian_assign(
    const double* cost,
    int64_t rows,
    int64_t cols,
    bool transposed,
    double BIG,
    std::vector<int64_t>& assignment_out
) {
    assignment_out.assign(rows, -1);
    if (rows == 0 || cols == 0) {
        return;
    }
    TORCH_CHECK(rows <= cols, "hungarian_assign: expected rows <= cols");

    auto at = [&](int64_t r, int64_t c) {
        const double raw = transposed ? cost[c * rows + r] : cost[r * cols + c];
        return std::isfinite(raw) ? raw : BIG;
    };

    std::vector<double> u(rows + 1, 0.0), v(cols + 1, 0.0);
    std::vector<int64_t> p(cols + 1, 0), way(cols + 1, 0);

    for (int64_t i = 1; i <= rows; ++i) {
        p[0] = i;
        int64_t j0 = 0;

        std::vector<double> minv(cols + 1, std::numeric_limits<double>::infinity());
        std::vector<char> used(cols + 1, 0);

        do {
            used[j0] = 1;
            const int64_t i0 = p[j0];

            double delta = std::numeric_limits<double>::infinity();
            int64_t j1 = 0;

            for (int64_t j = 1; j <= cols; ++j) {
                if (used[j]) {
                    continue;
                }
                const double cur = at(i0 - 1, j - 1) - u[i0] - v[j];
                if (cur < minv[j]) {
                    minv[j] = cur;
                    way[j] = j0;
                }
                if (minv[j] < delta) {
                    delta = minv[j];
                    j1 = j;
                }
            }

            TORCH_CHECK(std::isfinite(delta), "Hungarian: no augmenting path found; check costs.");

            for (int64_t j = 0; j <= cols; ++j) {
                if (used[j]) {
                    u[p[j]] += delta;
                    v[j] -= delta;
                } else {
                    minv[j] -= delta;
                }
            }
            j0 = j1;
        } while (p[j0] != 0);

        do {
            const int64_t j1 = way[j0];
            p[j0] = p[j1];
            j0 = j1;
        } while (j0 != 0);
    }

    for (int64_t j = 1; j <= cols; ++j) {
        const int64_t i = p[j];
        if (i > 0) {
            assignment_out[i - 1] = j - 1;
        }
    }
}

// Solves one (R,C) slice and writes the row-sorted pairs.
static void assign_slice(
    const double* cost,
    int64_t R,
    int64_t C,
    std::vector<int64_t>& rows_out,
    std::vector<int64_t>& cols_out
) {
    rows_out.clear();
    cols_out.clear();
    if (R == 0 || C == 0) {
        return;
    }

    const double BIG = big_from(cost, R * C);
    std::vector<int64_t> assignment;

    if (R <= C) {
        hungarian_assign(cost, R, C, /*transposed=*/false, BIG, assignment);
        for (int64_t r = 0; r < R; ++r) {
            if (assignment[r] >= 0) {
                rows_out.push_back(r);
                cols_out.push_back(assignment[r]);
            }
        }
        return;
    }

    // More rows than columns: assign every column to a row, then sort the
    // pairs by row.
    hungarian_assign(cost, C, R, /*transposed=*/true, BIG, assignment);
    std::vector<std::pair<int64_t, int64_t>> pairs;
    pairs.reserve(C);
    for (int64_t c = 0; c < C; ++c) {
        if (assignment[c] >= 0) {
            pairs.emplace_back(assignment[c], c);
        }
    }
    std::sort(pairs.begin(), pairs.end());
    for (const auto& pr : pairs) {
        rows_out.push_back(pr.first);
        cols_out.push_back(pr.second);
    }
}

static torch::Tensor to_long_tensor(const std::vector<int64_t>& values) {
    return torch::tensor(values, torch::TensorOptions().dtype(torch::kLong));
}

std::pair<torch::Tensor, torch::Tensor> linear_sum_assignment(const torch::Tensor& cost) {
    TORCH_CHECK(cost.dim() == 2, "linear_sum_assignment: cost must be 2-D");
    torch::Tensor host = cost.detach().to(torch::kCPU, torch::kDouble).contiguous();

    std::vector<int64_t> rows, cols;
    assign_slice(host.data_ptr<double>(), host.size(0), host.size(1), rows, cols);
    if (rows.empty()) {
        auto empty = torch::zeros({0}, torch::kLong);
        return {empty, empty.clone()};
    }
    return {to_long_tensor(rows), to_long_tensor(cols)};
}

HungarianMatcher::HungarianMatcher(const HungarianMatcherOptions& options) : options_(options) {
    TORCH_CHECK(options_.cost_class != 0 || options_.cost_bbox != 0 || options_.cost_giou != 0,
        "HungarianMatcher: all costs can't be 0");
    TORCH_CHECK(options_.gamma >= 0.0, "HungarianMatcher: gamma must be non-negative");
}

torch::Tensor HungarianMatcher::cost_matrix(const LayerOutputs& outputs, const std::vector<Target>& targets) const {
    torch::NoGradGuard no_grad;
    TORCH_CHECK(outputs.pred_logits.defined(), "HungarianMatcher: outputs must contain pred_logits");
    TORCH_CHECK(outputs.pred_boxes.defined(), "HungarianMatcher: outputs must contain pred_boxes");

    const int64_t bs = outputs.pred_logits.size(0);
    const int64_t num_queries = outputs.pred_logits.size(1);
    const auto device = outputs.pred_logits.device();

    torch::Tensor out_bbox = outputs.pred_boxes.flatten(0, 1);  // (B*N,4)
    torch::Tensor out_prob = options_.use_focal_loss
        ? torch::sigmoid(outputs.pred_logits.flatten(0, 1))
        : torch::softmax(outputs.pred_logits.flatten(0, 1), -1);

    std::vector<torch::Tensor> ids, boxes;
    for (const auto& t : targets) {
        ids.push_back(t.labels.to(device, torch::kLong));
        boxes.push_back(t.boxes.to(device, out_bbox.scalar_type()));
    }
    torch::Tensor tgt_ids = torch::cat(ids);
    torch::Tensor tgt_bbox = torch::cat(boxes, 0);

    torch::Tensor cost_class;
    if (options_.use_focal_loss) {
        torch::Tensor prob = out_prob.index_select(1, tgt_ids);
        const double alpha = options_.alpha;
        const double gamma = options_.gamma;
        torch::Tensor neg_cost_class = (1 - alpha) * prob.pow(gamma) * (-(1 - prob + 1e-8).log());
        torch::Tensor pos_cost_class = alpha * (1 - prob).pow(gamma) * (-(prob + 1e-8).log());
        cost_class = pos_cost_class - neg_cost_class;
    } else {
        cost_class = -out_prob.index_select(1, tgt_ids);
    }

    torch::Tensor cost_bbox = torch::cdist(out_bbox, tgt_bbox, /*p=*/1);
    torch::Tensor cost_giou = -generalized_box_iou(box_cxcywh_to_xyxy(out_bbox), box_cxcywh_to_xyxy(tgt_bbox));

    torch::Tensor C = options_.cost_bbox * cost_bbox + options_.cost_class * cost_class + options_.cost_giou * cost_giou;
    return C.view({bs, num_queries, -1}).to(torch::kCPU, torch::kDouble).contiguous();
}

MatchResult HungarianMatcher::operator()(const LayerOutputs& outputs, const std::vector<Target>& targets) {
    TORCH_CHECK(outputs.pred_logits.defined(), "HungarianMatcher: outputs must contain pred_logits");
    const int64_t B = outputs.pred_logits.size(0);
    const int64_t Q = outputs.pred_logits.size(1);
    TORCH_CHECK(static_cast<int64_t>(targets.size()) == B,
        "HungarianMatcher: got ", targets.size(), " targets for a batch of ", B);

    std::vector<int64_t> sizes(B), offsets(B, 0);
    for (int64_t b = 0; b < B; ++b) {
        sizes[b] = targets[b].labels.numel();
        if (b > 0) {
            offsets[b] = offsets[b - 1] + sizes[b - 1];
        }
    }
    const int64_t total = std::accumulate(sizes.begin(), sizes.end(), int64_t{0});

    MatchResult result;
    result.indices.resize(B);
    if (total == 0) {
        for (auto& pair : result.indices) {
            pair = {torch::zeros({0}, torch::kLong), torch::zeros({0}, torch::kLong)};
        }
        return result;
    }

    torch::Tensor costs = cost_matrix(outputs, targets);  // (B,Q,total)
    const double* cost_ptr = costs.data_ptr<double>();

    std::vector<std::vector<int64_t>> rows(B), cols(B);
    at::parallel_for(0, B, /*grain_size=*/1, [&](int64_t begin, int64_t end) {
        for (int64_t b = begin; b < end; ++b) {
            // Image b only competes for its own block of target columns.
            std::vector<double> slice(Q * sizes[b]);
            const double* base = cost_ptr + b * Q * total;
            for (int64_t q = 0; q < Q; ++q) {
                std::copy(base + q * total + offsets[b],
                          base + q * total + offsets[b] + sizes[b],
                          slice.begin() + q * sizes[b]);
            }
            assign_slice(slice.data(), Q, sizes[b], rows[b], cols[b]);
        }
    });

    for (int64_t b = 0; b < B; ++b) {
        if (rows[b].empty()) {
            result.indices[b] = {torch::zeros({0}, torch::kLong), torch::zeros({0}, torch::kLong)};
        } else {
            result.indices[b] = {to_long_tensor(rows[b]), to_long_tensor(cols[b])};
        }
    }
    return result;
}
