#pragma once

#include "aggregator.h"
#include "losses.h"
#include "matcher.h"
#include "types.h"

#include <spdlog/spdlog.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

enum class LossKind : int64_t {
    ClassificationCE = 0,
    ClassificationFocal = 1,
    ClassificationVFL = 2,
    Boxes = 3,
    Cardinality = 4,
    Masks = 5,
};

// "labels", "focal", "vfl", "boxes", "cardinality", "masks".
LossKind loss_kind_from_name(const std::string& name);
const char* loss_kind_name(LossKind kind);
std::vector<LossKind> losses_from_names(const std::vector<std::string>& names);

struct CriterionOptions {
    int64_t num_classes = 80;
    double alpha = 0.2;
    double gamma = 2.0;
    double eos_coef = 1e-4;
    PointSamplingOptions sampling;
    std::vector<LossKind> losses;
    std::map<std::string, double> weight_dict;

    void validate() const;
};

enum class LossStage {
    Main,
    Aux,
    Denoising,
    DenoisingAux,
};

struct LossRecord {
    std::string name;
    LossStage stage;
    int64_t layer;
    torch::Tensor value;
};

// name, name_aux_{i}, name_dn, name_dn_{i}
std::string stage_key(const std::string& name, LossStage stage, int64_t layer);

// class_error and cardinality_error are reported but never weighted.
bool is_diagnostic_loss(const std::string& name);

// Non-finite values become +-10 * weight (sign kept for -inf); finite values
// pass through unchanged.
torch::Tensor stabilize_loss(const torch::Tensor& value, double weight);

// Callers that want a single flat mapping merge the two maps; their keys
// never overlap.
struct CriterionResult {
    std::map<std::string, torch::Tensor> losses;       // weighted, filtered by the weight table
    std::map<std::string, torch::Tensor> diagnostics;  // unweighted

    torch::Tensor total_loss() const;
};

class LossResultBuilder {
public:
    void add(const std::string& name, LossStage stage, int64_t layer, const torch::Tensor& value);

    // Weights every non-diagnostic record found in weight_dict and drops the
    // rest. Two records flattening to the same key is an error.
    CriterionResult build(const std::map<std::string, double>& weight_dict) const;

private:
    std::vector<LossRecord> records_;
};

// Loss for RT-DETR style detectors with point-sampled mask supervision and
// denoising queries.
//  1) matcher assigns ground truth to the predictions of each layer
//     (denoising queries use the fixed pairing from dn_meta);
//  2) every configured loss is computed on the matched pairs.
class RTDETRCriterion {
public:
    RTDETRCriterion(
        std::shared_ptr<Matcher> matcher,
        CriterionOptions options,
        std::shared_ptr<LossAggregator> aggregator = std::make_shared<LocalAggregator>()
    );

    CriterionResult forward(const ModelOutputs& outputs, const std::vector<Target>& targets);
    CriterionResult operator()(const ModelOutputs& outputs, const std::vector<Target>& targets) {
        return forward(outputs, targets);
    }

    LossDict get_loss(
        LossKind kind,
        const LayerOutputs& outputs,
        const std::vector<Target>& targets,
        const MatchIndices& indices,
        double num_boxes,
        bool log = true
    ) const;

    // Matched-object count averaged over workers, at least 1.
    double num_boxes(const std::vector<Target>& targets, const torch::Device& device);

    const CriterionOptions& options() const { return options_; }
    const torch::Tensor& empty_weight() const { return empty_weight_; }

    void set_logger(std::shared_ptr<spdlog::logger> logger);

private:
    void add_losses(
        LossResultBuilder& builder,
        const LossDict& losses,
        LossStage stage,
        int64_t layer
    ) const;

    void add_layer_losses(
        LossResultBuilder& builder,
        const LayerOutputs& outputs,
        const std::vector<Target>& targets,
        const MatchIndices& indices,
        double num_boxes,
        LossStage stage,
        int64_t layer,
        bool log
    ) const;

    double weight_or(const std::string& name, double fallback) const;

    std::shared_ptr<Matcher> matcher_;
    CriterionOptions options_;
    std::shared_ptr<LossAggregator> aggregator_;
    torch::Tensor empty_weight_;  // (num_classes+1,), last entry eos_coef
    std::shared_ptr<spdlog::logger> logger_;
};
