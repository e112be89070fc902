#include "criterion.h"

#include "matched_indices.h"

#include <set>
#include <utility>

LossKind loss_kind_from_name(const std::string& name) {
    if (name == "labels") return LossKind::ClassificationCE;
    if (name == "focal") return LossKind::ClassificationFocal;
    if (name == "vfl") return LossKind::ClassificationVFL;
    if (name == "boxes") return LossKind::Boxes;
    if (name == "cardinality") return LossKind::Cardinality;
    if (name == "masks") return LossKind::Masks;
    TORCH_CHECK(false, "Unknown loss '", name, "'; expected one of labels, focal, vfl, boxes, cardinality, masks");
}

const char* loss_kind_name(LossKind kind) {
    switch (kind) {
        case LossKind::ClassificationCE:    return "labels";
        case LossKind::ClassificationFocal: return "focal";
        case LossKind::ClassificationVFL:   return "vfl";
        case LossKind::Boxes:               return "boxes";
        case LossKind::Cardinality:         return "cardinality";
        case LossKind::Masks:               return "masks";
    }
    TORCH_CHECK(false, "Invalid loss kind ", static_cast<int64_t>(kind));
}

std::vector<LossKind> losses_from_names(const std::vector<std::string>& names) {
    std::vector<LossKind> kinds;
    kinds.reserve(names.size());
    for (const auto& name : names) {
        kinds.push_back(loss_kind_from_name(name));
    }
    return kinds;
}

void CriterionOptions::validate() const {
    TORCH_CHECK(num_classes > 0, "CriterionOptions: num_classes must be positive");
    TORCH_CHECK(eos_coef >= 0.0, "CriterionOptions: eos_coef must be non-negative");
    TORCH_CHECK(gamma >= 0.0, "CriterionOptions: gamma must be non-negative");
    TORCH_CHECK(sampling.num_points > 0, "CriterionOptions: num_points must be positive");
    TORCH_CHECK(sampling.oversample_ratio >= 1.0, "CriterionOptions: oversample_ratio must be >= 1");
    TORCH_CHECK(sampling.importance_sample_ratio >= 0.0 && sampling.importance_sample_ratio <= 1.0,
        "CriterionOptions: importance_sample_ratio must be in [0,1]");
    for (const auto& entry : weight_dict) {
        TORCH_CHECK(entry.second >= 0.0,
            "CriterionOptions: weight for '", entry.first, "' must be non-negative");
    }
}

std::string stage_key(const std::string& name, LossStage stage, int64_t layer) {
    switch (stage) {
        case LossStage::Main:         return name;
        case LossStage::Aux:          return name + "_aux_" + std::to_string(layer);
        case LossStage::Denoising:    return name + "_dn";
        case LossStage::DenoisingAux: return name + "_dn_" + std::to_string(layer);
    }
    TORCH_CHECK(false, "Invalid loss stage");
}

bool is_diagnostic_loss(const std::string& name) {
    return name == "class_error" || name == "cardinality_error";
}

torch::Tensor stabilize_loss(const torch::Tensor& value, double weight) {
    if (torch::isfinite(value).all().item<bool>()) {
        return value;
    }
    const double replacement = 10.0 * weight;
    return torch::nan_to_num(value, replacement, replacement, -replacement);
}

torch::Tensor CriterionResult::total_loss() const {
    TORCH_CHECK(!losses.empty(), "CriterionResult: no weighted losses to sum");
    auto it = losses.begin();
    torch::Tensor total = it->second;
    for (++it; it != losses.end(); ++it) {
        total = total + it->second;
    }
    return total;
}

void LossResultBuilder::add(const std::string& name, LossStage stage, int64_t layer, const torch::Tensor& value) {
    records_.push_back(LossRecord{name, stage, layer, value});
}

CriterionResult LossResultBuilder::build(const std::map<std::string, double>& weight_dict) const {
    CriterionResult result;
    std::set<std::string> seen;
    for (const auto& record : records_) {
        const std::string key = stage_key(record.name, record.stage, record.layer);
        TORCH_CHECK(seen.insert(key).second, "LossResultBuilder: duplicate loss key '", key, "'");

        if (is_diagnostic_loss(record.name)) {
            result.diagnostics[key] = record.value;
            continue;
        }
        auto weight = weight_dict.find(record.name);
        if (weight == weight_dict.end()) {
            continue;
        }
        result.losses[key] = record.value * weight->second;
    }
    return result;
}

RTDETRCriterion::RTDETRCriterion(
    std::shared_ptr<Matcher> matcher,
    CriterionOptions options,
    std::shared_ptr<LossAggregator> aggregator
) : matcher_(std::move(matcher)),
    options_(std::move(options)),
    aggregator_(std::move(aggregator)),
    logger_(spdlog::default_logger()->clone("rtdetr.criterion")) {
    TORCH_CHECK(matcher_, "RTDETRCriterion: matcher must not be null");
    TORCH_CHECK(aggregator_, "RTDETRCriterion: aggregator must not be null");
    options_.validate();

    empty_weight_ = torch::ones({options_.num_classes + 1}, torch::kFloat);
    empty_weight_[options_.num_classes] = options_.eos_coef;
}

void RTDETRCriterion::set_logger(std::shared_ptr<spdlog::logger> logger) {
    TORCH_CHECK(logger, "RTDETRCriterion: logger must not be null");
    logger_ = std::move(logger);
}

double RTDETRCriterion::weight_or(const std::string& name, double fallback) const {
    auto it = options_.weight_dict.find(name);
    return it == options_.weight_dict.end() ? fallback : it->second;
}

double RTDETRCriterion::num_boxes(const std::vector<Target>& targets, const torch::Device& device) {
    int64_t count = 0;
    for (const auto& t : targets) {
        count += t.labels.numel();
    }
    torch::Tensor total = torch::full({1}, static_cast<double>(count),
        torch::TensorOptions().dtype(torch::kFloat).device(device));
    aggregator_->all_reduce_sum(total);
    return torch::clamp(total / static_cast<double>(aggregator_->world_size()), 1.0).item<double>();
}

LossDict RTDETRCriterion::get_loss(
    LossKind kind,
    const LayerOutputs& outputs,
    const std::vector<Target>& targets,
    const MatchIndices& indices,
    double num_boxes,
    bool log
) const {
    switch (kind) {
        case LossKind::ClassificationCE:
            return loss_labels(outputs, targets, indices, empty_weight_, options_.num_classes, log);
        case LossKind::ClassificationFocal:
            return loss_labels_focal(outputs, targets, indices, num_boxes,
                                     options_.num_classes, options_.alpha, options_.gamma);
        case LossKind::ClassificationVFL:
            return loss_labels_vfl(outputs, targets, indices, num_boxes,
                                   options_.num_classes, options_.alpha, options_.gamma);
        case LossKind::Boxes:
            return loss_boxes(outputs, targets, indices, num_boxes);
        case LossKind::Cardinality:
            return loss_cardinality(outputs, targets);
        case LossKind::Masks:
            return loss_masks(outputs, targets, indices, num_boxes, options_.sampling);
    }
    TORCH_CHECK(false, "Invalid loss kind ", static_cast<int64_t>(kind));
}

void RTDETRCriterion::add_losses(
    LossResultBuilder& builder,
    const LossDict& losses,
    LossStage stage,
    int64_t layer
) const {
    for (const auto& entry : losses) {
        torch::Tensor value = entry.second;
        if (!torch::isfinite(value).all().item<bool>()) {
            const double weight = weight_or(entry.first, 1.0);
            logger_->warn("Unstable value in '{}'. Replacing with {:.1f}.",
                          stage_key(entry.first, stage, layer), 10.0 * weight);
            value = stabilize_loss(value, weight);
        }
        builder.add(entry.first, stage, layer, value);
    }
}

void RTDETRCriterion::add_layer_losses(
    LossResultBuilder& builder,
    const LayerOutputs& outputs,
    const std::vector<Target>& targets,
    const MatchIndices& indices,
    double num_boxes,
    LossStage stage,
    int64_t layer,
    bool log
) const {
    for (LossKind kind : options_.losses) {
        // Only the final layer is required to predict masks.
        if (kind == LossKind::Masks && stage != LossStage::Main && !outputs.has_masks()) {
            continue;
        }
        add_losses(builder, get_loss(kind, outputs, targets, indices, num_boxes, log), stage, layer);
    }
}

CriterionResult RTDETRCriterion::forward(const ModelOutputs& outputs, const std::vector<Target>& targets) {
    TORCH_CHECK(outputs.pred_logits.defined(), "RTDETRCriterion: outputs must contain pred_logits");
    TORCH_CHECK(static_cast<int64_t>(targets.size()) == outputs.pred_logits.size(0),
        "RTDETRCriterion: got ", targets.size(), " targets for a batch of ", outputs.pred_logits.size(0));

    const double norm = num_boxes(targets, outputs.pred_logits.device());
    LossResultBuilder builder;

    MatchIndices indices = (*matcher_)(outputs.without_aux(), targets).indices;
    add_layer_losses(builder, outputs, targets, indices, norm, LossStage::Main, 0, /*log=*/true);

    for (size_t i = 0; i < outputs.aux_outputs.size(); ++i) {
        const LayerOutputs& aux = outputs.aux_outputs[i];
        MatchIndices aux_indices = (*matcher_)(aux, targets).indices;
        add_layer_losses(builder, aux, targets, aux_indices, norm,
                         LossStage::Aux, static_cast<int64_t>(i), /*log=*/false);
    }

    if (outputs.dn_outputs.has_value()) {
        TORCH_CHECK(outputs.dn_meta.has_value(), "RTDETRCriterion: denoising outputs require dn_meta");
        const DenoisingOutputs& dn_outputs = *outputs.dn_outputs;
        const DenoisingMeta& dn_meta = *outputs.dn_meta;

        MatchIndices dn_indices = get_cdn_matched_indices(dn_meta, targets);
        const double dn_norm = norm * static_cast<double>(dn_meta.scalar.value_or(1));
        logger_->debug("denoising: {} aux layers, normalizer {:.2f}", dn_outputs.aux_outputs.size(), dn_norm);

        add_layer_losses(builder, dn_outputs, targets, dn_indices, dn_norm,
                         LossStage::Denoising, 0, /*log=*/true);
        for (size_t i = 0; i < dn_outputs.aux_outputs.size(); ++i) {
            add_layer_losses(builder, dn_outputs.aux_outputs[i], targets, dn_indices, dn_norm,
                             LossStage::DenoisingAux, static_cast<int64_t>(i), /*log=*/true);
        }
    }

    return builder.build(options_.weight_dict);
}
