#pragma once

#include <torch/torch.h>
#include <torch/csrc/distributed/c10d/Backend.hpp>

// Cross-worker reduction used for the shared matched-object normalizer.
class LossAggregator {
public:
    virtual ~LossAggregator() = default;

    // In-place sum over all workers. Blocks until every worker contributed.
    virtual void all_reduce_sum(torch::Tensor& value) = 0;
    virtual int64_t world_size() const = 0;
};

// Single-process default: no communication, world size 1.
class LocalAggregator : public LossAggregator {
public:
    void all_reduce_sum(torch::Tensor&) override {}
    int64_t world_size() const override { return 1; }
};

// Sums over a c10d backend (ProcessGroupGloo, ProcessGroupNCCL, ...).
class ProcessGroupAggregator : public LossAggregator {
public:
    explicit ProcessGroupAggregator(c10::intrusive_ptr<c10d::Backend> backend);

    void all_reduce_sum(torch::Tensor& value) override;
    int64_t world_size() const override;

private:
    c10::intrusive_ptr<c10d::Backend> backend_;
};
