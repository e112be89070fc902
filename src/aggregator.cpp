#include "aggregator.h"

#include <utility>
#include <vector>

ProcessGroupAggregator::ProcessGroupAggregator(c10::intrusive_ptr<c10d::Backend> backend)
    : backend_(std::move(backend)) {
    TORCH_CHECK(backend_, "ProcessGroupAggregator: backend must not be null");
}

void ProcessGroupAggregator::all_reduce_sum(torch::Tensor& value) {
    std::vector<at::Tensor> tensors{value};
    c10d::AllreduceOptions opts;
    opts.reduceOp = c10d::ReduceOp::SUM;
    auto work = backend_->allreduce(tensors, opts);
    work->wait();
    value = tensors[0];
}

int64_t ProcessGroupAggregator::world_size() const {
    return backend_->getSize();
}
