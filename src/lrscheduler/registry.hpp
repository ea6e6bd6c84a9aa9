#ifndef GRAFT_LRSCHEDULER_REGISTRY_HPP
#define GRAFT_LRSCHEDULER_REGISTRY_HPP

#include <memory>

#include <torch/torch.h>

#include "details/warmup_step_decay.hpp"

namespace Graft::LrScheduler::Details {
    inline std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer& optimizer, const WarmupStepDecayDescriptor& descriptor) {
        return std::make_unique<WarmupStepDecayScheduler>(optimizer, descriptor.options);
    }
}

#endif //GRAFT_LRSCHEDULER_REGISTRY_HPP
