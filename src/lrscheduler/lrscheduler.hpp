#ifndef GRAFT_LRSCHEDULER_HPP
#define GRAFT_LRSCHEDULER_HPP
// Factory surface only. Schedules live in "/details".
#include <memory>
#include <variant>

#include "details/common.hpp"
#include "details/warmup_step_decay.hpp"
#include "registry.hpp"

namespace Graft::LrScheduler {
    using Scheduler = Details::Scheduler;

    using WarmupStepDecayOptions = Details::WarmupStepDecayOptions;
    using WarmupStepDecayDescriptor = Details::WarmupStepDecayDescriptor;

    using Descriptor = std::variant<WarmupStepDecayDescriptor>;

    [[nodiscard]] inline auto WarmupStepDecay(WarmupStepDecayOptions options = {}) -> WarmupStepDecayDescriptor {
        return {std::move(options)};
    }

    [[nodiscard]] inline std::unique_ptr<Scheduler> build(torch::optim::Optimizer& optimizer, const Descriptor& descriptor) {
        return std::visit([&](const auto& concrete) { return Details::build_scheduler(optimizer, concrete); }, descriptor);
    }
}


#endif //GRAFT_LRSCHEDULER_HPP
