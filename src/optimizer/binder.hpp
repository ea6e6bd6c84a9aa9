#ifndef GRAFT_OPTIMIZER_BINDER_HPP
#define GRAFT_OPTIMIZER_BINDER_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../lrscheduler/lrscheduler.hpp"
#include "optimizer.hpp"

namespace Graft::Optimizer {
    // Tuned for the warmup regime of the graph model: the configured learning
    // rate is scaled up and then ramped in over the first epochs. Kept as fixed
    // defaults until product owners decide whether they should be tunable.
    inline constexpr double kLearningRateScale = 16.0;
    inline constexpr std::int64_t kWarmupEpochs = 5;
    inline constexpr std::array<std::int64_t, 2> kDecayEpochs{20, 40};

    [[nodiscard]] inline LrScheduler::WarmupStepDecayOptions default_schedule() {
        return {.warmup_epochs = kWarmupEpochs,
                .decay_epochs = std::vector<std::int64_t>(kDecayEpochs.begin(), kDecayEpochs.end())};
    }

    // The optimizer is declared first so it outlives the scheduler that
    // references it.
    struct Binding {
        Kind kind{Kind::Adam};
        std::unique_ptr<torch::optim::Optimizer> optimizer{};
        std::unique_ptr<LrScheduler::Scheduler> scheduler{};
    };

    [[nodiscard]] inline Binding bind(Kind kind, std::vector<torch::Tensor> parameters, double base_learning_rate) {
        Binding binding{};
        binding.kind = kind;
        binding.optimizer = build(std::move(parameters), make_descriptor(kind, base_learning_rate * kLearningRateScale));
        binding.scheduler = LrScheduler::build(*binding.optimizer, LrScheduler::WarmupStepDecay(default_schedule()));
        return binding;
    }

    // Throws ConfigurationError when `identifier` is not one of kKindNames.
    [[nodiscard]] inline Binding bind(std::string_view identifier, std::vector<torch::Tensor> parameters, double base_learning_rate) {
        return bind(parse_kind(identifier), std::move(parameters), base_learning_rate);
    }
}

#endif // GRAFT_OPTIMIZER_BINDER_HPP
