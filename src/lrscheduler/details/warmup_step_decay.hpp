#ifndef GRAFT_LRSCHEDULER_WARMUP_STEP_DECAY_HPP
#define GRAFT_LRSCHEDULER_WARMUP_STEP_DECAY_HPP
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/error.hpp"
#include "common.hpp"

namespace Graft::LrScheduler::Details {
    struct WarmupStepDecayOptions {
        std::int64_t warmup_epochs{5};
        std::vector<std::int64_t> decay_epochs{};
    };

    struct WarmupStepDecayDescriptor {
        WarmupStepDecayOptions options{};
    };

    inline void validate(const WarmupStepDecayOptions& options)
    {
        if (options.warmup_epochs <= 0) {
            std::ostringstream message;
            message << "Learning rate warmup requires a positive number of epochs, got " << options.warmup_epochs << '.';
            throw ConfigurationError(message.str());
        }
        const auto unordered = std::adjacent_find(options.decay_epochs.begin(), options.decay_epochs.end(),
                                                  [](std::int64_t lhs, std::int64_t rhs) { return lhs >= rhs; });
        if (unordered != options.decay_epochs.end()) {
            throw ConfigurationError("Learning rate decay epochs must be strictly increasing.");
        }
    }

    // Linear warmup from 1/warmup_epochs to 1, then one order of magnitude of
    // decay per threshold in `decay_epochs` that is <= epoch.
    [[nodiscard]] inline double warmup_step_decay_factor(std::int64_t epoch,
                                                         std::int64_t warmup_epochs,
                                                         const std::vector<std::int64_t>& decay_epochs)
    {
        if (warmup_epochs <= 0) {
            throw ConfigurationError("Learning rate warmup requires a positive number of epochs.");
        }
        const double warmup_factor = std::min(static_cast<double>(epoch + 1) / static_cast<double>(warmup_epochs), 1.0);
        const auto crossed = std::upper_bound(decay_epochs.begin(), decay_epochs.end(), epoch) - decay_epochs.begin();
        const double decay_factor = std::pow(0.1, static_cast<double>(crossed));
        return warmup_factor * decay_factor;
    }

    [[nodiscard]] inline double warmup_step_decay_factor(std::int64_t epoch, const WarmupStepDecayOptions& options)
    {
        return warmup_step_decay_factor(epoch, options.warmup_epochs, options.decay_epochs);
    }

    class WarmupStepDecayScheduler final : public Scheduler {
    public:
        WarmupStepDecayScheduler(torch::optim::Optimizer& optimizer, WarmupStepDecayOptions options)
            : optimizer_(optimizer),
              options_(std::move(options)),
              base_lrs_(capture_base_lrs(optimizer)) {
            validate(options_);
            apply(0);
        }

        void apply(std::int64_t epoch) override {
            if (epoch < 0) {
                throw std::invalid_argument("WarmupStepDecayScheduler epoch must be non-negative.");
            }
            auto& param_groups = optimizer_.param_groups();
            if (base_lrs_.size() != param_groups.size()) {
                throw std::runtime_error("Optimizer param group count changed after scheduler creation.");
            }

            const double factor = warmup_step_decay_factor(epoch, options_);
            for (std::size_t index = 0; index < param_groups.size(); ++index) {
                param_groups[index].options().set_lr(base_lrs_[index] * factor);
            }
            epoch_ = epoch;
        }

        void step() override {
            apply(epoch_ + 1);
        }

        [[nodiscard]] std::int64_t epoch() const noexcept override { return epoch_; }

    private:
        static std::vector<double> capture_base_lrs(torch::optim::Optimizer& optimizer) {
            std::vector<double> base_lrs;
            base_lrs.reserve(optimizer.param_groups().size());
            for (auto& group : optimizer.param_groups()) {
                base_lrs.push_back(group.options().get_lr());
            }
            return base_lrs;
        }

        torch::optim::Optimizer& optimizer_;
        WarmupStepDecayOptions options_{};
        std::vector<double> base_lrs_{};
        std::int64_t epoch_{0};
    };
}

#endif //GRAFT_LRSCHEDULER_WARMUP_STEP_DECAY_HPP
