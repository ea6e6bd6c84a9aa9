#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "common.hpp"

namespace Graft::Tests {
    namespace {
        const std::vector<std::int64_t> kDecay{20, 40};

        double factor(std::int64_t epoch)
        {
            return LrScheduler::Details::warmup_step_decay_factor(epoch, 5, kDecay);
        }
    }

    TEST(WarmupStepDecay, RampsUpOverTheWarmupEpochs)
    {
        EXPECT_DOUBLE_EQ(factor(0), 0.2);
        EXPECT_DOUBLE_EQ(factor(1), 0.4);
        EXPECT_DOUBLE_EQ(factor(3), 0.8);
        EXPECT_DOUBLE_EQ(factor(4), 1.0);
        EXPECT_DOUBLE_EQ(factor(19), 1.0);
    }

    TEST(WarmupStepDecay, ThresholdsAreInclusive)
    {
        EXPECT_DOUBLE_EQ(factor(20), 0.1);
        EXPECT_DOUBLE_EQ(factor(39), 0.1);
        EXPECT_NEAR(factor(40), 0.01, 1e-15);
        EXPECT_NEAR(factor(59), 0.01, 1e-15);
    }

    TEST(WarmupStepDecay, NoThresholdsMeansWarmupOnly)
    {
        EXPECT_DOUBLE_EQ(LrScheduler::Details::warmup_step_decay_factor(100, 5, {}), 1.0);
        EXPECT_DOUBLE_EQ(LrScheduler::Details::warmup_step_decay_factor(0, 1, {}), 1.0);
    }

    TEST(WarmupStepDecay, RejectsInvalidParameters)
    {
        EXPECT_THROW(LrScheduler::Details::warmup_step_decay_factor(0, 0, kDecay), ConfigurationError);
        EXPECT_THROW(LrScheduler::Details::validate({.warmup_epochs = -1, .decay_epochs = {}}), ConfigurationError);
        EXPECT_THROW(LrScheduler::Details::validate({.warmup_epochs = 5, .decay_epochs = {40, 20}}), ConfigurationError);
        EXPECT_THROW(LrScheduler::Details::validate({.warmup_epochs = 5, .decay_epochs = {20, 20}}), ConfigurationError);
        EXPECT_NO_THROW(LrScheduler::Details::validate({.warmup_epochs = 5, .decay_epochs = {20, 40}}));
    }

    TEST(WarmupStepDecayScheduler, SetsTheRateOfTheRequestedEpoch)
    {
        auto parameter = torch::zeros({2}, torch::requires_grad());
        torch::optim::SGD optimizer({parameter}, torch::optim::SGDOptions(1.0));
        auto scheduler = LrScheduler::build(optimizer, LrScheduler::WarmupStepDecay({.warmup_epochs = 5, .decay_epochs = kDecay}));

        const auto rate = [&] { return optimizer.param_groups().front().options().get_lr(); };
        EXPECT_DOUBLE_EQ(rate(), 0.2);

        scheduler->step();
        EXPECT_EQ(scheduler->epoch(), 1);
        EXPECT_DOUBLE_EQ(rate(), 0.4);

        // A resumed run jumps straight to its epoch.
        scheduler->apply(25);
        EXPECT_DOUBLE_EQ(rate(), 0.1);
        scheduler->apply(2);
        EXPECT_DOUBLE_EQ(rate(), 0.6);

        EXPECT_THROW(scheduler->apply(-1), std::invalid_argument);
    }
}
