#ifndef GRAFT_LRSCHEDULER_COMMON_HPP
#define GRAFT_LRSCHEDULER_COMMON_HPP

#include <cstdint>

namespace Graft::LrScheduler::Details {

    // Epoch-indexed rate multiplier bound to one optimizer.
    class Scheduler {
    public:
        virtual ~Scheduler() = default;

        // Sets the learning rate of every param group for `epoch`.
        virtual void apply(std::int64_t epoch) = 0;

        // Advances to the next epoch.
        virtual void step() = 0;

        [[nodiscard]] virtual std::int64_t epoch() const noexcept = 0;
    };

}  // namespace Graft::LrScheduler::Details

#endif //GRAFT_LRSCHEDULER_COMMON_HPP
