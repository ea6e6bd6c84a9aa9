#ifndef GRAFT_TRAINING_HARNESS_HPP
#define GRAFT_TRAINING_HARNESS_HPP

#include <optional>

#include "state.hpp"

namespace Graft::Training {
    // Runs the per-batch work of one epoch. The coordinator owns the loop and
    // the counters; a harness only advances them.
    class Harness {
    public:
        virtual ~Harness() = default;

        // One pass over the training source. Returns the state after the epoch:
        // `epoch` exactly one higher, `global_step` increased by the number of
        // optimizer steps taken.
        [[nodiscard]] virtual TrainingState run_training_epoch(const TrainingState& state) = 0;

        [[nodiscard]] virtual bool has_eval() const { return false; }

        // One pass over the evaluation source, counters unchanged.
        virtual void run_eval_epoch(const TrainingState& state) { static_cast<void>(state); }

        // Mean losses of the last completed passes, for the epoch summary.
        [[nodiscard]] virtual std::optional<double> last_training_loss() const { return std::nullopt; }
        [[nodiscard]] virtual std::optional<double> last_eval_loss() const { return std::nullopt; }
    };
}

#endif // GRAFT_TRAINING_HARNESS_HPP
