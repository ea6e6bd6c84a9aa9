#ifndef GRAFT_TRAINING_STATE_HPP
#define GRAFT_TRAINING_STATE_HPP

#include <cstdint>
#include <ostream>

namespace Graft::Training {
    // Progress counters of a run. `epoch` moves by exactly one per coordinator
    // iteration; `global_step` by the number of optimizer steps the harness took.
    struct TrainingState {
        std::int64_t epoch{0};
        std::int64_t global_step{0};

        friend bool operator==(const TrainingState&, const TrainingState&) = default;
    };

    inline std::ostream& operator<<(std::ostream& stream, const TrainingState& state)
    {
        return stream << "(epoch=" << state.epoch << ", global_step=" << state.global_step << ')';
    }
}

#endif // GRAFT_TRAINING_STATE_HPP
