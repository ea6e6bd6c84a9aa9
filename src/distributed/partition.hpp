#ifndef GRAFT_DISTRIBUTED_PARTITION_HPP
#define GRAFT_DISTRIBUTED_PARTITION_HPP

#include <cstdint>
#include <optional>

#include "context.hpp"

namespace Graft::Distributed {
    struct Partition {
        std::int64_t per_participant_batch_size{0};
        bool is_leader{true};
    };

    // Splits the requested total batch size over the participants. Integer
    // division: a remainder is dropped, so 2048 over 3 participants is 682 each.
    // Callers that care pick divisible sizes (the run driver enforces it).
    [[nodiscard]] inline Partition partition(std::int64_t total_batch_size,
                                             const std::optional<DistributedContext>& context)
    {
        if (!context) {
            return {total_batch_size, true};
        }
        if (context->world_size <= 0) {
            throw ConfigurationError("Cannot partition a batch over a non-positive world size.");
        }
        return {total_batch_size / context->world_size, context->global_rank == 0};
    }
}

#endif // GRAFT_DISTRIBUTED_PARTITION_HPP
