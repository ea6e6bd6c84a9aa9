#ifndef GRAFT_DISTRIBUTED_CONTEXT_HPP
#define GRAFT_DISTRIBUTED_CONTEXT_HPP

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "../common/error.hpp"

namespace Graft::Distributed {
    inline constexpr std::string_view kDefaultMasterAddress = "127.0.0.1";
    inline constexpr std::uint16_t kDefaultMasterPort = 29500;

    // One participant of a multi-process run. Immutable once created; absent
    // (std::nullopt) in single-process mode.
    struct DistributedContext {
        int world_size{1};
        int local_rank{0};
        int global_rank{0};
        std::string master_address{kDefaultMasterAddress};
        std::uint16_t master_port{kDefaultMasterPort};
    };

    inline void validate(const DistributedContext& context)
    {
        std::ostringstream message;
        if (context.world_size <= 0) {
            message << "Distributed world size must be positive, got " << context.world_size << '.';
        } else if (context.global_rank < 0 || context.global_rank >= context.world_size) {
            message << "Global rank " << context.global_rank << " is outside [0, " << context.world_size << ").";
        } else if (context.local_rank < 0) {
            message << "Local rank must be non-negative, got " << context.local_rank << '.';
        } else {
            return;
        }
        throw ConfigurationError(message.str());
    }

    // Leader: the single participant allowed singleton side effects. A
    // single-process run is its own leader.
    [[nodiscard]] inline bool is_leader(const std::optional<DistributedContext>& context) noexcept
    {
        return !context || context->global_rank == 0;
    }

    namespace Detail {
        template <class Integer>
        std::optional<Integer> read_integer(const char* name)
        {
            const char* raw = std::getenv(name);
            if (raw == nullptr) {
                return std::nullopt;
            }
            const std::string_view text{raw};
            Integer value{};
            const auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (error != std::errc{} || end != text.data() + text.size()) {
                std::ostringstream message;
                message << "Environment variable " << name << "='" << text << "' is not an integer.";
                throw ConfigurationError(message.str());
            }
            return value;
        }
    }

    // Context supplied by an external launcher through WORLD_SIZE, RANK,
    // LOCAL_RANK, MASTER_ADDR and MASTER_PORT. Absent when WORLD_SIZE is unset.
    [[nodiscard]] inline std::optional<DistributedContext> from_environment()
    {
        const auto world_size = Detail::read_integer<int>("WORLD_SIZE");
        if (!world_size) {
            return std::nullopt;
        }

        DistributedContext context{};
        context.world_size = *world_size;
        context.global_rank = Detail::read_integer<int>("RANK").value_or(0);
        context.local_rank = Detail::read_integer<int>("LOCAL_RANK").value_or(context.global_rank);
        if (const char* address = std::getenv("MASTER_ADDR")) {
            context.master_address = address;
        }
        context.master_port = Detail::read_integer<std::uint16_t>("MASTER_PORT").value_or(kDefaultMasterPort);
        validate(context);
        return context;
    }
}

#endif // GRAFT_DISTRIBUTED_CONTEXT_HPP
