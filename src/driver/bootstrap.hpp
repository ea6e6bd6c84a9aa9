#ifndef GRAFT_DRIVER_BOOTSTRAP_HPP
#define GRAFT_DRIVER_BOOTSTRAP_HPP

#include <cerrno>
#include <cstring>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <csignal>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "../common/error.hpp"
#include "../config/config.hpp"
#include "../distributed/context.hpp"
#include "../utils/terminal.hpp"

namespace Graft::Driver {
    using Participant = std::function<void(const std::optional<Distributed::DistributedContext>&)>;

    namespace Detail {
        // Body of a forked participant. Never returns.
        [[noreturn]] inline void run_child(const Participant& participant, const Distributed::DistributedContext& context)
        {
            int status = 0;
            try {
                participant(context);
            } catch (const std::exception& error) {
                std::cerr << Utils::Terminal::Prefix(false) << "rank " << context.global_rank << " failed: " << error.what()
                          << std::endl;
                status = 1;
            }
            std::cout.flush();
            std::cerr.flush();
            _exit(status);
        }

        inline std::string describe_status(int status)
        {
            std::ostringstream description;
            if (WIFEXITED(status)) {
                description << "exit status " << WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                description << "signal " << WTERMSIG(status);
            } else {
                description << "wait status " << status;
            }
            return description.str();
        }
    }

    // Runs `participant` once per member of the run.
    //  - A context supplied by an external launcher (WORLD_SIZE, RANK...) is
    //    used as is: this process is one participant.
    //  - Otherwise world_size 1 runs in-process without a context.
    //  - Otherwise world_size processes are forked on this host, local rank
    //    equal to global rank, and joined. Any failing participant turns into a
    //    DistributedCoordinationFailure in the launching process.
    inline void bootstrap(const Config::RunConfig& config, const Participant& participant)
    {
        if (const auto context = Distributed::from_environment()) {
            if (context->world_size != config.world_size) {
                std::ostringstream message;
                message << "Launcher world size " << context->world_size << " disagrees with --world_size "
                        << config.world_size << '.';
                throw ConfigurationError(message.str());
            }
            participant(context);
            return;
        }

        if (config.world_size <= 1) {
            participant(std::nullopt);
            return;
        }

        std::vector<pid_t> children;
        children.reserve(static_cast<std::size_t>(config.world_size));
        for (int rank = 0; rank < config.world_size; ++rank) {
            Distributed::DistributedContext context{};
            context.world_size = config.world_size;
            context.global_rank = rank;
            context.local_rank = rank;

            const pid_t child = fork();
            if (child < 0) {
                const std::string reason = std::strerror(errno);
                for (const auto running : children) {
                    kill(running, SIGTERM);
                    waitpid(running, nullptr, 0);
                }
                throw DistributedCoordinationFailure("Failed to start participant " + std::to_string(rank) + ": " + reason);
            }
            if (child == 0) {
                Detail::run_child(participant, context);
            }
            children.push_back(child);
        }

        std::ostringstream failures;
        bool failed = false;
        for (std::size_t rank = 0; rank < children.size(); ++rank) {
            int status = 0;
            if (waitpid(children[rank], &status, 0) < 0) {
                failures << "\n  rank " << rank << ": wait failed (" << std::strerror(errno) << ')';
                failed = true;
                continue;
            }
            if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
                failures << "\n  rank " << rank << ": " << Detail::describe_status(status);
                failed = true;
            }
        }
        if (failed) {
            throw DistributedCoordinationFailure("Distributed training failed:" + failures.str());
        }
    }
}

#endif // GRAFT_DRIVER_BOOTSTRAP_HPP
