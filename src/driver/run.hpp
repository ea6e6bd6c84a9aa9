#ifndef GRAFT_DRIVER_RUN_HPP
#define GRAFT_DRIVER_RUN_HPP

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <torch/torch.h>

#include "../config/config.hpp"
#include "../data/initializer.hpp"
#include "../distributed/context.hpp"
#include "../distributed/partition.hpp"
#include "../training/coordinator.hpp"
#include "../training/reporter.hpp"
#include "../training/state.hpp"
#include "../utils/terminal.hpp"

namespace Graft::Driver {
    inline constexpr const char* kArgsFile = "args.txt";

    // Process-wide engine for host-side randomness, seeded by seed_everything().
    inline std::mt19937_64& random_engine()
    {
        static std::mt19937_64 engine{};
        return engine;
    }

    inline void seed_everything(std::uint64_t seed)
    {
        std::srand(static_cast<unsigned int>(seed));
        random_engine().seed(seed);
        torch::manual_seed(seed);
    }

    // {output_dir}/{MMDD}/time_{HHMMSS} in local time.
    [[nodiscard]] inline std::filesystem::path run_directory(const std::filesystem::path& output_dir,
                                                             std::chrono::system_clock::time_point now)
    {
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        std::tm local{};
        if (localtime_r(&seconds, &local) == nullptr) {
            throw std::runtime_error("Failed to convert the current time to local time.");
        }
        std::ostringstream day;
        day << std::put_time(&local, "%m%d");
        std::ostringstream time;
        time << "time_" << std::put_time(&local, "%H%M%S");
        return output_dir / day.str() / time.str();
    }

    // Creates the run directory and records the configuration in it. The
    // directory must not exist yet: a run never reuses another run's files.
    inline std::filesystem::path prepare_run_directory(const Config::RunConfig& config,
                                                       std::chrono::system_clock::time_point now)
    {
        const auto directory = run_directory(config.output_dir, now);
        std::error_code error;
        std::filesystem::create_directories(directory.parent_path(), error);
        if (error) {
            throw std::runtime_error("Failed to create output directory '" + directory.parent_path().string()
                                     + "': " + error.message());
        }
        if (!std::filesystem::create_directory(directory, error)) {
            if (!error) {
                throw std::runtime_error("Output directory '" + directory.string() + "' already exists.");
            }
            throw std::runtime_error("Failed to create output directory '" + directory.string() + "': " + error.message());
        }
        const auto args_path = directory / kArgsFile;
        try {
            Config::write(args_path, config);
        } catch (const std::exception& failure) {
            throw std::runtime_error("Failed to write '" + args_path.string() + "': " + failure.what());
        }
        return directory;
    }

    struct RunOptions {
        std::shared_ptr<Data::DatasetInitializer> dataset_initializer{};
        std::ostream* stream{&std::cout};
        bool colored{true};
        Training::CoordinatorOptions coordinator{};
    };

    struct RunResult {
        Training::TrainingState state{};
        double duration_seconds{0.0};
        // Set on the leader only.
        std::optional<std::filesystem::path> run_directory{};
    };

    // One participant's share of a training run, from configuration to the
    // trained model. Only the leader prints, creates files or writes metrics.
    inline RunResult run(const Config::RunConfig& requested,
                         const std::optional<Distributed::DistributedContext>& context,
                         RunOptions options = {})
    {
        Config::validate(requested);
        if (context) {
            Distributed::validate(*context);
        }
        const auto start = std::chrono::steady_clock::now();
        const bool leader = Distributed::partition(requested.batch_size, context).is_leader;
        const auto say = [&](std::string_view text) {
            if (leader && options.stream != nullptr) {
                *options.stream << Utils::Terminal::Prefix(options.colored) << text << '\n';
            }
        };

        seed_everything(requested.seed);
        const auto config = Config::with_absolute_paths(requested);

        if (!options.dataset_initializer) {
            options.dataset_initializer = std::make_shared<Data::ArchiveDatasetInitializer>();
        }
        say("Loading datasets");
        auto datasets = options.dataset_initializer->initialize(config, context);
        say("Data loaded. Creating output folder.");

        RunResult result{};
        Training::ReporterPtr reporter;
        if (leader) {
            result.run_directory = prepare_run_directory(config, std::chrono::system_clock::now());
            Training::LeaderReporterOptions reporter_options{};
            reporter_options.output_dir = *result.run_directory;
            reporter_options.stream = options.stream;
            reporter_options.colored = options.colored;
            reporter_options.profile = config.profile;
            reporter = std::make_shared<Training::LeaderReporter>(std::move(reporter_options));
        } else {
            reporter = std::make_shared<Training::NullReporter>();
        }

        say("Starting training.");
        Training::Coordinator coordinator(config, context, std::move(datasets), reporter, std::move(options.coordinator));
        static_cast<void>(coordinator.run());
        result.state = coordinator.state();
        result.duration_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        say("Done training. Total time: " + Utils::Terminal::FormatDuration(result.duration_seconds));
        return result;
    }
}

#endif // GRAFT_DRIVER_RUN_HPP
