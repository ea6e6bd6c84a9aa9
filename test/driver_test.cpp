#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include "common.hpp"

namespace Graft::Tests {
    namespace {
        // Runs with no launcher variables set.
        class Bootstrap : public ::testing::Test {
        protected:
            void SetUp() override { clear(); }
            void TearDown() override { clear(); }

            static void clear()
            {
                for (const auto* name : {"WORLD_SIZE", "RANK", "LOCAL_RANK", "MASTER_ADDR", "MASTER_PORT"}) {
                    ::unsetenv(name);
                }
            }
        };

        std::chrono::system_clock::time_point local_time(int year, int month, int day, int hour, int minute, int second)
        {
            std::tm local{};
            local.tm_year = year - 1900;
            local.tm_mon = month - 1;
            local.tm_mday = day;
            local.tm_hour = hour;
            local.tm_min = minute;
            local.tm_sec = second;
            local.tm_isdst = -1;
            return std::chrono::system_clock::from_time_t(std::mktime(&local));
        }
    }

    TEST(Driver, SeedingIsReproducible)
    {
        Driver::seed_everything(17);
        const auto first_tensor = torch::rand({4});
        const auto first_draw = Driver::random_engine()();

        Driver::seed_everything(17);
        EXPECT_TRUE(torch::equal(torch::rand({4}), first_tensor));
        EXPECT_EQ(Driver::random_engine()(), first_draw);
    }

    TEST(Driver, FormatsDurations)
    {
        EXPECT_EQ(Utils::Terminal::FormatDuration(0.0), "0:00:00");
        EXPECT_EQ(Utils::Terminal::FormatDuration(59.0), "0:00:59");
        EXPECT_EQ(Utils::Terminal::FormatDuration(3725.5), "1:02:05.500000");
        EXPECT_EQ(Utils::Terminal::FormatDuration(-3.0), "0:00:00");
    }

    TEST(Driver, RunDirectoryIsNamedAfterTheLocalTime)
    {
        const auto directory = Driver::run_directory("/runs", local_time(2024, 3, 7, 9, 5, 3));
        EXPECT_EQ(directory, std::filesystem::path("/runs/0307/time_090503"));
    }

    TEST(Driver, RunDirectoryIsNeverReused)
    {
        TemporaryDirectory directory;
        const auto now = local_time(2024, 3, 7, 9, 5, 3);
        auto config = tiny_config(directory.path() / "train.pt", directory.path() / "output");
        config.description = "first";
        const auto first = Driver::prepare_run_directory(config, now);
        EXPECT_TRUE(std::filesystem::exists(first / Driver::kArgsFile));

        config.description = "second";
        EXPECT_THROW(static_cast<void>(Driver::prepare_run_directory(config, now)), std::runtime_error);
        EXPECT_EQ(Config::read(first / Driver::kArgsFile).description, "first");

        const auto next = Driver::prepare_run_directory(config, now + std::chrono::seconds(1));
        EXPECT_NE(next, first);
        EXPECT_EQ(next.parent_path(), first.parent_path());
    }

    TEST(Driver, SameSeedSameInitialModel)
    {
        TemporaryDirectory directory;
        const auto train = directory.path() / "train.pt";
        Data::GraphDataset(triangle_storage(4), triangle_layout()).save(train);

        using Snapshot = std::map<std::string, torch::Tensor>;
        const auto initial_parameters = [&](std::uint64_t seed, const std::string& output) {
            auto config = tiny_config(train, directory.path() / output);
            config.num_epochs = 1;
            config.seed = seed;

            auto snapshot = std::make_shared<Snapshot>();
            std::ostringstream out;
            Driver::RunOptions options{};
            options.stream = &out;
            options.coordinator.device = torch::Device(torch::kCPU);
            options.coordinator.harness_factory = [snapshot](const Training::HarnessContext& context) {
                for (const auto& item : context.model->named_parameters()) {
                    snapshot->emplace(item.key(), item.value().detach().clone());
                }
                return Training::make_graph_harness(context);
            };
            static_cast<void>(Driver::run(config, std::nullopt, options));
            return *snapshot;
        };

        const auto first = initial_parameters(99, "first");
        static_cast<void>(torch::rand({16}));
        static_cast<void>(Driver::random_engine()());
        const auto second = initial_parameters(99, "second");
        const auto other = initial_parameters(100, "other");

        ASSERT_FALSE(first.empty());
        ASSERT_EQ(first.size(), second.size());
        bool any_difference = false;
        for (const auto& [name, tensor] : first) {
            ASSERT_EQ(second.count(name), 1u) << name;
            EXPECT_TRUE(torch::equal(tensor, second.at(name))) << name;
            any_difference = any_difference || !torch::equal(tensor, other.at(name));
        }
        EXPECT_TRUE(any_difference);
    }

    TEST(Driver, RejectsInvalidConfigurationBeforeLoading)
    {
        TemporaryDirectory directory;
        auto config = tiny_config(directory.path() / "absent.pt", directory.path());
        config.batch_size = 3;
        config.world_size = 2;
        std::ostringstream out;
        Driver::RunOptions options{};
        options.stream = &out;
        EXPECT_THROW(static_cast<void>(Driver::run(config, std::nullopt, options)), ConfigurationError);
        EXPECT_TRUE(out.str().empty());
    }

    TEST(Driver, TrainsEndToEnd)
    {
        TemporaryDirectory directory;
        const auto train = directory.path() / "train.pt";
        const auto test = directory.path() / "test.pt";
        Data::GraphDataset(triangle_storage(6), triangle_layout()).save(train);
        Data::GraphDataset(triangle_storage(2), triangle_layout()).save(test);

        auto config = tiny_config(train, directory.path() / "output");
        config.dataset_test = test;
        config.description = "end to end";

        std::ostringstream out;
        Driver::RunOptions options{};
        options.stream = &out;
        options.colored = false;
        options.coordinator.device = torch::Device(torch::kCPU);
        const auto result = Driver::run(config, std::nullopt, options);

        EXPECT_EQ(result.state, (Training::TrainingState{2, 6}));
        EXPECT_GE(result.duration_seconds, 0.0);
        ASSERT_TRUE(result.run_directory.has_value());
        const auto& run_directory = *result.run_directory;
        EXPECT_EQ(run_directory.parent_path().parent_path(), directory.path() / "output");
        EXPECT_EQ(run_directory.filename().string().rfind("time_", 0), 0u);

        EXPECT_TRUE(std::filesystem::exists(run_directory / "model_state_ep1.pt"));
        EXPECT_TRUE(std::filesystem::exists(run_directory / "model_state_ep2.pt"));
        const auto recorded = Config::read(run_directory / Driver::kArgsFile);
        EXPECT_EQ(recorded.description, "end to end");
        EXPECT_TRUE(recorded.dataset_train.is_absolute());
        EXPECT_EQ(recorded.num_epochs, 2);

        const auto log = out.str();
        for (const auto* line : {"[Graft] Loading datasets", "[Graft] Data loaded. Creating output folder.",
                                 "[Graft] Starting training.", "[Graft] Done training. Total time: "}) {
            EXPECT_NE(log.find(line), std::string::npos) << line;
        }
        EXPECT_NE(log.find("Epoch [2/2]"), std::string::npos);
        EXPECT_EQ(log.find("Eval loss: N/A"), std::string::npos);

        const auto record = Checkpoint::load(run_directory / "model_state_ep2.pt");
        EXPECT_TRUE(record.has_optimizer_state);
        EXPECT_EQ(Model::layout_from_metadata(record.metadata).edge, triangle_layout().edge);
    }

    TEST(Driver, NonLeadersStaySilent)
    {
        TemporaryDirectory directory;
        const auto config = tiny_config(directory.path() / "absent.pt", directory.path() / "output");

        Distributed::DistributedContext follower{};
        follower.world_size = 2;
        follower.global_rank = 1;
        follower.local_rank = 1;

        std::ostringstream out;
        Driver::RunOptions options{};
        options.stream = &out;
        EXPECT_THROW(static_cast<void>(Driver::run(config, follower, options)), DatasetError);
        EXPECT_TRUE(out.str().empty());
        EXPECT_FALSE(std::filesystem::exists(directory.path() / "output"));

        std::ostringstream leader_out;
        options.stream = &leader_out;
        EXPECT_THROW(static_cast<void>(Driver::run(config, std::nullopt, options)), DatasetError);
        EXPECT_NE(leader_out.str().find("Loading datasets"), std::string::npos);
    }

    TEST_F(Bootstrap, SingleProcessRunsInPlace)
    {
        Config::RunConfig config{};
        config.world_size = 1;
        int calls = 0;
        Driver::bootstrap(config, [&](const std::optional<Distributed::DistributedContext>& context) {
            EXPECT_FALSE(context.has_value());
            ++calls;
        });
        EXPECT_EQ(calls, 1);
    }

    TEST_F(Bootstrap, LauncherContextIsUsedAsIs)
    {
        ::setenv("WORLD_SIZE", "2", 1);
        ::setenv("RANK", "1", 1);
        Config::RunConfig config{};
        config.world_size = 2;
        int calls = 0;
        Driver::bootstrap(config, [&](const std::optional<Distributed::DistributedContext>& context) {
            ASSERT_TRUE(context.has_value());
            EXPECT_EQ(context->global_rank, 1);
            EXPECT_EQ(context->world_size, 2);
            ++calls;
        });
        EXPECT_EQ(calls, 1);

        config.world_size = 4;
        EXPECT_THROW(Driver::bootstrap(config, [](const auto&) {}), ConfigurationError);
    }

    TEST_F(Bootstrap, FailingParticipantFailsTheRun)
    {
        Config::RunConfig config{};
        config.world_size = 2;
        try {
            Driver::bootstrap(config, [](const std::optional<Distributed::DistributedContext>& context) {
                if (context && context->global_rank == 1) {
                    throw std::runtime_error("participant failure");
                }
            });
            FAIL() << "expected DistributedCoordinationFailure";
        } catch (const DistributedCoordinationFailure& error) {
            const std::string message = error.what();
            EXPECT_NE(message.find("rank 1"), std::string::npos);
            EXPECT_EQ(message.find("rank 0"), std::string::npos);
        }
    }
}
