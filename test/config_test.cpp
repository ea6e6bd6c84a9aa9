#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "common.hpp"

namespace Graft::Tests {
    namespace {
        std::optional<Config::RunConfig> parse(std::vector<std::string> arguments, std::ostream& out)
        {
            arguments.insert(arguments.begin(), "graft_train");
            std::vector<const char*> argv;
            for (const auto& argument : arguments) {
                argv.push_back(argument.c_str());
            }
            return Config::parse_command_line(static_cast<int>(argv.size()), argv.data(), out);
        }

        Config::RunConfig valid_config()
        {
            Config::RunConfig config{};
            config.dataset_train = "train.pt";
            return config;
        }
    }

    TEST(RunConfig, DefaultsMatchTheReferenceRun)
    {
        const Config::RunConfig config{};
        EXPECT_EQ(config.output_dir, std::filesystem::path("../output"));
        EXPECT_EQ(config.num_quantize_length, 383);
        EXPECT_EQ(config.num_quantize_angle, 127);
        EXPECT_EQ(config.batch_size, 2048);
        EXPECT_DOUBLE_EQ(config.learning_rate, 2e-5);
        EXPECT_EQ(config.optimizer, "adam");
        EXPECT_EQ(config.hidden_size, 384);
        EXPECT_EQ(config.num_prop_rounds, 3);
        EXPECT_EQ(config.num_epochs, 60);
        EXPECT_EQ(config.world_size, 1);
        EXPECT_FALSE(config.dataset_test.has_value());
        EXPECT_FALSE(config.model_state.has_value());
    }

    TEST(RunConfig, ValidatesBeforeAnyWork)
    {
        EXPECT_NO_THROW(Config::validate(valid_config()));

        EXPECT_THROW(Config::validate(Config::RunConfig{}), ConfigurationError);

        auto indivisible = valid_config();
        indivisible.batch_size = 10;
        indivisible.world_size = 4;
        EXPECT_THROW(Config::validate(indivisible), ConfigurationError);

        auto divisible = valid_config();
        divisible.batch_size = 2048;
        divisible.world_size = 4;
        EXPECT_NO_THROW(Config::validate(divisible));

        auto no_rate = valid_config();
        no_rate.learning_rate = 0.0;
        EXPECT_THROW(Config::validate(no_rate), ConfigurationError);

        auto no_epochs = valid_config();
        no_epochs.num_epochs = 0;
        EXPECT_THROW(Config::validate(no_epochs), ConfigurationError);

        auto unknown_optimizer = valid_config();
        unknown_optimizer.optimizer = "lion";
        EXPECT_THROW(Config::validate(unknown_optimizer), ConfigurationError);
    }

    TEST(RunConfig, IndivisibleBatchMessageNamesBothNumbers)
    {
        auto config = valid_config();
        config.batch_size = 10;
        config.world_size = 3;
        try {
            Config::validate(config);
            FAIL() << "expected ConfigurationError";
        } catch (const ConfigurationError& error) {
            const std::string message = error.what();
            EXPECT_NE(message.find("10"), std::string::npos);
            EXPECT_NE(message.find("3"), std::string::npos);
        }
    }

    TEST(RunConfig, AbsolutePathsLeaveTheInputUntouched)
    {
        auto config = valid_config();
        config.dataset_test = "data/../test.pt";
        const auto resolved = Config::with_absolute_paths(config);

        EXPECT_TRUE(resolved.output_dir.is_absolute());
        EXPECT_TRUE(resolved.dataset_train.is_absolute());
        ASSERT_TRUE(resolved.dataset_test.has_value());
        EXPECT_EQ(resolved.dataset_test->filename(), "test.pt");
        EXPECT_EQ(resolved.dataset_test->parent_path(), std::filesystem::current_path().lexically_normal());
        EXPECT_FALSE(resolved.model_state.has_value());
        EXPECT_EQ(config.dataset_train, std::filesystem::path("train.pt"));
    }

    TEST(RunConfig, SurvivesTheArgsRecord)
    {
        TemporaryDirectory directory;
        auto config = valid_config();
        config.description = "sketch baseline";
        config.dataset_auxiliary = "/data/aux.json";
        config.learning_rate = 3e-4;
        config.optimizer = "adamax";
        config.seed = 12345;
        config.world_size = 2;
        config.disable_readin_edge = true;
        config.num_workers = 4;

        const auto path = directory.path() / "args.txt";
        Config::write(path, config);
        const auto stored = Common::SaveLoad::read_json_file(path);
        EXPECT_EQ(stored.get<std::string>("dataset_test"), "");
        EXPECT_EQ(stored.get<std::string>("world_size"), "2");

        const auto read = Config::read(path);

        EXPECT_EQ(read.description, "sketch baseline");
        EXPECT_EQ(read.dataset_train, config.dataset_train);
        EXPECT_FALSE(read.dataset_test.has_value());
        ASSERT_TRUE(read.dataset_auxiliary.has_value());
        EXPECT_EQ(*read.dataset_auxiliary, std::filesystem::path("/data/aux.json"));
        EXPECT_DOUBLE_EQ(read.learning_rate, 3e-4);
        EXPECT_EQ(read.optimizer, "adamax");
        EXPECT_EQ(read.seed, 12345u);
        EXPECT_EQ(read.world_size, 2);
        EXPECT_TRUE(read.disable_readin_edge);
        EXPECT_FALSE(read.disable_readin_entity);
        EXPECT_EQ(read.num_workers, 4);
    }

    TEST(CommandLine, FillsDefaults)
    {
        std::ostringstream out;
        const auto config = parse({"--dataset_train", "train.pt"}, out);
        ASSERT_TRUE(config.has_value());
        EXPECT_EQ(config->dataset_train, std::filesystem::path("train.pt"));
        EXPECT_EQ(config->batch_size, 2048);
        EXPECT_EQ(config->optimizer, "adam");
        EXPECT_FALSE(config->dataset_test.has_value());
        EXPECT_FALSE(config->profile);
        EXPECT_TRUE(out.str().empty());
    }

    TEST(CommandLine, ReadsValuesAndSwitches)
    {
        std::ostringstream out;
        const auto config = parse({"--dataset_train=train.pt", "--dataset_test", "test.pt", "--batch_size", "512",
                                   "--learning_rate", "1e-3", "--optimizer", "rms", "--world_size", "4",
                                   "--disable_edge_features", "--force_entity_categorical_features"},
                                  out);
        ASSERT_TRUE(config.has_value());
        ASSERT_TRUE(config->dataset_test.has_value());
        EXPECT_EQ(*config->dataset_test, std::filesystem::path("test.pt"));
        EXPECT_EQ(config->batch_size, 512);
        EXPECT_DOUBLE_EQ(config->learning_rate, 1e-3);
        EXPECT_EQ(config->optimizer, "rms");
        EXPECT_EQ(config->world_size, 4);
        EXPECT_TRUE(config->disable_edge_features);
        EXPECT_TRUE(config->force_entity_categorical_features);
        EXPECT_FALSE(config->disable_entity_features);
    }

    TEST(CommandLine, HelpPrintsUsageAndStops)
    {
        std::ostringstream out;
        EXPECT_FALSE(parse({"--help"}, out).has_value());
        EXPECT_NE(out.str().find("dataset_train"), std::string::npos);
        EXPECT_NE(out.str().find("in-process"), std::string::npos);
    }

    TEST(CommandLine, RejectsMissingOrMalformedOptions)
    {
        std::ostringstream out;
        EXPECT_THROW(static_cast<void>(parse({}, out)), ConfigurationError);
        EXPECT_THROW(static_cast<void>(parse({"--dataset_train", "a", "--batch_size", "many"}, out)), ConfigurationError);
        EXPECT_THROW(static_cast<void>(parse({"--dataset_train", "a", "--no_such_option"}, out)), ConfigurationError);
    }
}
