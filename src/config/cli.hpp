#ifndef GRAFT_CONFIG_CLI_HPP
#define GRAFT_CONFIG_CLI_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

#include <boost/program_options.hpp>

#include "../common/error.hpp"
#include "config.hpp"

namespace Graft::Config {
    namespace Detail {
        namespace po = boost::program_options;

        inline po::options_description describe_options(const RunConfig& defaults)
        {
            po::options_description options("graft_train options");
            options.add_options()
                ("help,h", "Print this message and exit.")
                ("description", po::value<std::string>()->default_value(defaults.description),
                 "Free-form description of the run, stored with its arguments.")
                ("output_dir", po::value<std::string>()->default_value(defaults.output_dir.string()),
                 "Directory under which the timestamped run directory is created.")
                ("dataset_train", po::value<std::string>()->required(), "Training dataset archive.")
                ("dataset_test", po::value<std::string>(), "Evaluation dataset archive.")
                ("dataset_auxiliary", po::value<std::string>(), "JSON file overriding the feature quantization.")
                ("model_state", po::value<std::string>(), "Checkpoint to resume from.")
                ("num_quantize_length", po::value<std::int64_t>()->default_value(defaults.num_quantize_length),
                 "Number of buckets of quantized lengths.")
                ("num_quantize_angle", po::value<std::int64_t>()->default_value(defaults.num_quantize_angle),
                 "Number of buckets of quantized angles.")
                ("batch_size", po::value<std::int64_t>()->default_value(defaults.batch_size),
                 "Total batch size, split evenly over the participants.")
                ("learning_rate", po::value<double>()->default_value(defaults.learning_rate),
                 "Base learning rate.")
                ("optimizer", po::value<std::string>()->default_value(defaults.optimizer),
                 "Optimizer: sgd, adam, adamax or rms.")
                ("hidden_size", po::value<std::int64_t>()->default_value(defaults.hidden_size),
                 "Width of the node states.")
                ("num_prop_rounds", po::value<std::int64_t>()->default_value(defaults.num_prop_rounds),
                 "Number of message passing rounds.")
                ("num_epochs", po::value<std::int64_t>()->default_value(defaults.num_epochs),
                 "Number of training epochs.")
                ("num_workers", po::value<std::int64_t>()->default_value(defaults.num_workers),
                 "Recorded in args.txt only; batches are loaded in-process.")
                ("seed", po::value<std::uint64_t>()->default_value(defaults.seed), "Random seed.")
                ("world_size", po::value<int>()->default_value(defaults.world_size),
                 "Number of participant processes.")
                ("profile", po::bool_switch(), "Write a profiler trace of every epoch.")
                ("disable_entity_features", po::bool_switch(), "Do not predict entity features.")
                ("disable_edge_features", po::bool_switch(), "Do not predict edge features.")
                ("disable_readin_entity", po::bool_switch(), "Do not embed input entity features.")
                ("disable_readin_edge", po::bool_switch(), "Do not embed input edge features.")
                ("force_entity_categorical_features", po::bool_switch(),
                 "Predict entity features even when entity features are disabled.");
            return options;
        }

        inline std::optional<std::filesystem::path> optional_path(const po::variables_map& values, const char* key)
        {
            if (!values.count(key)) {
                return std::nullopt;
            }
            return std::filesystem::path(values[key].as<std::string>());
        }
    }

    // Parses the command line into a RunConfig. Returns std::nullopt after
    // printing the usage to `out` when --help is given. Malformed or missing
    // options raise ConfigurationError.
    [[nodiscard]] inline std::optional<RunConfig> parse_command_line(int argc, const char* const argv[], std::ostream& out)
    {
        namespace po = Detail::po;
        const RunConfig defaults{};
        const auto options = Detail::describe_options(defaults);

        po::variables_map values;
        try {
            po::store(po::parse_command_line(argc, argv, options), values);
            if (values.count("help")) {
                out << options << '\n';
                return std::nullopt;
            }
            po::notify(values);
        } catch (const po::error& error) {
            throw ConfigurationError(std::string("Invalid command line: ") + error.what());
        }

        RunConfig config{};
        config.description = values["description"].as<std::string>();
        config.output_dir = values["output_dir"].as<std::string>();
        config.dataset_train = values["dataset_train"].as<std::string>();
        config.dataset_test = Detail::optional_path(values, "dataset_test");
        config.dataset_auxiliary = Detail::optional_path(values, "dataset_auxiliary");
        config.model_state = Detail::optional_path(values, "model_state");
        config.num_quantize_length = values["num_quantize_length"].as<std::int64_t>();
        config.num_quantize_angle = values["num_quantize_angle"].as<std::int64_t>();
        config.batch_size = values["batch_size"].as<std::int64_t>();
        config.learning_rate = values["learning_rate"].as<double>();
        config.optimizer = values["optimizer"].as<std::string>();
        config.hidden_size = values["hidden_size"].as<std::int64_t>();
        config.num_prop_rounds = values["num_prop_rounds"].as<std::int64_t>();
        config.num_epochs = values["num_epochs"].as<std::int64_t>();
        config.num_workers = values["num_workers"].as<std::int64_t>();
        config.seed = values["seed"].as<std::uint64_t>();
        config.world_size = values["world_size"].as<int>();
        config.profile = values["profile"].as<bool>();
        config.disable_entity_features = values["disable_entity_features"].as<bool>();
        config.disable_edge_features = values["disable_edge_features"].as<bool>();
        config.disable_readin_entity = values["disable_readin_entity"].as<bool>();
        config.disable_readin_edge = values["disable_readin_edge"].as<bool>();
        config.force_entity_categorical_features = values["force_entity_categorical_features"].as<bool>();
        return config;
    }
}

#endif // GRAFT_CONFIG_CLI_HPP
