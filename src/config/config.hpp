#ifndef GRAFT_CONFIG_CONFIG_HPP
#define GRAFT_CONFIG_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>

#include "../common/error.hpp"
#include "../common/save_load.hpp"
#include "../optimizer/optimizer.hpp"

namespace Graft::Config {
    using PropertyTree = Common::SaveLoad::PropertyTree;

    // Hyperparameters of one training run. Built once (from the command line or
    // a JSON record) and then only passed around by const reference.
    struct RunConfig {
        std::string description{};
        std::filesystem::path output_dir{"../output"};
        std::filesystem::path dataset_train{};
        std::optional<std::filesystem::path> dataset_test{};
        std::optional<std::filesystem::path> dataset_auxiliary{};
        std::optional<std::filesystem::path> model_state{};

        std::int64_t num_quantize_length{383};
        std::int64_t num_quantize_angle{127};
        std::int64_t batch_size{2048};
        double learning_rate{2e-5};
        std::string optimizer{"adam"};
        std::int64_t hidden_size{384};
        std::int64_t num_prop_rounds{3};
        std::int64_t num_epochs{60};
        // Kept for the run record; the loader reads batches in-process.
        std::int64_t num_workers{0};
        std::uint64_t seed{7};
        int world_size{1};
        bool profile{false};

        bool disable_entity_features{false};
        bool disable_edge_features{false};
        bool disable_readin_entity{false};
        bool disable_readin_edge{false};
        bool force_entity_categorical_features{false};
    };

    // Rejects configurations that cannot start a run. Called before any dataset
    // or model work.
    inline void validate(const RunConfig& config)
    {
        std::ostringstream message;
        if (config.dataset_train.empty()) {
            message << "A training dataset is required.";
        } else if (config.batch_size <= 0) {
            message << "Batch size must be positive, got " << config.batch_size << '.';
        } else if (config.world_size <= 0) {
            message << "World size must be positive, got " << config.world_size << '.';
        } else if (config.batch_size % config.world_size != 0) {
            message << "Batch size " << config.batch_size << " is not divisible by the world size "
                    << config.world_size << '.';
        } else if (!(config.learning_rate > 0.0)) {
            message << "Learning rate must be positive, got " << config.learning_rate << '.';
        } else if (config.hidden_size <= 0) {
            message << "Hidden size must be positive, got " << config.hidden_size << '.';
        } else if (config.num_prop_rounds <= 0) {
            message << "Number of propagation rounds must be positive, got " << config.num_prop_rounds << '.';
        } else if (config.num_epochs <= 0) {
            message << "Number of epochs must be positive, got " << config.num_epochs << '.';
        } else if (config.num_quantize_length <= 0 || config.num_quantize_angle <= 0) {
            message << "Quantization bucket counts must be positive.";
        } else if (config.num_workers < 0) {
            message << "Number of workers cannot be negative, got " << config.num_workers << '.';
        } else {
            static_cast<void>(Optimizer::parse_kind(config.optimizer));
            return;
        }
        throw ConfigurationError(message.str());
    }

    // Copy of `config` with every path field made absolute against the current
    // working directory.
    [[nodiscard]] inline RunConfig with_absolute_paths(const RunConfig& config)
    {
        const auto absolute = [](const std::filesystem::path& path) {
            return path.empty() ? path : std::filesystem::absolute(path).lexically_normal();
        };
        const auto absolute_optional = [&](const std::optional<std::filesystem::path>& path) {
            return path ? std::optional<std::filesystem::path>(absolute(*path)) : std::nullopt;
        };

        RunConfig resolved = config;
        resolved.output_dir = absolute(config.output_dir);
        resolved.dataset_train = absolute(config.dataset_train);
        resolved.dataset_test = absolute_optional(config.dataset_test);
        resolved.dataset_auxiliary = absolute_optional(config.dataset_auxiliary);
        resolved.model_state = absolute_optional(config.model_state);
        return resolved;
    }

    namespace Detail {
        inline std::optional<std::string> path_string(const std::optional<std::filesystem::path>& path)
        {
            return path ? std::optional<std::string>(path->string()) : std::nullopt;
        }

        inline std::optional<std::filesystem::path> optional_path(const PropertyTree& tree, const std::string& key)
        {
            const auto value = Common::SaveLoad::Detail::get_optional_string(tree, key);
            return value ? std::optional<std::filesystem::path>(*value) : std::nullopt;
        }
    }

    // Property tree JSON is untyped: numbers and booleans are written as
    // strings and absent paths as "". read() converts them back.
    [[nodiscard]] inline PropertyTree to_property_tree(const RunConfig& config)
    {
        using Common::SaveLoad::Detail::put_optional_string;

        PropertyTree tree;
        tree.put("description", config.description);
        tree.put("output_dir", config.output_dir.string());
        tree.put("dataset_train", config.dataset_train.string());
        put_optional_string(tree, "dataset_test", Detail::path_string(config.dataset_test));
        put_optional_string(tree, "dataset_auxiliary", Detail::path_string(config.dataset_auxiliary));
        put_optional_string(tree, "model_state", Detail::path_string(config.model_state));
        tree.put("num_quantize_length", config.num_quantize_length);
        tree.put("num_quantize_angle", config.num_quantize_angle);
        tree.put("batch_size", config.batch_size);
        tree.put("learning_rate", config.learning_rate);
        tree.put("optimizer", config.optimizer);
        tree.put("hidden_size", config.hidden_size);
        tree.put("num_prop_rounds", config.num_prop_rounds);
        tree.put("num_epochs", config.num_epochs);
        tree.put("num_workers", config.num_workers);
        tree.put("seed", config.seed);
        tree.put("world_size", config.world_size);
        tree.put("profile", config.profile);
        tree.put("disable_entity_features", config.disable_entity_features);
        tree.put("disable_edge_features", config.disable_edge_features);
        tree.put("disable_readin_entity", config.disable_readin_entity);
        tree.put("disable_readin_edge", config.disable_readin_edge);
        tree.put("force_entity_categorical_features", config.force_entity_categorical_features);
        return tree;
    }

    [[nodiscard]] inline RunConfig from_property_tree(const PropertyTree& tree)
    {
        using Common::SaveLoad::Detail::get_boolean;
        using Common::SaveLoad::Detail::get_numeric;
        using Common::SaveLoad::Detail::get_string;
        const std::string context = "run configuration";

        RunConfig config{};
        config.description = tree.get("description", std::string{});
        config.output_dir = get_string(tree, "output_dir", context);
        config.dataset_train = get_string(tree, "dataset_train", context);
        config.dataset_test = Detail::optional_path(tree, "dataset_test");
        config.dataset_auxiliary = Detail::optional_path(tree, "dataset_auxiliary");
        config.model_state = Detail::optional_path(tree, "model_state");
        config.num_quantize_length = get_numeric<std::int64_t>(tree, "num_quantize_length", context);
        config.num_quantize_angle = get_numeric<std::int64_t>(tree, "num_quantize_angle", context);
        config.batch_size = get_numeric<std::int64_t>(tree, "batch_size", context);
        config.learning_rate = get_numeric<double>(tree, "learning_rate", context);
        config.optimizer = get_string(tree, "optimizer", context);
        config.hidden_size = get_numeric<std::int64_t>(tree, "hidden_size", context);
        config.num_prop_rounds = get_numeric<std::int64_t>(tree, "num_prop_rounds", context);
        config.num_epochs = get_numeric<std::int64_t>(tree, "num_epochs", context);
        config.num_workers = get_numeric<std::int64_t>(tree, "num_workers", context);
        config.seed = get_numeric<std::uint64_t>(tree, "seed", context);
        config.world_size = get_numeric<int>(tree, "world_size", context);
        config.profile = get_boolean(tree, "profile", context);
        config.disable_entity_features = get_boolean(tree, "disable_entity_features", context);
        config.disable_edge_features = get_boolean(tree, "disable_edge_features", context);
        config.disable_readin_entity = get_boolean(tree, "disable_readin_entity", context);
        config.disable_readin_edge = get_boolean(tree, "disable_readin_edge", context);
        config.force_entity_categorical_features = get_boolean(tree, "force_entity_categorical_features", context);
        return config;
    }

    // Persists `config` as the `args.txt` record of a run directory.
    inline void write(const std::filesystem::path& path, const RunConfig& config)
    {
        Common::SaveLoad::write_json_file(path, to_property_tree(config));
    }

    [[nodiscard]] inline RunConfig read(const std::filesystem::path& path)
    {
        return from_property_tree(Common::SaveLoad::read_json_file(path));
    }
}

#endif // GRAFT_CONFIG_CONFIG_HPP
