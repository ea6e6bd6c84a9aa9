#ifndef GRAFT_MODEL_BUILDER_HPP
#define GRAFT_MODEL_BUILDER_HPP

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <ostream>
#include <string>

#include <torch/torch.h>

#include "../checkpoint/checkpoint.hpp"
#include "../config/config.hpp"
#include "../training/state.hpp"
#include "../utils/terminal.hpp"
#include "feature_mapping.hpp"
#include "graph_model.hpp"

namespace Graft::Model {
    // Architecture name recorded in checkpoint metadata.
    inline constexpr const char* kArchitectureName = "graph";

    // Maps the run toggles onto the model options. Readin left unset defers to
    // whether the dataset provides the features.
    [[nodiscard]] inline GraphModelOptions options_from(const FeatureLayout& feature_dimensions, const Config::RunConfig& config)
    {
        GraphModelOptions options{};
        options.hidden_size = config.hidden_size;
        options.depth = config.num_prop_rounds;
        options.features = feature_dimensions;
        options.readout_entity_features = !config.disable_entity_features || config.force_entity_categorical_features;
        options.readout_edge_features = !config.disable_edge_features;
        if (config.disable_readin_entity) {
            options.readin_entity_features = false;
        }
        if (config.disable_readin_edge) {
            options.readin_edge_features = false;
        }
        return options;
    }

    [[nodiscard]] inline std::int64_t parameter_count(const torch::nn::Module& model)
    {
        std::int64_t count = 0;
        for (const auto& parameter : model.parameters(/*recurse=*/true)) {
            count += parameter.numel();
        }
        return count;
    }

    // Fresh, randomly initialized model on the CPU. Deterministic for a given
    // torch seed. Reports the parameter count to `stream` when one is given.
    [[nodiscard]] inline GraphModel build(const FeatureLayout& feature_dimensions,
                                          const Config::RunConfig& config,
                                          std::ostream* stream = nullptr)
    {
        GraphModel model(options_from(feature_dimensions, config));
        if (stream != nullptr) {
            const double millions = static_cast<double>(parameter_count(*model)) / 1e6;
            *stream << Utils::Terminal::Prefix(true) << "model has: " << std::fixed << std::setprecision(2)
                    << millions << std::defaultfloat << " million parameters\n";
        }
        return model;
    }

    // Loads the checkpoint at `checkpoint_path` into `model` and returns the
    // progress recorded with it. Without a path the model is left as built and
    // the run starts at (0, 0).
    inline Training::TrainingState resume(torch::nn::Module& model, const std::optional<std::filesystem::path>& checkpoint_path)
    {
        if (!checkpoint_path) {
            return {};
        }
        const auto record = Checkpoint::load(*checkpoint_path);
        Checkpoint::apply(model, record);
        return record.state;
    }

    // Metadata stored with every checkpoint: the feature mapping snapshots and
    // the architecture hyperparameters needed to rebuild the model.
    [[nodiscard]] inline PropertyTree checkpoint_metadata(const FeatureMappingPtr& node_mapping,
                                                          const FeatureMappingPtr& edge_mapping,
                                                          const GraphModelOptions& options)
    {
        PropertyTree metadata;
        metadata.add_child("node_feature_mapping", node_mapping ? node_mapping->state() : PropertyTree{});
        metadata.add_child("edge_feature_mapping", edge_mapping ? edge_mapping->state() : PropertyTree{});
        metadata.put("model_configuration.embedding_dim", options.hidden_size);
        metadata.put("model_configuration.depth", options.depth);
        metadata.put("model_configuration.name", std::string(kArchitectureName));
        return metadata;
    }

    // Rebuilds the feature layout recorded by checkpoint_metadata().
    [[nodiscard]] inline FeatureLayout layout_from_metadata(const PropertyTree& metadata)
    {
        const auto node_state = metadata.get_child_optional("node_feature_mapping");
        const auto edge_state = metadata.get_child_optional("edge_feature_mapping");
        FeatureLayout layout{};
        if (node_state) {
            layout.node = QuantizedFeatureMapping::from_state(*node_state).feature_dimensions();
        }
        if (edge_state) {
            layout.edge = QuantizedFeatureMapping::from_state(*edge_state).feature_dimensions();
        }
        return layout;
    }
}

#endif // GRAFT_MODEL_BUILDER_HPP
