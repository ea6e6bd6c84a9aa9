#ifndef GRAFT_MODEL_GRAPH_MODEL_HPP
#define GRAFT_MODEL_GRAPH_MODEL_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "../data/batch.hpp"
#include "feature_mapping.hpp"

namespace Graft::Model {
    // Sketch primitives (line, circle, arc, point, ellipse, spline, conic,
    // external reference) and constraint kinds the graph is built from.
    inline constexpr std::int64_t kNodeTypeCount = 8;
    inline constexpr std::int64_t kEdgeTypeCount = 16;

    struct GraphModelOptions {
        std::int64_t hidden_size{384};
        std::int64_t depth{3};
        FeatureLayout features{};
        bool readout_entity_features{true};
        bool readout_edge_features{true};
        // Unset: embed the input features whenever the layout declares some.
        std::optional<bool> readin_entity_features{};
        std::optional<bool> readin_edge_features{};
    };

    struct GraphModelOutput {
        torch::Tensor edge_type_logits{};                       // [E, kEdgeTypeCount]
        std::map<std::string, torch::Tensor> entity_features{}; // name -> [N, buckets]
        std::map<std::string, torch::Tensor> edge_features{};   // name -> [E, buckets]
    };

    // Message passing network over sketch graphs. Node states start from the
    // entity type (plus the embedded entity features when read in) and are
    // refined over `depth` rounds of symmetric edge messages folded in by a GRU
    // cell. Heads read the final states out per node and per edge.
    class GraphModelImpl : public torch::nn::Module {
    public:
        explicit GraphModelImpl(GraphModelOptions options)
            : options_(std::move(options))
        {
            if (options_.hidden_size <= 0) {
                throw ConfigurationError("Graph model requires a positive hidden size.");
            }
            if (options_.depth <= 0) {
                throw ConfigurationError("Graph model requires at least one propagation round.");
            }

            const auto hidden = options_.hidden_size;
            readin_entity_ = options_.readin_entity_features.value_or(!options_.features.node.empty());
            readin_edge_ = options_.readin_edge_features.value_or(!options_.features.edge.empty());

            node_embedding_ = register_module("node_embedding", torch::nn::Embedding(kNodeTypeCount, hidden));
            edge_embedding_ = register_module("edge_embedding", torch::nn::Embedding(kEdgeTypeCount, hidden));

            if (readin_entity_) {
                for (const auto& [name, buckets] : options_.features.node) {
                    entity_readin_.emplace(name, register_module("entity_readin_" + checked_name(name), make_readin(buckets)));
                }
            }
            if (readin_edge_) {
                for (const auto& [name, buckets] : options_.features.edge) {
                    edge_readin_.emplace(name, register_module("edge_readin_" + checked_name(name), make_readin(buckets)));
                }
            }

            for (std::int64_t round = 0; round < options_.depth; ++round) {
                const auto suffix = std::to_string(round);
                messages_.push_back(register_module("message_" + suffix, torch::nn::Linear(3 * hidden, hidden)));
                updates_.push_back(register_module("update_" + suffix, torch::nn::GRUCell(hidden, hidden)));
            }

            edge_type_head_ = register_module("edge_type_head", torch::nn::Linear(2 * hidden, kEdgeTypeCount));
            if (options_.readout_entity_features) {
                for (const auto& [name, buckets] : options_.features.node) {
                    entity_readout_.emplace(name, register_module("entity_readout_" + checked_name(name),
                                                                  torch::nn::Linear(hidden, buckets)));
                }
            }
            if (options_.readout_edge_features) {
                for (const auto& [name, buckets] : options_.features.edge) {
                    edge_readout_.emplace(name, register_module("edge_readout_" + checked_name(name),
                                                                torch::nn::Linear(2 * hidden, buckets)));
                }
            }
        }

        GraphModelOutput forward(const Data::GraphBatch& batch)
        {
            auto nodes = node_embedding_->forward(batch.node_types);
            for (auto& [name, embedding] : entity_readin_) {
                nodes = nodes + embed_feature(embedding, batch.node_features, name);
            }
            auto edges = edge_embedding_->forward(batch.edge_types);
            for (auto& [name, embedding] : edge_readin_) {
                edges = edges + embed_feature(embedding, batch.edge_features, name);
            }

            const auto source = batch.edge_index.select(0, 0);
            const auto target = batch.edge_index.select(0, 1);
            const auto senders = torch::cat({source, target});
            const auto receivers = torch::cat({target, source});
            const auto edge_states = torch::cat({edges, edges});

            for (std::size_t round = 0; round < messages_.size(); ++round) {
                auto message = torch::relu(messages_[round]->forward(
                    torch::cat({nodes.index_select(0, senders), nodes.index_select(0, receivers), edge_states}, 1)));
                auto aggregated = torch::zeros_like(nodes).index_add(0, receivers, message);
                nodes = updates_[round]->forward(aggregated, nodes);
            }

            const auto pairs = torch::cat({nodes.index_select(0, source), nodes.index_select(0, target)}, 1);

            GraphModelOutput output{};
            output.edge_type_logits = edge_type_head_->forward(pairs);
            for (auto& [name, head] : entity_readout_) {
                output.entity_features.emplace(name, head->forward(nodes));
            }
            for (auto& [name, head] : edge_readout_) {
                output.edge_features.emplace(name, head->forward(pairs));
            }
            return output;
        }

        [[nodiscard]] const GraphModelOptions& options() const noexcept { return options_; }
        [[nodiscard]] bool reads_in_entity_features() const noexcept { return readin_entity_; }
        [[nodiscard]] bool reads_in_edge_features() const noexcept { return readin_edge_; }

    private:
        // Bucket b is stored at row b + 1; row 0 stands for "no value".
        torch::nn::Embedding make_readin(std::int64_t buckets) const {
            return torch::nn::Embedding(torch::nn::EmbeddingOptions(buckets + 1, options_.hidden_size).padding_idx(0));
        }

        static const std::string& checked_name(const std::string& name) {
            if (name.empty() || name.find('.') != std::string::npos) {
                throw ConfigurationError("Feature name '" + name + "' cannot be used as a module name.");
            }
            return name;
        }

        static torch::Tensor embed_feature(torch::nn::Embedding& embedding,
                                           const Data::FeatureTensors& features,
                                           const std::string& name) {
            const auto found = features.find(name);
            if (found == features.end()) {
                throw std::invalid_argument("Batch is missing the '" + name + "' feature the model reads in.");
            }
            return embedding->forward(found->second + 1);
        }

        GraphModelOptions options_;
        bool readin_entity_{false};
        bool readin_edge_{false};

        torch::nn::Embedding node_embedding_{nullptr};
        torch::nn::Embedding edge_embedding_{nullptr};
        std::map<std::string, torch::nn::Embedding> entity_readin_{};
        std::map<std::string, torch::nn::Embedding> edge_readin_{};
        std::vector<torch::nn::Linear> messages_{};
        std::vector<torch::nn::GRUCell> updates_{};
        torch::nn::Linear edge_type_head_{nullptr};
        std::map<std::string, torch::nn::Linear> entity_readout_{};
        std::map<std::string, torch::nn::Linear> edge_readout_{};
    };

    TORCH_MODULE(GraphModel);
}

#endif // GRAFT_MODEL_GRAPH_MODEL_HPP
