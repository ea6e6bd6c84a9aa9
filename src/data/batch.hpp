#ifndef GRAFT_DATA_BATCH_HPP
#define GRAFT_DATA_BATCH_HPP

#include <cstdint>
#include <map>
#include <string>

#include <torch/torch.h>

namespace Graft::Data {
    using FeatureTensors = std::map<std::string, torch::Tensor>;

    // A set of graphs flattened into one disconnected graph.
    //  node_types    [N]     int64
    //  edge_index    [2, E]  int64, indices into the batch's nodes
    //  edge_types    [E]     int64
    //  node_features name -> [N] int64 bucket index, -1 where the node has none
    //  edge_features name -> [E] int64 bucket index, -1 where the edge has none
    struct GraphBatch {
        torch::Tensor node_types{};
        torch::Tensor edge_index{};
        torch::Tensor edge_types{};
        FeatureTensors node_features{};
        FeatureTensors edge_features{};
        std::int64_t graph_count{0};

        [[nodiscard]] std::int64_t node_count() const { return node_types.defined() ? node_types.size(0) : 0; }
        [[nodiscard]] std::int64_t edge_count() const { return edge_types.defined() ? edge_types.size(0) : 0; }

        [[nodiscard]] GraphBatch to(const torch::Device& device, bool non_blocking = false) const {
            GraphBatch moved{};
            moved.node_types = node_types.to(device, non_blocking);
            moved.edge_index = edge_index.to(device, non_blocking);
            moved.edge_types = edge_types.to(device, non_blocking);
            for (const auto& [name, tensor] : node_features) {
                moved.node_features.emplace(name, tensor.to(device, non_blocking));
            }
            for (const auto& [name, tensor] : edge_features) {
                moved.edge_features.emplace(name, tensor.to(device, non_blocking));
            }
            moved.graph_count = graph_count;
            return moved;
        }
    };
}

#endif // GRAFT_DATA_BATCH_HPP
