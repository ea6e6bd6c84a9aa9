#ifndef GRAFT_DATA_DATASET_HPP
#define GRAFT_DATA_DATASET_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "../model/feature_mapping.hpp"
#include "../model/graph_model.hpp"
#include "batch.hpp"

namespace Graft::Data {
    namespace Keys {
        inline constexpr const char* kNodeTypes = "node_types";
        inline constexpr const char* kNodeOffsets = "node_offsets";
        inline constexpr const char* kEdgeIndex = "edge_index";
        inline constexpr const char* kEdgeOffsets = "edge_offsets";
        inline constexpr const char* kEdgeTypes = "edge_types";
        inline constexpr const char* kNodeFeatures = "node_features";
        inline constexpr const char* kEdgeFeatures = "edge_features";
    }

    // Graphs stored back to back in CSR layout:
    //  node_offsets [G + 1]  graph g owns nodes [node_offsets[g], node_offsets[g + 1])
    //  edge_offsets [G + 1]  graph g owns edges [edge_offsets[g], edge_offsets[g + 1])
    //  edge_index   [2, E]   dataset-wide node indices
    // Feature tensors follow the node and edge order, -1 marking absent values.
    class GraphDataset {
    public:
        struct Storage {
            torch::Tensor node_types{};
            torch::Tensor node_offsets{};
            torch::Tensor edge_index{};
            torch::Tensor edge_offsets{};
            torch::Tensor edge_types{};
            FeatureTensors node_features{};
            FeatureTensors edge_features{};
        };

        // Validates `storage` against `layout`; features the layout does not
        // declare are dropped.
        GraphDataset(Storage storage, const Model::FeatureLayout& layout)
            : storage_(std::move(storage))
        {
            normalize_and_check(layout);
        }

        // Reads an archive written by save(). Any failure is a DatasetError.
        [[nodiscard]] static GraphDataset load(const std::filesystem::path& path, const Model::FeatureLayout& layout)
        {
            if (!std::filesystem::exists(path)) {
                throw DatasetError("Dataset not found at '" + path.string() + "'.");
            }
            Storage storage{};
            try {
                torch::serialize::InputArchive archive;
                archive.load_from(path.string(), torch::Device(torch::kCPU));
                archive.read(Keys::kNodeTypes, storage.node_types);
                archive.read(Keys::kNodeOffsets, storage.node_offsets);
                archive.read(Keys::kEdgeIndex, storage.edge_index);
                archive.read(Keys::kEdgeOffsets, storage.edge_offsets);
                archive.read(Keys::kEdgeTypes, storage.edge_types);

                c10::IValue value;
                if (archive.try_read(Keys::kNodeFeatures, value)) {
                    storage.node_features = read_features(value);
                }
                if (archive.try_read(Keys::kEdgeFeatures, value)) {
                    storage.edge_features = read_features(value);
                }
            } catch (const std::exception& error) {
                throw DatasetError("Failed to read dataset '" + path.string() + "': " + error.what());
            }

            try {
                return GraphDataset(std::move(storage), layout);
            } catch (const DatasetError& error) {
                throw DatasetError("Dataset '" + path.string() + "' is malformed: " + error.what());
            }
        }

        void save(const std::filesystem::path& path) const
        {
            torch::serialize::OutputArchive archive;
            archive.write(Keys::kNodeTypes, storage_.node_types);
            archive.write(Keys::kNodeOffsets, storage_.node_offsets);
            archive.write(Keys::kEdgeIndex, storage_.edge_index);
            archive.write(Keys::kEdgeOffsets, storage_.edge_offsets);
            archive.write(Keys::kEdgeTypes, storage_.edge_types);
            archive.write(Keys::kNodeFeatures, c10::IValue(write_features(storage_.node_features)));
            archive.write(Keys::kEdgeFeatures, c10::IValue(write_features(storage_.edge_features)));
            archive.save_to(path.string());
        }

        [[nodiscard]] std::int64_t size() const { return storage_.node_offsets.size(0) - 1; }

        // Gathers the given graphs into one batch with batch-local node indices.
        [[nodiscard]] GraphBatch batch(const std::vector<std::int64_t>& graphs) const
        {
            std::vector<torch::Tensor> node_ranges;
            std::vector<torch::Tensor> edge_ranges;
            std::vector<torch::Tensor> shifts;
            node_ranges.reserve(graphs.size());
            edge_ranges.reserve(graphs.size());
            shifts.reserve(graphs.size());

            const auto node_offsets = storage_.node_offsets.accessor<std::int64_t, 1>();
            const auto edge_offsets = storage_.edge_offsets.accessor<std::int64_t, 1>();
            std::int64_t batch_nodes = 0;
            for (const auto graph : graphs) {
                if (graph < 0 || graph >= size()) {
                    std::ostringstream message;
                    message << "Graph index " << graph << " is outside [0, " << size() << ").";
                    throw std::out_of_range(message.str());
                }
                const auto first_node = node_offsets[graph];
                const auto last_node = node_offsets[graph + 1];
                const auto first_edge = edge_offsets[graph];
                const auto last_edge = edge_offsets[graph + 1];
                node_ranges.push_back(torch::arange(first_node, last_node, torch::kLong));
                edge_ranges.push_back(torch::arange(first_edge, last_edge, torch::kLong));
                shifts.push_back(torch::full({last_edge - first_edge}, batch_nodes - first_node, torch::kLong));
                batch_nodes += last_node - first_node;
            }

            const auto nodes = node_ranges.empty() ? torch::empty({0}, torch::kLong) : torch::cat(node_ranges);
            const auto edges = edge_ranges.empty() ? torch::empty({0}, torch::kLong) : torch::cat(edge_ranges);
            const auto shift = shifts.empty() ? torch::empty({0}, torch::kLong) : torch::cat(shifts);

            GraphBatch batch{};
            batch.graph_count = static_cast<std::int64_t>(graphs.size());
            batch.node_types = storage_.node_types.index_select(0, nodes);
            batch.edge_types = storage_.edge_types.index_select(0, edges);
            batch.edge_index = storage_.edge_index.index_select(1, edges) + shift.unsqueeze(0);
            for (const auto& [name, values] : storage_.node_features) {
                batch.node_features.emplace(name, values.index_select(0, nodes));
            }
            for (const auto& [name, values] : storage_.edge_features) {
                batch.edge_features.emplace(name, values.index_select(0, edges));
            }
            return batch;
        }

        [[nodiscard]] const Storage& storage() const noexcept { return storage_; }

    private:
        static FeatureTensors read_features(const c10::IValue& value)
        {
            if (!value.isGenericDict()) {
                throw DatasetError("Feature entries must be a dictionary of tensors.");
            }
            FeatureTensors features;
            for (const auto& entry : value.toGenericDict()) {
                features.emplace(entry.key().toStringRef(), entry.value().toTensor());
            }
            return features;
        }

        static c10::Dict<std::string, torch::Tensor> write_features(const FeatureTensors& features)
        {
            c10::Dict<std::string, torch::Tensor> dict;
            for (const auto& [name, values] : features) {
                dict.insert(name, values);
            }
            return dict;
        }

        static void require(bool condition, const std::string& message)
        {
            if (!condition) {
                throw DatasetError(message);
            }
        }

        static void check_offsets(const torch::Tensor& offsets, std::int64_t total, const char* name)
        {
            require(offsets.dim() == 1 && offsets.size(0) >= 1, std::string(name) + " must be a non-empty vector.");
            require(offsets[0].item<std::int64_t>() == 0, std::string(name) + " must start at 0.");
            require(offsets[-1].item<std::int64_t>() == total, std::string(name) + " must end at the element count.");
            if (offsets.size(0) > 1) {
                const auto widths = offsets.slice(0, 1) - offsets.slice(0, 0, -1);
                require(widths.ge(0).all().item<bool>(), std::string(name) + " must be non-decreasing.");
            }
        }

        static void check_categories(const torch::Tensor& values, std::int64_t minimum, std::int64_t limit, const std::string& what)
        {
            if (values.numel() == 0) {
                return;
            }
            const auto low = values.min().item<std::int64_t>();
            const auto high = values.max().item<std::int64_t>();
            if (low < minimum || high >= limit) {
                std::ostringstream message;
                message << what << " values must lie in [" << minimum << ", " << limit << "), found [" << low << ", "
                        << high << "].";
                throw DatasetError(message.str());
            }
        }

        static void check_features(FeatureTensors& features,
                                   const Model::FeatureDimensions& dimensions,
                                   std::int64_t expected_length,
                                   const char* kind)
        {
            FeatureTensors kept;
            for (const auto& [name, buckets] : dimensions) {
                const auto found = features.find(name);
                if (found == features.end()) {
                    throw DatasetError(std::string(kind) + " feature '" + name + "' is missing.");
                }
                auto values = found->second.to(torch::kLong).contiguous();
                require(values.dim() == 1 && values.size(0) == expected_length,
                        std::string(kind) + " feature '" + name + "' does not match the element count.");
                check_categories(values, -1, buckets, std::string(kind) + " feature '" + name + "'");
                kept.emplace(name, std::move(values));
            }
            features = std::move(kept);
        }

        void normalize_and_check(const Model::FeatureLayout& layout)
        {
            auto& s = storage_;
            require(s.node_types.defined() && s.node_offsets.defined() && s.edge_index.defined()
                        && s.edge_offsets.defined() && s.edge_types.defined(),
                    "Every structural tensor is required.");

            s.node_types = s.node_types.to(torch::kLong).contiguous();
            s.node_offsets = s.node_offsets.to(torch::kLong).contiguous();
            s.edge_index = s.edge_index.to(torch::kLong).contiguous();
            s.edge_offsets = s.edge_offsets.to(torch::kLong).contiguous();
            s.edge_types = s.edge_types.to(torch::kLong).contiguous();

            require(s.node_types.dim() == 1, "node_types must be a vector.");
            require(s.edge_types.dim() == 1, "edge_types must be a vector.");
            require(s.edge_index.dim() == 2 && s.edge_index.size(0) == 2 && s.edge_index.size(1) == s.edge_types.size(0),
                    "edge_index must have shape [2, edge count].");
            check_offsets(s.node_offsets, s.node_types.size(0), Keys::kNodeOffsets);
            check_offsets(s.edge_offsets, s.edge_types.size(0), Keys::kEdgeOffsets);
            require(s.node_offsets.size(0) == s.edge_offsets.size(0), "node_offsets and edge_offsets disagree on the graph count.");

            check_categories(s.node_types, 0, Model::kNodeTypeCount, "node_types");
            check_categories(s.edge_types, 0, Model::kEdgeTypeCount, "edge_types");
            check_edges_stay_in_graph();

            check_features(s.node_features, layout.node, s.node_types.size(0), "Node");
            check_features(s.edge_features, layout.edge, s.edge_types.size(0), "Edge");
        }

        void check_edges_stay_in_graph() const
        {
            const auto& s = storage_;
            const auto graphs = s.node_offsets.size(0) - 1;
            if (graphs == 0 || s.edge_types.size(0) == 0) {
                return;
            }
            const auto edge_counts = s.edge_offsets.slice(0, 1) - s.edge_offsets.slice(0, 0, -1);
            const auto owner = torch::repeat_interleave(torch::arange(graphs, torch::kLong), edge_counts);
            const auto lower = s.node_offsets.index_select(0, owner);
            const auto upper = s.node_offsets.index_select(0, owner + 1);
            const auto inside = s.edge_index.ge(lower.unsqueeze(0)).logical_and(s.edge_index.lt(upper.unsqueeze(0)));
            require(inside.all().item<bool>(), "Edges must connect nodes of their own graph.");
        }

        Storage storage_;
    };
}

#endif // GRAFT_DATA_DATASET_HPP
