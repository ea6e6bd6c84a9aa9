#ifndef GRAFT_DATA_INITIALIZER_HPP
#define GRAFT_DATA_INITIALIZER_HPP

#include <cstdint>
#include <memory>
#include <numbers>
#include <optional>

#include "../common/error.hpp"
#include "../common/save_load.hpp"
#include "../config/config.hpp"
#include "../distributed/context.hpp"
#include "../distributed/partition.hpp"
#include "../model/feature_mapping.hpp"
#include "dataset.hpp"
#include "source.hpp"

namespace Graft::Data {
    struct DatasetBundle {
        std::shared_ptr<BatchSource> train_source{};
        std::shared_ptr<BatchSource> eval_source{};
        std::int64_t batches_per_epoch{0};
        Model::FeatureMappingPtr node_feature_mapping{};
        Model::FeatureMappingPtr edge_feature_mapping{};
    };

    class DatasetInitializer {
    public:
        virtual ~DatasetInitializer() = default;

        // Failures surface as DatasetError.
        [[nodiscard]] virtual DatasetBundle initialize(const Config::RunConfig& config,
                                                       const std::optional<Distributed::DistributedContext>& context) = 0;
    };

    // Node feature "length" and edge features "angle" and "distance", quantized
    // with the bucket counts of the run.
    [[nodiscard]] inline std::pair<Model::QuantizedFeatureMapping, Model::QuantizedFeatureMapping>
    default_feature_mappings(const Config::RunConfig& config)
    {
        Model::QuantizedFeatureMapping node_mapping;
        node_mapping.add("length", {.buckets = config.num_quantize_length, .minimum = 0.0, .maximum = 1.0});

        Model::QuantizedFeatureMapping edge_mapping;
        edge_mapping.add("angle", {.buckets = config.num_quantize_angle, .minimum = -std::numbers::pi, .maximum = std::numbers::pi});
        edge_mapping.add("distance", {.buckets = config.num_quantize_length, .minimum = 0.0, .maximum = 1.0});
        return {std::move(node_mapping), std::move(edge_mapping)};
    }

    // Reads graph datasets written by GraphDataset::save(). The optional
    // auxiliary file is a JSON object whose "node_feature_mapping" and
    // "edge_feature_mapping" entries replace the default quantization (the
    // layout a checkpoint's metadata records).
    class ArchiveDatasetInitializer final : public DatasetInitializer {
    public:
        [[nodiscard]] DatasetBundle initialize(const Config::RunConfig& config,
                                               const std::optional<Distributed::DistributedContext>& context) override
        {
            auto [node_mapping, edge_mapping] = default_feature_mappings(config);
            if (config.dataset_auxiliary) {
                apply_auxiliary(*config.dataset_auxiliary, node_mapping, edge_mapping);
            }

            DatasetBundle bundle{};
            bundle.node_feature_mapping = std::make_shared<const Model::QuantizedFeatureMapping>(std::move(node_mapping));
            bundle.edge_feature_mapping = std::make_shared<const Model::QuantizedFeatureMapping>(std::move(edge_mapping));
            const auto layout = Model::layout_of(bundle.node_feature_mapping, bundle.edge_feature_mapping);

            const auto partition = Distributed::partition(config.batch_size, context);
            auto train = std::make_shared<const GraphDataset>(GraphDataset::load(config.dataset_train, layout));
            if (train->size() == 0) {
                throw DatasetError("Training dataset '" + config.dataset_train.string() + "' holds no graphs.");
            }

            ShardOptions train_options{};
            train_options.batch_size = partition.per_participant_batch_size;
            train_options.rank = context ? context->global_rank : 0;
            train_options.world_size = context ? context->world_size : 1;
            train_options.shuffle = true;
            train_options.seed = config.seed;
            bundle.train_source = std::make_shared<ShardedBatchSource>(std::move(train), train_options);
            bundle.batches_per_epoch = bundle.train_source->batches_per_epoch();
            if (bundle.batches_per_epoch == 0) {
                throw DatasetError("Training dataset has fewer graphs than participants.");
            }

            // Every participant evaluates the whole test set.
            if (config.dataset_test) {
                auto test = std::make_shared<const GraphDataset>(GraphDataset::load(*config.dataset_test, layout));
                ShardOptions eval_options{};
                eval_options.batch_size = partition.per_participant_batch_size;
                eval_options.shuffle = false;
                bundle.eval_source = std::make_shared<ShardedBatchSource>(std::move(test), eval_options);
            }
            return bundle;
        }

    private:
        static void apply_auxiliary(const std::filesystem::path& path,
                                    Model::QuantizedFeatureMapping& node_mapping,
                                    Model::QuantizedFeatureMapping& edge_mapping)
        {
            try {
                const auto tree = Common::SaveLoad::read_json_file(path);
                if (const auto node_state = tree.get_child_optional("node_feature_mapping")) {
                    node_mapping = Model::QuantizedFeatureMapping::from_state(*node_state);
                }
                if (const auto edge_state = tree.get_child_optional("edge_feature_mapping")) {
                    edge_mapping = Model::QuantizedFeatureMapping::from_state(*edge_state);
                }
            } catch (const std::exception& error) {
                throw DatasetError("Failed to read auxiliary dataset '" + path.string() + "': " + error.what());
            }
        }
    };
}

#endif // GRAFT_DATA_INITIALIZER_HPP
