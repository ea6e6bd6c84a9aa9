#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <string>

#include "common.hpp"

namespace Graft::Tests {
    namespace {
        Model::GraphModel small_model(std::int64_t hidden = 8)
        {
            Model::GraphModelOptions options{};
            options.hidden_size = hidden;
            options.depth = 2;
            options.features = triangle_layout();
            return Model::GraphModel(options);
        }

        void expect_identical(torch::nn::Module& actual, torch::nn::Module& expected)
        {
            const auto expected_parameters = expected.named_parameters();
            for (const auto& item : actual.named_parameters()) {
                const auto* reference = expected_parameters.find(item.key());
                ASSERT_NE(reference, nullptr) << item.key();
                EXPECT_TRUE(torch::equal(item.value(), *reference)) << item.key();
            }
        }
    }

    TEST(CheckpointKey, DistributedPrefixIsSevenCharacters)
    {
        EXPECT_EQ(Checkpoint::kDistributedPrefix, "module.");
        EXPECT_EQ(Checkpoint::kDistributedPrefix.size(), 7u);
    }

    TEST(CheckpointKey, StripsOnlyTheWrapperPrefix)
    {
        EXPECT_EQ(Checkpoint::normalize_parameter_key("module.encoder.weight"), "encoder.weight");
        EXPECT_EQ(Checkpoint::normalize_parameter_key("encoder.weight"), "encoder.weight");
        EXPECT_EQ(Checkpoint::normalize_parameter_key("modules.weight"), "modules.weight");
        EXPECT_EQ(Checkpoint::normalize_parameter_key("module."), "");
    }

    TEST(Checkpoint, RoundTripsParametersAndCounters)
    {
        TemporaryDirectory directory;
        const auto path = directory.path() / "model.pt";

        torch::manual_seed(1);
        auto saved = small_model();
        Checkpoint::save(path, *saved, nullptr, {.epoch = 3, .global_step = 150}, {});

        torch::manual_seed(2);
        auto restored = small_model();
        const auto state = Model::resume(*restored, path);

        EXPECT_EQ(state, (Training::TrainingState{3, 150}));
        expect_identical(*restored, *saved);
    }

    TEST(Checkpoint, LoadsWhatAWrappedModelWrote)
    {
        TemporaryDirectory directory;
        const auto path = directory.path() / "wrapped.pt";

        torch::manual_seed(3);
        auto trained = small_model();
        Distributed::DistributedParallel wrapper(trained.ptr(), local_process_group(c10::make_intrusive<c10d::HashStore>(), 0, 1));
        Checkpoint::save(path, *wrapper, nullptr, {.epoch = 1, .global_step = 10}, {});

        const auto record = Checkpoint::load(path);
        for (const auto& [key, tensor] : record.parameters) {
            EXPECT_EQ(key.rfind("module.", 0), 0u) << key;
        }

        torch::manual_seed(4);
        auto fresh = small_model();
        Checkpoint::apply(*fresh, record);
        expect_identical(*fresh, *trained);
    }

    TEST(Checkpoint, ReportsEveryIncompatibility)
    {
        TemporaryDirectory directory;
        const auto path = directory.path() / "narrow.pt";
        auto narrow = small_model(8);
        Checkpoint::save(path, *narrow, nullptr, {}, {});

        auto wide = small_model(16);
        const auto before = wide->named_parameters()["node_embedding.weight"].clone();
        try {
            static_cast<void>(Model::resume(*wide, path));
            FAIL() << "expected CheckpointLoadError";
        } catch (const CheckpointLoadError& error) {
            const std::string message = error.what();
            EXPECT_NE(message.find("node_embedding.weight"), std::string::npos);
            EXPECT_NE(message.find("edge_type_head.weight"), std::string::npos);
        }
        EXPECT_TRUE(torch::equal(wide->named_parameters()["node_embedding.weight"], before));
    }

    TEST(Checkpoint, RejectsMissingAndUnexpectedKeys)
    {
        TemporaryDirectory directory;
        const auto path = directory.path() / "partial.pt";

        Model::GraphModelOptions without_features{};
        without_features.hidden_size = 8;
        without_features.depth = 2;
        Model::GraphModel plain(without_features);
        Checkpoint::save(path, *plain, nullptr, {}, {});

        auto featured = small_model();
        try {
            static_cast<void>(Model::resume(*featured, path));
            FAIL() << "expected CheckpointLoadError";
        } catch (const CheckpointLoadError& error) {
            EXPECT_NE(std::string(error.what()).find("entity_readout_length"), std::string::npos);
        }

        const auto featured_path = directory.path() / "featured.pt";
        Checkpoint::save(featured_path, *featured, nullptr, {}, {});
        EXPECT_THROW(static_cast<void>(Model::resume(*plain, featured_path)), CheckpointLoadError);
    }

    TEST(Checkpoint, MissingFileIsALoadError)
    {
        TemporaryDirectory directory;
        auto model = small_model();
        EXPECT_THROW(static_cast<void>(Model::resume(*model, directory.path() / "absent.pt")), CheckpointLoadError);
    }

    TEST(Checkpoint, CorruptFileIsALoadError)
    {
        TemporaryDirectory directory;
        const auto path = directory.path() / "corrupt.pt";
        {
            std::ofstream stream(path);
            stream << "not an archive";
        }
        EXPECT_THROW(static_cast<void>(Checkpoint::load(path)), CheckpointLoadError);
    }

    TEST(Checkpoint, CarriesMetadataAndOptimizerState)
    {
        TemporaryDirectory directory;
        const auto path = directory.path() / "full.pt";

        auto model = small_model();
        auto binding = Optimizer::bind(Optimizer::Kind::Adam, model->parameters(), 1e-3);
        for (auto& parameter : model->parameters()) {
            parameter.mutable_grad() = torch::ones_like(parameter);
        }
        binding.optimizer->step();

        Model::QuantizedFeatureMapping nodes;
        nodes.add("length", {.buckets = 3, .minimum = 0.0, .maximum = 1.0});
        const auto metadata = Model::checkpoint_metadata(
            std::make_shared<const Model::QuantizedFeatureMapping>(nodes), nullptr, model->options());
        Checkpoint::save(path, *model, binding.optimizer.get(), {.epoch = 2, .global_step = 20}, metadata);

        const auto record = Checkpoint::load(path);
        EXPECT_TRUE(record.has_optimizer_state);
        EXPECT_EQ(record.metadata.get<std::string>("model_configuration.name"), "graph");
        EXPECT_EQ(record.metadata.get<std::int64_t>("model_configuration.embedding_dim"), 8);
        EXPECT_EQ(record.metadata.get<std::int64_t>("model_configuration.depth"), 2);
        const auto layout = Model::layout_from_metadata(record.metadata);
        EXPECT_EQ(layout.node.at("length"), 3);
        EXPECT_TRUE(layout.edge.empty());

        auto copy = small_model();
        auto copy_binding = Optimizer::bind(Optimizer::Kind::Adam, copy->parameters(), 1e-3);
        EXPECT_TRUE(Checkpoint::restore_optimizer(path, *copy_binding.optimizer, torch::Device(torch::kCPU)));
        EXPECT_EQ(copy_binding.optimizer->state().size(), binding.optimizer->state().size());

        const auto bare = directory.path() / "bare.pt";
        Checkpoint::save(bare, *model, nullptr, {}, {});
        EXPECT_FALSE(Checkpoint::load(bare).has_optimizer_state);
        EXPECT_FALSE(Checkpoint::restore_optimizer(bare, *copy_binding.optimizer, torch::Device(torch::kCPU)));
    }
}
