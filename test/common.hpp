#ifndef GRAFT_TEST_COMMON_HPP
#define GRAFT_TEST_COMMON_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <future>
#include <string>
#include <system_error>
#include <type_traits>
#include <vector>

#include <torch/torch.h>
#include <torch/csrc/distributed/c10d/HashStore.hpp>
#include <torch/csrc/distributed/c10d/ProcessGroupGloo.hpp>
#include <unistd.h>

#include "../include/Graft.h"

namespace Graft::Tests {
    // Fresh directory under the system temp dir, removed with its content.
    class TemporaryDirectory {
    public:
        TemporaryDirectory()
        {
            static std::atomic<int> counter{0};
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            path_ = std::filesystem::temp_directory_path()
                  / ("graft_test_" + std::to_string(::getpid()) + "_" + std::to_string(stamp) + "_"
                     + std::to_string(counter++));
            std::filesystem::create_directories(path_);
        }

        ~TemporaryDirectory()
        {
            std::error_code ignored;
            std::filesystem::remove_all(path_, ignored);
        }

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    // Gloo process group over an in-process store. All ranks of one group
    // share `store` and must connect concurrently.
    inline Distributed::BackendPtr local_process_group(const c10::intrusive_ptr<c10d::Store>& store, int rank, int world_size)
    {
        auto options = c10d::ProcessGroupGloo::Options::create(std::chrono::seconds(60));
        options->devices.push_back(c10d::ProcessGroupGloo::createDeviceForHostname("127.0.0.1"));
        return c10::make_intrusive<c10d::ProcessGroupGloo>(store, rank, world_size, options);
    }

    // Runs `participant(rank)` for every rank on its own thread and returns
    // the results by rank. An exception on any rank is rethrown here.
    template <class Participant>
    auto run_ranks(int world_size, Participant participant)
    {
        using Result = std::invoke_result_t<Participant&, int>;
        std::vector<std::future<Result>> pending;
        for (int rank = 0; rank < world_size; ++rank) {
            pending.push_back(std::async(std::launch::async, participant, rank));
        }
        std::vector<Result> results;
        for (auto& future : pending) {
            results.push_back(future.get());
        }
        return results;
    }

    inline torch::Tensor longs(const std::vector<std::int64_t>& values)
    {
        return torch::tensor(values, torch::kLong);
    }

    // `graphs` triangles. Node g*3+i has type (g + i) % 8 and length bucket
    // i - 1 (so the first node of every graph has none); edge types cycle
    // through the constraint kinds, angle and distance buckets through [0, 3).
    inline Data::GraphDataset::Storage triangle_storage(std::int64_t graphs)
    {
        std::vector<std::int64_t> node_types;
        std::vector<std::int64_t> lengths;
        std::vector<std::int64_t> node_offsets{0};
        std::vector<std::int64_t> sources;
        std::vector<std::int64_t> targets;
        std::vector<std::int64_t> edge_types;
        std::vector<std::int64_t> angles;
        std::vector<std::int64_t> distances;
        std::vector<std::int64_t> edge_offsets{0};

        for (std::int64_t graph = 0; graph < graphs; ++graph) {
            const auto base = graph * 3;
            for (std::int64_t i = 0; i < 3; ++i) {
                node_types.push_back((graph + i) % Model::kNodeTypeCount);
                lengths.push_back(i - 1);
                sources.push_back(base + i);
                targets.push_back(base + (i + 1) % 3);
                edge_types.push_back((graph * 3 + i) % Model::kEdgeTypeCount);
                angles.push_back((graph + i) % 3);
                distances.push_back(i % 3);
            }
            node_offsets.push_back(base + 3);
            edge_offsets.push_back(base + 3);
        }

        Data::GraphDataset::Storage storage{};
        storage.node_types = longs(node_types);
        storage.node_offsets = longs(node_offsets);
        storage.edge_index = torch::stack({longs(sources), longs(targets)});
        storage.edge_offsets = longs(edge_offsets);
        storage.edge_types = longs(edge_types);
        storage.node_features.emplace("length", longs(lengths));
        storage.edge_features.emplace("angle", longs(angles));
        storage.edge_features.emplace("distance", longs(distances));
        return storage;
    }

    inline Model::FeatureLayout triangle_layout()
    {
        Model::FeatureLayout layout{};
        layout.node = {{"length", 3}};
        layout.edge = {{"angle", 3}, {"distance", 3}};
        return layout;
    }

    // Small run over the triangle dataset written to `dataset`; bucket counts
    // match triangle_layout().
    inline Config::RunConfig tiny_config(const std::filesystem::path& dataset, const std::filesystem::path& output_dir)
    {
        Config::RunConfig config{};
        config.output_dir = output_dir;
        config.dataset_train = dataset;
        config.num_quantize_length = 3;
        config.num_quantize_angle = 3;
        config.batch_size = 2;
        config.hidden_size = 8;
        config.num_prop_rounds = 2;
        config.num_epochs = 2;
        return config;
    }
}

#endif // GRAFT_TEST_COMMON_HPP
