#ifndef GRAFT_DATA_SOURCE_HPP
#define GRAFT_DATA_SOURCE_HPP

#include <algorithm>
#include <cstdint>
#include <memory>
#include <numeric>
#include <optional>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

#include "batch.hpp"
#include "dataset.hpp"

namespace Graft::Data {
    // Iterates over the batches of one epoch. begin_epoch() must be called
    // before the first next() of every epoch.
    class BatchSource {
    public:
        virtual ~BatchSource() = default;

        virtual void begin_epoch(std::int64_t epoch) = 0;

        // Next batch of the current epoch, std::nullopt once it is exhausted.
        [[nodiscard]] virtual std::optional<GraphBatch> next() = 0;

        // Identical on every participant, so collective calls stay in lockstep.
        [[nodiscard]] virtual std::int64_t batches_per_epoch() const = 0;
    };

    struct ShardOptions {
        std::int64_t batch_size{1};
        int rank{0};
        int world_size{1};
        bool shuffle{true};
        std::uint64_t seed{0};
    };

    // Splits the dataset over the participants and cuts each shard into
    // batches. Graphs left over after an even split are skipped for the epoch;
    // the shuffle (seeded with seed + epoch, identical on every rank) decides
    // which ones.
    class ShardedBatchSource final : public BatchSource {
    public:
        ShardedBatchSource(std::shared_ptr<const GraphDataset> dataset, ShardOptions options)
            : dataset_(std::move(dataset)), options_(options)
        {
            if (!dataset_) {
                throw std::invalid_argument("ShardedBatchSource requires a dataset.");
            }
            if (options_.batch_size <= 0) {
                throw std::invalid_argument("ShardedBatchSource requires a positive batch size.");
            }
            if (options_.world_size <= 0 || options_.rank < 0 || options_.rank >= options_.world_size) {
                throw std::invalid_argument("ShardedBatchSource rank is outside the world.");
            }
        }

        void begin_epoch(std::int64_t epoch) override
        {
            std::vector<std::int64_t> order(static_cast<std::size_t>(dataset_->size()));
            std::iota(order.begin(), order.end(), std::int64_t{0});
            if (options_.shuffle) {
                std::mt19937_64 generator(options_.seed + static_cast<std::uint64_t>(epoch));
                std::shuffle(order.begin(), order.end(), generator);
            }

            shard_.clear();
            const auto per_rank = shard_size();
            shard_.reserve(static_cast<std::size_t>(per_rank));
            for (std::int64_t i = 0; i < per_rank; ++i) {
                shard_.push_back(order[static_cast<std::size_t>(i * options_.world_size + options_.rank)]);
            }
            cursor_ = 0;
        }

        [[nodiscard]] std::optional<GraphBatch> next() override
        {
            if (cursor_ >= shard_.size()) {
                return std::nullopt;
            }
            const auto end = std::min(shard_.size(), cursor_ + static_cast<std::size_t>(options_.batch_size));
            std::vector<std::int64_t> graphs(shard_.begin() + static_cast<std::ptrdiff_t>(cursor_),
                                             shard_.begin() + static_cast<std::ptrdiff_t>(end));
            cursor_ = end;
            return dataset_->batch(graphs);
        }

        [[nodiscard]] std::int64_t batches_per_epoch() const override
        {
            return (shard_size() + options_.batch_size - 1) / options_.batch_size;
        }

    private:
        [[nodiscard]] std::int64_t shard_size() const { return dataset_->size() / options_.world_size; }

        std::shared_ptr<const GraphDataset> dataset_;
        ShardOptions options_;
        std::vector<std::int64_t> shard_{};
        std::size_t cursor_{0};
    };
}

#endif // GRAFT_DATA_SOURCE_HPP
