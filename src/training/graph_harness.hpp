#ifndef GRAFT_TRAINING_GRAPH_HARNESS_HPP
#define GRAFT_TRAINING_GRAPH_HARNESS_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>
#include <torch/csrc/autograd/profiler.h>

#include "../data/batch.hpp"
#include "../data/source.hpp"
#include "../distributed/parallel.hpp"
#include "../model/graph_model.hpp"
#include "harness.hpp"
#include "reporter.hpp"

namespace Graft::Training {
    struct GraphHarnessOptions {
        torch::Device device{torch::kCPU};
        std::shared_ptr<Data::BatchSource> train_source{};
        std::shared_ptr<Data::BatchSource> eval_source{};
        // Optimizer steps between two "loss" rows of the training metrics.
        std::int64_t log_interval{50};
    };

    struct GraphLoss {
        torch::Tensor total{};
        torch::Tensor edge_type_correct{};
        std::int64_t edge_count{0};
    };

    // Cross entropy of every head the model has, summed. Entries marked -1 in the
    // targets carry no value and are left out. `total` stays undefined when the
    // batch has nothing to predict.
    [[nodiscard]] inline GraphLoss graph_loss(const Model::GraphModelOutput& output, const Data::GraphBatch& batch)
    {
        GraphLoss loss{};
        const auto add = [&](const torch::Tensor& term) {
            loss.total = loss.total.defined() ? loss.total + term : term;
        };
        const auto add_feature_terms = [&](const std::map<std::string, torch::Tensor>& logits,
                                           const Data::FeatureTensors& targets) {
            for (const auto& [name, prediction] : logits) {
                const auto found = targets.find(name);
                if (found == targets.end()) {
                    throw std::invalid_argument("Batch has no target for the '" + name + "' head.");
                }
                const auto present = found->second.ge(0);
                if (!present.any().item<bool>()) {
                    continue;
                }
                add(torch::nn::functional::cross_entropy(prediction.index({present}), found->second.index({present})));
            }
        };

        loss.edge_count = batch.edge_count();
        if (loss.edge_count > 0) {
            add(torch::nn::functional::cross_entropy(output.edge_type_logits, batch.edge_types));
            loss.edge_type_correct = output.edge_type_logits.argmax(1).eq(batch.edge_types).sum();
        }
        add_feature_terms(output.entity_features, batch.node_features);
        add_feature_terms(output.edge_features, batch.edge_features);
        return loss;
    }

    // Trains a GraphModel one epoch at a time. When distributed, gradients are
    // averaged through the wrapper after every backward pass, including passes
    // whose batch produced no loss, so all participants keep reducing in step.
    class GraphHarness final : public Harness {
    public:
        GraphHarness(Model::GraphModel model,
                     Distributed::DistributedParallel parallel,
                     torch::optim::Optimizer& optimizer,
                     ReporterPtr reporter,
                     GraphHarnessOptions options)
            : model_(std::move(model)),
              parallel_(std::move(parallel)),
              optimizer_(optimizer),
              reporter_(std::move(reporter)),
              options_(std::move(options))
        {
            if (!options_.train_source) {
                throw std::invalid_argument("GraphHarness requires a training batch source.");
            }
            if (!reporter_) {
                reporter_ = std::make_shared<NullReporter>();
            }
            if (options_.log_interval <= 0) {
                throw std::invalid_argument("GraphHarness log interval must be positive.");
            }
        }

        [[nodiscard]] TrainingState run_training_epoch(const TrainingState& state) override
        {
            std::optional<torch::autograd::profiler::RecordProfile> profile;
            if (const auto path = reporter_->profile_path(state.epoch)) {
                profile.emplace(path->string());
            }

            model_->train();
            options_.train_source->begin_epoch(state.epoch);

            TrainingState next = state;
            double epoch_loss = 0.0;
            std::int64_t loss_batches = 0;
            double interval_loss = 0.0;
            std::int64_t interval_batches = 0;

            while (auto batch = options_.train_source->next()) {
                const auto device_batch = batch->to(options_.device);
                optimizer_.zero_grad();
                const auto loss = graph_loss(model_->forward(device_batch), device_batch);
                if (loss.total.defined()) {
                    loss.total.backward();
                    const double value = loss.total.item<double>();
                    epoch_loss += value;
                    interval_loss += value;
                    ++loss_batches;
                    ++interval_batches;
                }
                if (!parallel_.is_empty()) {
                    parallel_->synchronize_gradients();
                }
                optimizer_.step();
                ++next.global_step;

                if (next.global_step % options_.log_interval == 0 && interval_batches > 0) {
                    reporter_->scalar(MetricSink::Train, "loss", interval_loss / static_cast<double>(interval_batches),
                                      next.global_step);
                    interval_loss = 0.0;
                    interval_batches = 0;
                }
            }

            last_training_loss_.reset();
            if (loss_batches > 0) {
                last_training_loss_ = epoch_loss / static_cast<double>(loss_batches);
                reporter_->scalar(MetricSink::Train, "epoch_loss", *last_training_loss_, next.global_step);
            }
            reporter_->scalar(MetricSink::Train, "learning_rate", current_learning_rate(), next.global_step);

            next.epoch = state.epoch + 1;
            return next;
        }

        [[nodiscard]] bool has_eval() const override { return options_.eval_source != nullptr; }

        void run_eval_epoch(const TrainingState& state) override
        {
            if (!has_eval()) {
                return;
            }
            torch::NoGradGuard no_grad;
            model_->eval();
            options_.eval_source->begin_epoch(state.epoch);

            double total_loss = 0.0;
            std::int64_t loss_batches = 0;
            std::int64_t correct = 0;
            std::int64_t edges = 0;
            while (auto batch = options_.eval_source->next()) {
                const auto device_batch = batch->to(options_.device);
                const auto loss = graph_loss(model_->forward(device_batch), device_batch);
                if (loss.total.defined()) {
                    total_loss += loss.total.item<double>();
                    ++loss_batches;
                }
                if (loss.edge_count > 0) {
                    correct += loss.edge_type_correct.item<std::int64_t>();
                    edges += loss.edge_count;
                }
            }

            last_eval_loss_.reset();
            if (loss_batches > 0) {
                last_eval_loss_ = total_loss / static_cast<double>(loss_batches);
                reporter_->scalar(MetricSink::Eval, "loss", *last_eval_loss_, state.global_step);
            }
            if (edges > 0) {
                reporter_->scalar(MetricSink::Eval, "edge_type_accuracy",
                                  static_cast<double>(correct) / static_cast<double>(edges), state.global_step);
            }
        }

        [[nodiscard]] std::optional<double> last_training_loss() const override { return last_training_loss_; }
        [[nodiscard]] std::optional<double> last_eval_loss() const override { return last_eval_loss_; }

    private:
        [[nodiscard]] double current_learning_rate() const
        {
            const auto& groups = optimizer_.param_groups();
            return groups.empty() ? 0.0 : groups.front().options().get_lr();
        }

        Model::GraphModel model_;
        Distributed::DistributedParallel parallel_;
        torch::optim::Optimizer& optimizer_;
        ReporterPtr reporter_;
        GraphHarnessOptions options_;
        std::optional<double> last_training_loss_{};
        std::optional<double> last_eval_loss_{};
    };
}

#endif // GRAFT_TRAINING_GRAPH_HARNESS_HPP
