#ifndef GRAFT_TRAINING_COORDINATOR_HPP
#define GRAFT_TRAINING_COORDINATOR_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <torch/torch.h>

#include "../checkpoint/checkpoint.hpp"
#include "../config/config.hpp"
#include "../data/initializer.hpp"
#include "../distributed/context.hpp"
#include "../distributed/parallel.hpp"
#include "../model/builder.hpp"
#include "../optimizer/binder.hpp"
#include "graph_harness.hpp"
#include "harness.hpp"
#include "reporter.hpp"
#include "state.hpp"

namespace Graft::Training {
    enum class Phase { Initializing, Running, Terminated };

    inline std::ostream& operator<<(std::ostream& stream, Phase phase)
    {
        switch (phase) {
            case Phase::Initializing: return stream << "Initializing";
            case Phase::Running: return stream << "Running";
            case Phase::Terminated: return stream << "Terminated";
        }
        return stream << "Unknown";
    }

    // Everything a harness may use, valid for the lifetime of the coordinator.
    struct HarnessContext {
        Model::GraphModel model{nullptr};
        Distributed::DistributedParallel parallel{nullptr};
        torch::optim::Optimizer* optimizer{nullptr};
        ReporterPtr reporter{};
        torch::Device device{torch::kCPU};
        const Data::DatasetBundle* datasets{nullptr};
    };

    using HarnessFactory = std::function<std::unique_ptr<Harness>(const HarnessContext&)>;

    [[nodiscard]] inline std::unique_ptr<Harness> make_graph_harness(const HarnessContext& context)
    {
        GraphHarnessOptions options{};
        options.device = context.device;
        options.train_source = context.datasets->train_source;
        options.eval_source = context.datasets->eval_source;
        return std::make_unique<GraphHarness>(context.model, context.parallel, *context.optimizer, context.reporter,
                                              std::move(options));
    }

    // cuda:local_rank for a participant of a distributed run, otherwise the
    // first CUDA device; the CPU when CUDA is unavailable.
    [[nodiscard]] inline torch::Device default_device(const std::optional<Distributed::DistributedContext>& context)
    {
        if (!torch::cuda::is_available()) {
            return torch::Device(torch::kCPU);
        }
        const auto index = context ? context->local_rank : 0;
        return torch::Device(torch::kCUDA, static_cast<c10::DeviceIndex>(index));
    }

    struct CoordinatorOptions {
        std::optional<torch::Device> device{};
        HarnessFactory harness_factory{make_graph_harness};
        // Connected process group to use instead of joining one from the context.
        Distributed::BackendPtr backend{};
    };

    // Owns one training run: Initializing builds, resumes, places, wraps and
    // binds the model; Running loops over the epochs; Terminated hands the model
    // back. A run() after termination is a logic error.
    class Coordinator {
    public:
        Coordinator(const Config::RunConfig& config,
                    std::optional<Distributed::DistributedContext> context,
                    Data::DatasetBundle datasets,
                    ReporterPtr reporter,
                    CoordinatorOptions options = {})
            : config_(config),
              context_(std::move(context)),
              datasets_(std::move(datasets)),
              reporter_(std::move(reporter)),
              options_(std::move(options))
        {
            if (!reporter_) {
                reporter_ = std::make_shared<NullReporter>();
            }
            if (!options_.harness_factory) {
                throw std::invalid_argument("Coordinator requires a harness factory.");
            }
        }

        // Performs the Initializing phase. Configuration and checkpoint errors
        // surface here, before any training.
        void initialize()
        {
            if (phase_ != Phase::Initializing) {
                throw std::logic_error("Coordinator is already initialized.");
            }

            const auto layout = Model::layout_of(datasets_.node_feature_mapping, datasets_.edge_feature_mapping);
            model_ = Model::build(layout, config_, reporter_->stream());
            state_ = Model::resume(*model_, config_.model_state);

            device_ = options_.device.value_or(default_device(context_));
            model_->to(*device_);

            if (context_) {
                auto backend = options_.backend ? options_.backend : Distributed::connect(*context_);
                parallel_ = Distributed::DistributedParallel(model_.ptr(), std::move(backend));
            }

            binding_ = Optimizer::bind(config_.optimizer, model_->parameters(), config_.learning_rate);
            if (config_.model_state && Checkpoint::restore_optimizer(*config_.model_state, *binding_.optimizer, *device_)) {
                reporter_->message("Restored optimizer state from " + config_.model_state->string());
            }

            metadata_ = Model::checkpoint_metadata(datasets_.node_feature_mapping, datasets_.edge_feature_mapping,
                                                   model_->options());

            HarnessContext context{};
            context.model = model_;
            context.parallel = parallel_;
            context.optimizer = binding_.optimizer.get();
            context.reporter = reporter_;
            context.device = *device_;
            context.datasets = &datasets_;
            harness_ = options_.harness_factory(context);
            if (!harness_) {
                throw std::logic_error("Harness factory returned no harness.");
            }

            phase_ = Phase::Running;
        }

        // Trains until num_epochs is reached and returns the model.
        Model::GraphModel run()
        {
            if (phase_ == Phase::Terminated) {
                throw std::logic_error("Coordinator has already terminated; build a new one to train again.");
            }
            if (phase_ == Phase::Initializing) {
                initialize();
            }

            while (state_.epoch < config_.num_epochs) {
                binding_.scheduler->apply(state_.epoch);
                const auto learning_rate = binding_.optimizer->param_groups().front().options().get_lr();
                const auto start = std::chrono::steady_clock::now();

                const auto next = harness_->run_training_epoch(state_);
                if (next.epoch != state_.epoch + 1 || next.global_step < state_.global_step) {
                    std::ostringstream message;
                    message << "Harness moved the training state from " << state_ << " to " << next
                            << "; exactly one epoch must pass per call.";
                    throw std::logic_error(message.str());
                }
                if (harness_->has_eval()) {
                    harness_->run_eval_epoch(next);
                }
                state_ = next;

                EpochSummary summary{};
                summary.state = state_;
                summary.total_epochs = config_.num_epochs;
                summary.learning_rate = learning_rate;
                summary.duration_seconds =
                    std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
                summary.train_loss = harness_->last_training_loss();
                summary.eval_loss = harness_->last_eval_loss();
                reporter_->epoch_completed(summary);
                reporter_->checkpoint(checkpoint_module(), binding_.optimizer.get(), state_, metadata_);
            }

            phase_ = Phase::Terminated;
            return model_;
        }

        [[nodiscard]] Phase phase() const noexcept { return phase_; }
        [[nodiscard]] const TrainingState& state() const noexcept { return state_; }
        [[nodiscard]] const Model::GraphModel& model() const noexcept { return model_; }
        [[nodiscard]] torch::optim::Optimizer* optimizer() const noexcept { return binding_.optimizer.get(); }

    private:
        [[nodiscard]] const torch::nn::Module& checkpoint_module() const
        {
            if (!parallel_.is_empty()) {
                return *parallel_;
            }
            return *model_;
        }

        const Config::RunConfig& config_;
        std::optional<Distributed::DistributedContext> context_;
        Data::DatasetBundle datasets_;
        ReporterPtr reporter_;
        CoordinatorOptions options_;

        Phase phase_{Phase::Initializing};
        TrainingState state_{};
        std::optional<torch::Device> device_{};
        Model::GraphModel model_{nullptr};
        Distributed::DistributedParallel parallel_{nullptr};
        Optimizer::Binding binding_{};
        std::unique_ptr<Harness> harness_{};
        Common::SaveLoad::PropertyTree metadata_{};
    };
}

#endif // GRAFT_TRAINING_COORDINATOR_HPP
