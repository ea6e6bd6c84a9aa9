#ifndef GRAFT_TRAINING_REPORTER_HPP
#define GRAFT_TRAINING_REPORTER_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <torch/torch.h>

#include "../checkpoint/checkpoint.hpp"
#include "../common/save_load.hpp"
#include "../utils/terminal.hpp"
#include "state.hpp"

namespace Graft::Training {
    enum class MetricSink { Train, Eval };

    struct EpochSummary {
        TrainingState state{};
        std::int64_t total_epochs{0};
        double learning_rate{0.0};
        double duration_seconds{0.0};
        std::optional<double> train_loss{};
        std::optional<double> eval_loss{};
    };

    // Every side effect of a run goes through a Reporter. The leader gets a
    // LeaderReporter; every other participant a NullReporter, so training code
    // never checks ranks itself.
    class Reporter {
    public:
        virtual ~Reporter() = default;

        // Console sink for free-form progress messages, nullptr when silent.
        [[nodiscard]] virtual std::ostream* stream() = 0;

        virtual void message(std::string_view text) = 0;

        virtual void scalar(MetricSink sink, std::string_view tag, double value, std::int64_t step) = 0;

        virtual void epoch_completed(const EpochSummary& summary) = 0;

        // Persists `model` (as named, wrapper prefix included) after the epoch
        // recorded in `state`.
        virtual void checkpoint(const torch::nn::Module& model,
                                const torch::optim::Optimizer* optimizer,
                                const TrainingState& state,
                                const Common::SaveLoad::PropertyTree& metadata) = 0;

        // Where the profiler trace of `epoch` goes, std::nullopt to skip profiling.
        [[nodiscard]] virtual std::optional<std::filesystem::path> profile_path(std::int64_t epoch) const = 0;
    };

    using ReporterPtr = std::shared_ptr<Reporter>;

    class NullReporter final : public Reporter {
    public:
        [[nodiscard]] std::ostream* stream() override { return nullptr; }
        void message(std::string_view) override {}
        void scalar(MetricSink, std::string_view, double, std::int64_t) override {}
        void epoch_completed(const EpochSummary&) override {}
        void checkpoint(const torch::nn::Module&, const torch::optim::Optimizer*, const TrainingState&,
                        const Common::SaveLoad::PropertyTree&) override {}
        [[nodiscard]] std::optional<std::filesystem::path> profile_path(std::int64_t) const override { return std::nullopt; }
    };

    struct LeaderReporterOptions {
        std::filesystem::path output_dir{};
        std::ostream* stream{&std::cout};
        bool colored{true};
        bool profile{false};
    };

    // Console log, metrics.csv (training) and eval/metrics.csv (evaluation) in
    // the output directory, plus model_state_ep{N}.pt after every epoch.
    class LeaderReporter final : public Reporter {
    public:
        static constexpr const char* kMetricsFile = "metrics.csv";
        static constexpr const char* kEvalDirectory = "eval";

        explicit LeaderReporter(LeaderReporterOptions options)
            : options_(std::move(options))
        {
            if (options_.output_dir.empty()) {
                throw std::invalid_argument("LeaderReporter requires an output directory.");
            }
            const auto eval_dir = options_.output_dir / kEvalDirectory;
            std::error_code error;
            std::filesystem::create_directories(eval_dir, error);
            if (error) {
                throw std::runtime_error("Failed to create '" + eval_dir.string() + "': " + error.message());
            }
            open_metrics(train_metrics_, options_.output_dir / kMetricsFile);
            open_metrics(eval_metrics_, eval_dir / kMetricsFile);
        }

        [[nodiscard]] std::ostream* stream() override { return options_.stream; }

        void message(std::string_view text) override
        {
            if (options_.stream != nullptr) {
                *options_.stream << Utils::Terminal::Prefix(options_.colored) << text << '\n';
            }
        }

        void scalar(MetricSink sink, std::string_view tag, double value, std::int64_t step) override
        {
            auto& file = sink == MetricSink::Train ? train_metrics_ : eval_metrics_;
            file << step << ',' << tag << ',' << std::setprecision(9) << value << '\n';
        }

        void epoch_completed(const EpochSummary& summary) override
        {
            train_metrics_.flush();
            eval_metrics_.flush();
            if (options_.stream == nullptr) {
                return;
            }

            using Utils::Terminal::ApplyColor;
            namespace Colors = Utils::Terminal::Colors;
            const auto paint = [&](std::string_view text, std::string_view color) {
                return options_.colored ? ApplyColor(text, color) : std::string(text);
            };

            std::ostringstream line;
            line << Utils::Terminal::Prefix(options_.colored)
                 << "Epoch [" << summary.state.epoch << '/' << summary.total_epochs << "] | step "
                 << summary.state.global_step << " | lr " << std::scientific << std::setprecision(3)
                 << summary.learning_rate << std::defaultfloat;
            line << " | " << paint("Train", Colors::kYellow) << " loss: ";
            format_loss(line, summary.train_loss);
            line << " | " << paint("Eval", Colors::kBrightCyan) << " loss: ";
            format_loss(line, summary.eval_loss);
            std::ostringstream duration;
            duration << std::fixed << std::setprecision(2) << summary.duration_seconds << "sec";
            line << " | " << paint("duration: " + duration.str(), Colors::kBrightBlack);
            *options_.stream << line.str() << '\n';
        }

        void checkpoint(const torch::nn::Module& model,
                        const torch::optim::Optimizer* optimizer,
                        const TrainingState& state,
                        const Common::SaveLoad::PropertyTree& metadata) override
        {
            const auto path = checkpoint_path(state.epoch);
            Checkpoint::save(path, model, optimizer, state, metadata);
        }

        [[nodiscard]] std::optional<std::filesystem::path> profile_path(std::int64_t epoch) const override
        {
            if (!options_.profile) {
                return std::nullopt;
            }
            return options_.output_dir / ("profile_ep" + std::to_string(epoch) + ".trace.json");
        }

        [[nodiscard]] std::filesystem::path checkpoint_path(std::int64_t epoch) const
        {
            return options_.output_dir / ("model_state_ep" + std::to_string(epoch) + ".pt");
        }

    private:
        static void open_metrics(std::ofstream& file, const std::filesystem::path& path)
        {
            file.open(path, std::ios::out | std::ios::app);
            if (!file) {
                throw std::runtime_error("Failed to open metrics file '" + path.string() + "'.");
            }
            if (std::filesystem::file_size(path) == 0) {
                file << "step,tag,value\n";
            }
        }

        static void format_loss(std::ostringstream& line, const std::optional<double>& loss)
        {
            if (loss) {
                line << std::fixed << std::setprecision(6) << *loss << std::defaultfloat;
            } else {
                line << "N/A";
            }
        }

        LeaderReporterOptions options_;
        std::ofstream train_metrics_{};
        std::ofstream eval_metrics_{};
    };
}

#endif // GRAFT_TRAINING_REPORTER_HPP
