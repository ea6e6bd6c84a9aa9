#ifndef GRAFT_CHECKPOINT_HPP
#define GRAFT_CHECKPOINT_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "../common/save_load.hpp"
#include "../training/state.hpp"

namespace Graft::Checkpoint {
    using PropertyTree = Common::SaveLoad::PropertyTree;
    using NamedTensors = std::unordered_map<std::string, torch::Tensor>;

    // Key prefix a distributed-parallel wrapper adds to every parameter of the
    // model it wraps ("module" plus the path separator).
    inline constexpr std::string_view kDistributedPrefix = "module.";
    static_assert(kDistributedPrefix.size() == 7, "Checkpoints written by wrapped models use a 7 character key prefix.");

    namespace Keys {
        inline constexpr const char* kModel = "model";
        inline constexpr const char* kBuffers = "buffers";
        inline constexpr const char* kEpoch = "epoch";
        inline constexpr const char* kGlobalStep = "global_step";
        inline constexpr const char* kOptimizer = "optimizer";
        inline constexpr const char* kMetadata = "metadata";
    }

    // Maps a key saved from a wrapped model onto the unwrapped model's naming.
    // Keys without the prefix are returned unchanged.
    [[nodiscard]] inline std::string normalize_parameter_key(std::string_view key)
    {
        if (key.substr(0, kDistributedPrefix.size()) == kDistributedPrefix) {
            key.remove_prefix(kDistributedPrefix.size());
        }
        return std::string(key);
    }

    // Content of a checkpoint file, always materialized on the CPU.
    struct Record {
        NamedTensors parameters{};
        NamedTensors buffers{};
        Training::TrainingState state{};
        bool has_optimizer_state{false};
        PropertyTree metadata{};
    };

    namespace Detail {
        inline c10::Dict<std::string, torch::Tensor> to_dict(const torch::OrderedDict<std::string, torch::Tensor>& tensors)
        {
            c10::Dict<std::string, torch::Tensor> dict;
            for (const auto& item : tensors) {
                if (item.value().defined()) {
                    dict.insert(item.key(), item.value().detach().to(torch::kCPU));
                }
            }
            return dict;
        }

        inline NamedTensors from_ivalue(const c10::IValue& value, const std::string& context)
        {
            if (!value.isGenericDict()) {
                throw CheckpointLoadError("Checkpoint entry '" + context + "' is not a tensor dictionary.");
            }
            NamedTensors tensors;
            for (const auto& entry : value.toGenericDict()) {
                if (!entry.key().isString() || !entry.value().isTensor()) {
                    throw CheckpointLoadError("Checkpoint entry '" + context + "' holds a non tensor value.");
                }
                tensors.emplace(entry.key().toStringRef(), entry.value().toTensor());
            }
            return tensors;
        }

        inline std::string format_shape(const torch::Tensor& tensor)
        {
            std::ostringstream stream;
            stream << tensor.sizes();
            return stream.str();
        }

        inline NamedTensors normalize(const NamedTensors& stored)
        {
            NamedTensors normalized;
            normalized.reserve(stored.size());
            for (const auto& [key, tensor] : stored) {
                normalized.emplace(normalize_parameter_key(key), tensor);
            }
            return normalized;
        }

        // Both sides must name the same tensors with the same shapes. Every
        // problem is collected so one error describes the whole incompatibility.
        inline void check_strict(const torch::OrderedDict<std::string, torch::Tensor>& targets,
                                 const NamedTensors& stored,
                                 const std::string& kind,
                                 std::vector<std::string>& problems)
        {
            std::unordered_set<std::string> expected;
            for (const auto& item : targets) {
                expected.insert(item.key());
                const auto found = stored.find(item.key());
                if (found == stored.end()) {
                    problems.push_back("missing " + kind + " '" + item.key() + "'");
                    continue;
                }
                if (found->second.sizes() != item.value().sizes()) {
                    problems.push_back(kind + " '" + item.key() + "' expects shape " + format_shape(item.value())
                                       + " but checkpoint has " + format_shape(found->second));
                }
            }
            for (const auto& [key, tensor] : stored) {
                if (!expected.contains(key)) {
                    problems.push_back("unexpected " + kind + " '" + key + "'");
                }
            }
        }

        inline void copy_into(const torch::OrderedDict<std::string, torch::Tensor>& targets, const NamedTensors& stored)
        {
            torch::NoGradGuard no_grad;
            for (const auto& item : targets) {
                auto target = item.value();
                const auto& source = stored.at(item.key());
                target.copy_(source.to(target.device(), target.scalar_type()));
            }
        }
    }

    // Writes `model` and the run counters to `path`. The parameter keys are the
    // model's own names: a wrapped model produces prefixed keys.
    inline void save(const std::filesystem::path& path,
                     const torch::nn::Module& model,
                     const torch::optim::Optimizer* optimizer,
                     const Training::TrainingState& state,
                     const PropertyTree& metadata)
    {
        if (path.empty()) {
            throw std::invalid_argument("Checkpoint::save requires a non-empty path.");
        }

        torch::serialize::OutputArchive archive;
        archive.write(Keys::kModel, c10::IValue(Detail::to_dict(model.named_parameters(/*recurse=*/true))));
        archive.write(Keys::kBuffers, c10::IValue(Detail::to_dict(model.named_buffers(/*recurse=*/true))));
        archive.write(Keys::kEpoch, c10::IValue(state.epoch));
        archive.write(Keys::kGlobalStep, c10::IValue(state.global_step));
        archive.write(Keys::kMetadata, c10::IValue(Common::SaveLoad::to_json_string(metadata)));
        if (optimizer != nullptr) {
            torch::serialize::OutputArchive optimizer_archive;
            optimizer->save(optimizer_archive);
            archive.write(Keys::kOptimizer, optimizer_archive);
        }

        // Write next to the target and rename, so a crash never leaves a
        // truncated file under the final name.
        auto staging = path;
        staging += ".partial";
        try {
            archive.save_to(staging.string());
            std::filesystem::rename(staging, path);
        } catch (const std::exception& error) {
            throw std::runtime_error("Failed to write checkpoint '" + path.string() + "': " + error.what());
        }
    }

    [[nodiscard]] inline Record load(const std::filesystem::path& path)
    {
        if (!std::filesystem::exists(path)) {
            throw CheckpointLoadError("Checkpoint not found at '" + path.string() + "'.");
        }

        torch::serialize::InputArchive archive;
        Record record{};
        try {
            archive.load_from(path.string(), torch::Device(torch::kCPU));

            c10::IValue value;
            archive.read(Keys::kModel, value);
            record.parameters = Detail::from_ivalue(value, Keys::kModel);
            if (archive.try_read(Keys::kBuffers, value)) {
                record.buffers = Detail::from_ivalue(value, Keys::kBuffers);
            }

            archive.read(Keys::kEpoch, value);
            record.state.epoch = value.toInt();
            archive.read(Keys::kGlobalStep, value);
            record.state.global_step = value.toInt();

            if (archive.try_read(Keys::kMetadata, value) && value.isString()) {
                record.metadata = Common::SaveLoad::from_json_string(value.toStringRef());
            }

            torch::serialize::InputArchive optimizer_archive;
            record.has_optimizer_state = archive.try_read(Keys::kOptimizer, optimizer_archive);
        } catch (const CheckpointLoadError&) {
            throw;
        } catch (const std::exception& error) {
            throw CheckpointLoadError("Failed to read checkpoint '" + path.string() + "': " + error.what());
        }
        return record;
    }

    // Loads parameters and buffers of `record` into an unwrapped `model`.
    // Throws CheckpointLoadError, leaving the model untouched, when names or
    // shapes disagree with the model.
    inline void apply(torch::nn::Module& model, const Record& record)
    {
        const auto parameters = model.named_parameters(/*recurse=*/true);
        const auto buffers = model.named_buffers(/*recurse=*/true);
        const auto stored_parameters = Detail::normalize(record.parameters);
        const auto stored_buffers = Detail::normalize(record.buffers);

        std::vector<std::string> problems;
        Detail::check_strict(parameters, stored_parameters, "parameter", problems);
        Detail::check_strict(buffers, stored_buffers, "buffer", problems);
        if (!problems.empty()) {
            std::ostringstream message;
            message << "Checkpoint is incompatible with the model (" << problems.size() << " problem"
                    << (problems.size() == 1 ? "" : "s") << "):";
            for (const auto& problem : problems) {
                message << "\n  " << problem;
            }
            throw CheckpointLoadError(message.str());
        }

        Detail::copy_into(parameters, stored_parameters);
        Detail::copy_into(buffers, stored_buffers);
    }

    // Restores the optimizer state stored in `path` onto `device`. Returns false
    // when the checkpoint carries none.
    inline bool restore_optimizer(const std::filesystem::path& path, torch::optim::Optimizer& optimizer, const torch::Device& device)
    {
        try {
            torch::serialize::InputArchive archive;
            archive.load_from(path.string(), device);
            torch::serialize::InputArchive optimizer_archive;
            if (!archive.try_read(Keys::kOptimizer, optimizer_archive)) {
                return false;
            }
            optimizer.load(optimizer_archive);
        } catch (const std::exception& error) {
            throw CheckpointLoadError("Failed to restore optimizer state from '" + path.string() + "': " + error.what());
        }
        return true;
    }
}

#endif // GRAFT_CHECKPOINT_HPP
