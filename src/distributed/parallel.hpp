#ifndef GRAFT_DISTRIBUTED_PARALLEL_HPP
#define GRAFT_DISTRIBUTED_PARALLEL_HPP

#include <cstdint>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>
#include <torch/csrc/distributed/c10d/Backend.hpp>
#include <torch/csrc/distributed/c10d/ProcessGroupGloo.hpp>
#include <torch/csrc/distributed/c10d/TCPStore.hpp>

#include "../common/error.hpp"
#include "context.hpp"

namespace Graft::Distributed {
    using BackendPtr = c10::intrusive_ptr<c10d::Backend>;

    // Name under which the wrapper registers the wrapped model. Every parameter
    // key of a wrapped model therefore starts with "module.".
    inline constexpr const char* kWrappedModuleName = "module";

    // Joins the Gloo process group of `context`. Rank 0 hosts the TCP store the
    // others rendezvous on; blocks until every participant has connected.
    [[nodiscard]] inline BackendPtr connect(const DistributedContext& context)
    {
        validate(context);
        try {
            c10d::TCPStoreOptions store_options{};
            store_options.port = context.master_port;
            store_options.isServer = context.global_rank == 0;
            store_options.numWorkers = static_cast<std::size_t>(context.world_size);
            auto store = c10::make_intrusive<c10d::TCPStore>(context.master_address, store_options);

            auto options = c10d::ProcessGroupGloo::Options::create();
            options->devices.push_back(c10d::ProcessGroupGloo::createDeviceForHostname(context.master_address));
            return c10::make_intrusive<c10d::ProcessGroupGloo>(store, context.global_rank, context.world_size, options);
        } catch (const std::exception& error) {
            std::ostringstream message;
            message << "Rank " << context.global_rank << " failed to join the process group at "
                    << context.master_address << ':' << context.master_port << ": " << error.what();
            throw DistributedCoordinationFailure(message.str());
        }
    }

    // Replicates a model over the participants of a process group: parameters
    // start from rank 0's values and gradients are averaged after every backward
    // pass. The wrapped model lives on a single device.
    class DistributedParallelImpl : public torch::nn::Module {
    public:
        DistributedParallelImpl(std::shared_ptr<torch::nn::Module> module, BackendPtr backend)
            : module_(register_module(kWrappedModuleName, std::move(module))),
              backend_(std::move(backend)) {
            if (!backend_) {
                throw std::invalid_argument("DistributedParallel requires a connected process group.");
            }
            broadcast_parameters();
        }

        [[nodiscard]] const std::shared_ptr<torch::nn::Module>& module() const noexcept { return module_; }

        [[nodiscard]] int world_size() const { return backend_->getSize(); }

        [[nodiscard]] int rank() const { return backend_->getRank(); }

        // Copies rank 0's parameters and buffers to every participant.
        void broadcast_parameters() {
            torch::NoGradGuard no_grad;
            std::vector<torch::Tensor> tensors;
            for (const auto& parameter : module_->parameters()) {
                tensors.push_back(parameter.detach());
            }
            for (const auto& buffer : module_->buffers()) {
                tensors.push_back(buffer.detach());
            }
            for (auto& tensor : tensors) {
                std::vector<torch::Tensor> single{tensor};
                wait(backend_->broadcast(single), "broadcast");
            }
        }

        // Averages the gradients of all participants in one flat all-reduce.
        // A parameter that received no gradient on this rank contributes zeros,
        // so all ranks always reduce the same layout even when the dynamic graph
        // leaves some heads unused.
        void synchronize_gradients() {
            torch::NoGradGuard no_grad;
            std::vector<torch::Tensor> gradients;
            for (auto& parameter : module_->parameters()) {
                if (!parameter.requires_grad()) {
                    continue;
                }
                if (!parameter.grad().defined()) {
                    parameter.mutable_grad() = torch::zeros_like(parameter);
                }
                gradients.push_back(parameter.grad());
            }
            if (gradients.empty()) {
                return;
            }

            std::vector<torch::Tensor> flat_views;
            flat_views.reserve(gradients.size());
            for (const auto& gradient : gradients) {
                flat_views.push_back(gradient.reshape({-1}));
            }
            std::vector<torch::Tensor> buffer{torch::cat(flat_views)};
            wait(backend_->allreduce(buffer), "allreduce");
            buffer.front().div_(static_cast<double>(world_size()));

            std::int64_t offset = 0;
            for (auto& gradient : gradients) {
                const auto count = gradient.numel();
                gradient.copy_(buffer.front().narrow(0, offset, count).view_as(gradient));
                offset += count;
            }
        }

    private:
        void wait(const c10::intrusive_ptr<c10d::Work>& work, const char* operation) const {
            try {
                work->wait();
            } catch (const std::exception& error) {
                std::ostringstream message;
                message << "Collective " << operation << " failed on rank " << backend_->getRank() << ": " << error.what();
                throw DistributedCoordinationFailure(message.str());
            }
        }

        std::shared_ptr<torch::nn::Module> module_;
        BackendPtr backend_;
    };

    TORCH_MODULE(DistributedParallel);
}

#endif // GRAFT_DISTRIBUTED_PARALLEL_HPP
