#ifndef GRAFT_OPTIMIZER_REGISTRY_HPP
#define GRAFT_OPTIMIZER_REGISTRY_HPP


#include <memory>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "details/adam.hpp"
#include "details/adamax.hpp"
#include "details/rmsprop.hpp"
#include "details/sgd.hpp"

namespace Graft::Optimizer::Details {
    inline std::unique_ptr<torch::optim::Optimizer> build_optimizer(std::vector<torch::Tensor> parameters, const SGDDescriptor& descriptor) {
        return std::make_unique<torch::optim::SGD>(std::move(parameters), to_torch_options(descriptor.options));
    }

    inline std::unique_ptr<torch::optim::Optimizer> build_optimizer(std::vector<torch::Tensor> parameters, const AdamDescriptor& descriptor) {
        return std::make_unique<torch::optim::Adam>(std::move(parameters), to_torch_options(descriptor.options));
    }

    inline std::unique_ptr<torch::optim::Optimizer> build_optimizer(std::vector<torch::Tensor> parameters, const AdamaxDescriptor& descriptor) {
        return std::make_unique<Adamax>(std::move(parameters), descriptor.options);
    }

    inline std::unique_ptr<torch::optim::Optimizer> build_optimizer(std::vector<torch::Tensor> parameters, const RMSpropDescriptor& descriptor) {
        return std::make_unique<torch::optim::RMSprop>(std::move(parameters), to_torch_options(descriptor.options));
    }
}

#endif // GRAFT_OPTIMIZER_REGISTRY_HPP
