#ifndef GRAFT_ADAMAX_HPP
#define GRAFT_ADAMAX_HPP
// "Adam: A Method for Stochastic Optimization", section 7.1 (AdaMax) https://arxiv.org/pdf/1412.6980
// libtorch ships no Adamax, this follows torch.optim.Adamax.
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include <torch/torch.h>
#include <torch/optim/optimizer.h>
#include <torch/optim/serialize.h>

namespace Graft::Optimizer::Details {

    struct AdamaxOptions : public torch::optim::OptimizerCloneableOptions<AdamaxOptions> {
        AdamaxOptions(double lr = 2e-3) : lr_(lr) {}

        TORCH_ARG(double, lr) = 2e-3;
        TORCH_ARG(double, beta1) = 0.9;
        TORCH_ARG(double, beta2) = 0.999;
        TORCH_ARG(double, eps) = 1e-8;
        TORCH_ARG(double, weight_decay) = 0.0;

    public:
        void serialize(torch::serialize::InputArchive& archive) override {
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(double, lr);
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(double, beta1);
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(double, beta2);
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(double, eps);
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(double, weight_decay);
        }

        void serialize(torch::serialize::OutputArchive& archive) const override {
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(lr);
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(beta1);
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(beta2);
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(eps);
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(weight_decay);
        }

        double get_lr() const override { return lr(); }
        void set_lr(double value) override { lr(value); }
    };

    struct AdamaxParamState : public torch::optim::OptimizerCloneableParamState<AdamaxParamState> {
        TORCH_ARG(torch::Tensor, exp_avg);
        TORCH_ARG(torch::Tensor, exp_inf);
        TORCH_ARG(int64_t, step) = 0;

    public:
        void serialize(torch::serialize::InputArchive& archive) override {
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(torch::Tensor, exp_avg);
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(torch::Tensor, exp_inf);
            _TORCH_OPTIM_DESERIALIZE_TORCH_ARG(int64_t, step);
        }

        void serialize(torch::serialize::OutputArchive& archive) const override {
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(exp_avg);
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(exp_inf);
            _TORCH_OPTIM_SERIALIZE_TORCH_ARG(step);
        }
    };

    struct AdamaxDescriptor {
        AdamaxOptions options{};
    };

    class Adamax : public torch::optim::Optimizer {
    public:
        using Options = AdamaxOptions;
        using ParamState = AdamaxParamState;

        explicit Adamax(std::vector<torch::Tensor> params, Options options = {})
            : Adamax({torch::optim::OptimizerParamGroup(std::move(params))}, std::move(options)) {}

        explicit Adamax(std::vector<torch::optim::OptimizerParamGroup> param_groups, Options options = {})
            : torch::optim::Optimizer(std::move(param_groups), std::make_unique<Options>(options)) {
            TORCH_CHECK(options.lr() >= 0, "Invalid learning rate: ", options.lr());
            TORCH_CHECK(options.eps() >= 0, "Invalid epsilon value: ", options.eps());
            TORCH_CHECK(options.beta1() >= 0 && options.beta1() < 1, "Invalid beta1: ", options.beta1());
            TORCH_CHECK(options.beta2() >= 0 && options.beta2() < 1, "Invalid beta2: ", options.beta2());
            TORCH_CHECK(options.weight_decay() >= 0, "Invalid weight_decay value: ", options.weight_decay());
        }

        torch::Tensor step(LossClosure closure = nullptr) override {
            torch::NoGradGuard no_grad;
            torch::Tensor loss;
            if (closure != nullptr) {
                torch::AutoGradMode enable_grad(true);
                loss = closure();
            }

            for (auto& group : this->param_groups_) {
                const auto& options = static_cast<const Options&>(group.options());

                for (auto& param : group.params()) {
                    auto grad = param.grad();
                    if (!grad.defined()) {
                        continue;
                    }
                    TORCH_CHECK(!grad.is_sparse(), "Adamax does not support sparse gradients.");

                    auto state_it = this->state_.find(param.unsafeGetTensorImpl());
                    if (state_it == this->state_.end()) {
                        auto state = std::make_unique<ParamState>();
                        state->exp_avg(torch::zeros_like(param, torch::MemoryFormat::Preserve));
                        state->exp_inf(torch::zeros_like(param, torch::MemoryFormat::Preserve));
                        state_it = this->state_.insert({param.unsafeGetTensorImpl(), std::move(state)}).first;
                    }

                    auto& state = static_cast<ParamState&>(*state_it->second);
                    auto& exp_avg = state.exp_avg();
                    auto& exp_inf = state.exp_inf();
                    state.step(state.step() + 1);

                    if (options.weight_decay() != 0.0) {
                        grad = grad.add(param, options.weight_decay());
                    }

                    exp_avg.mul_(options.beta1()).add_(grad, 1.0 - options.beta1());
                    exp_inf.copy_(torch::maximum(exp_inf.mul(options.beta2()), grad.abs().add_(options.eps())));

                    const double bias_correction = 1.0 - std::pow(options.beta1(), static_cast<double>(state.step()));
                    param.addcdiv_(exp_avg, exp_inf, -options.lr() / bias_correction);
                }
            }

            return loss;
        }

        void save(torch::serialize::OutputArchive& archive) const override {
            torch::optim::serialize<ParamState, Options>(archive, *this);
        }

        void load(torch::serialize::InputArchive& archive) override {
            torch::optim::serialize<ParamState, Options>(archive, *this);
        }
    };

}

#endif // GRAFT_ADAMAX_HPP
