#ifndef GRAFT_OPTIMIZER_HPP
#define GRAFT_OPTIMIZER_HPP
#include <array>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "registry.hpp"


namespace Graft::Optimizer {
    using SGDOptions = Details::SGDOptions;
    using SGDDescriptor = Details::SGDDescriptor;

    using AdamOptions = Details::AdamOptions;
    using AdamDescriptor = Details::AdamDescriptor;

    using AdamaxOptions = Details::AdamaxOptions;
    using AdamaxDescriptor = Details::AdamaxDescriptor;

    using RMSpropOptions = Details::RMSpropOptions;
    using RMSpropDescriptor = Details::RMSpropDescriptor;

    using Descriptor = std::variant<SGDDescriptor,
                                    AdamDescriptor,
                                    AdamaxDescriptor,
                                    RMSpropDescriptor>;

    // The closed set of optimizers a run may name on the command line.
    enum class Kind {
        SGD,
        Adam,
        Adamax,
        RMSprop
    };

    inline constexpr std::array<std::pair<std::string_view, Kind>, 4> kKindNames{{
        {"sgd", Kind::SGD},
        {"adam", Kind::Adam},
        {"adamax", Kind::Adamax},
        {"rms", Kind::RMSprop},
    }};

    [[nodiscard]] inline std::string_view to_string(Kind kind) noexcept {
        for (const auto& [name, candidate] : kKindNames) {
            if (candidate == kind) {
                return name;
            }
        }
        return "unknown";
    }

    [[nodiscard]] inline Kind parse_kind(std::string_view identifier) {
        for (const auto& [name, kind] : kKindNames) {
            if (name == identifier) {
                return kind;
            }
        }
        std::ostringstream message;
        message << "Unknown optimizer '" << identifier << "'. Expected one of:";
        for (const auto& entry : kKindNames) {
            message << ' ' << entry.first;
        }
        throw ConfigurationError(message.str());
    }


    [[nodiscard]] inline constexpr auto SGD(const SGDOptions& options = {}) noexcept -> SGDDescriptor {
        return SGDDescriptor{.options = options};
    }

    [[nodiscard]] constexpr auto Adam(const AdamOptions& options = {}) noexcept -> AdamDescriptor {
        return AdamDescriptor{.options = options};
    }

    [[nodiscard]] inline auto Adamax(const AdamaxOptions& options = {}) -> AdamaxDescriptor {
        return AdamaxDescriptor{.options = options};
    }

    [[nodiscard]] constexpr auto RMSprop(const RMSpropOptions& options = {}) noexcept -> RMSpropDescriptor {
        return RMSpropDescriptor{.options = options};
    }

    // Default hyperparameters of `kind` with the learning rate replaced.
    [[nodiscard]] inline Descriptor make_descriptor(Kind kind, double learning_rate) {
        switch (kind) {
            case Kind::SGD: return SGD({.learning_rate = learning_rate});
            case Kind::Adam: return Adam({.learning_rate = learning_rate});
            case Kind::Adamax: return Adamax(AdamaxOptions(learning_rate));
            case Kind::RMSprop: return RMSprop({.learning_rate = learning_rate});
        }
        throw std::invalid_argument("Unhandled optimizer kind.");
    }

    [[nodiscard]] inline std::unique_ptr<torch::optim::Optimizer> build(std::vector<torch::Tensor> parameters, const Descriptor& descriptor) {
        return std::visit([&](const auto& concrete) {
            return Details::build_optimizer(std::move(parameters), concrete);
        }, descriptor);
    }
}

#endif //GRAFT_OPTIMIZER_HPP
