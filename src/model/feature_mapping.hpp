#ifndef GRAFT_MODEL_FEATURE_MAPPING_HPP
#define GRAFT_MODEL_FEATURE_MAPPING_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include "../common/error.hpp"
#include "../common/save_load.hpp"

namespace Graft::Model {
    using PropertyTree = Common::SaveLoad::PropertyTree;
    using FeatureDimensions = std::map<std::string, std::int64_t>;

    // Categorical features of one entity kind (nodes or edges), by name.
    class FeatureMapping {
    public:
        virtual ~FeatureMapping() = default;

        // Number of categories of each feature group.
        [[nodiscard]] virtual FeatureDimensions feature_dimensions() const = 0;

        // Snapshot embedded in checkpoints so the model shape can be rebuilt.
        [[nodiscard]] virtual PropertyTree state() const = 0;
    };

    using FeatureMappingPtr = std::shared_ptr<const FeatureMapping>;

    // Continuous quantities (lengths, angles) quantized into a fixed number of
    // equal-width buckets over [minimum, maximum].
    class QuantizedFeatureMapping final : public FeatureMapping {
    public:
        struct Feature {
            std::int64_t buckets{1};
            double minimum{0.0};
            double maximum{1.0};
        };

        QuantizedFeatureMapping() = default;

        explicit QuantizedFeatureMapping(std::map<std::string, Feature> features)
            : features_(std::move(features)) {
            for (const auto& [name, feature] : features_) {
                validate(name, feature);
            }
        }

        void add(const std::string& name, Feature feature) {
            validate(name, feature);
            features_[name] = feature;
        }

        [[nodiscard]] FeatureDimensions feature_dimensions() const override {
            FeatureDimensions dimensions;
            for (const auto& [name, feature] : features_) {
                dimensions.emplace(name, feature.buckets);
            }
            return dimensions;
        }

        [[nodiscard]] PropertyTree state() const override {
            PropertyTree tree;
            for (const auto& [name, feature] : features_) {
                PropertyTree entry;
                entry.put("buckets", feature.buckets);
                entry.put("minimum", feature.minimum);
                entry.put("maximum", feature.maximum);
                tree.add_child(PropertyTree::path_type(name, '/'), entry);
            }
            return tree;
        }

        [[nodiscard]] static QuantizedFeatureMapping from_state(const PropertyTree& tree) {
            QuantizedFeatureMapping mapping;
            for (const auto& [name, entry] : tree) {
                const std::string context = "feature mapping entry '" + name + "'";
                Feature feature{};
                feature.buckets = Common::SaveLoad::Detail::get_numeric<std::int64_t>(entry, "buckets", context);
                feature.minimum = entry.get<double>("minimum", 0.0);
                feature.maximum = entry.get<double>("maximum", 1.0);
                mapping.add(name, feature);
            }
            return mapping;
        }

        [[nodiscard]] bool empty() const noexcept { return features_.empty(); }

    private:
        static void validate(const std::string& name, const Feature& feature) {
            if (name.empty()) {
                throw ConfigurationError("Feature names must be non-empty.");
            }
            if (feature.buckets <= 0) {
                std::ostringstream message;
                message << "Feature '" << name << "' needs a positive bucket count, got " << feature.buckets << '.';
                throw ConfigurationError(message.str());
            }
            if (!(feature.maximum > feature.minimum)) {
                throw ConfigurationError("Feature '" + name + "' has an empty value range.");
            }
        }

        std::map<std::string, Feature> features_{};
    };

    // Feature dimensions split by the entity kind they describe. Node and edge
    // features use disjoint names.
    struct FeatureLayout {
        FeatureDimensions node{};
        FeatureDimensions edge{};

        [[nodiscard]] FeatureDimensions merged() const {
            FeatureDimensions all = node;
            all.insert(edge.begin(), edge.end());
            return all;
        }
    };

    [[nodiscard]] inline FeatureLayout layout_of(const FeatureMappingPtr& node_mapping, const FeatureMappingPtr& edge_mapping)
    {
        FeatureLayout layout{};
        if (node_mapping) {
            layout.node = node_mapping->feature_dimensions();
        }
        if (edge_mapping) {
            layout.edge = edge_mapping->feature_dimensions();
        }
        for (const auto& [name, dimension] : layout.edge) {
            if (layout.node.contains(name)) {
                throw ConfigurationError("Feature '" + name + "' is declared for both nodes and edges.");
            }
        }
        return layout;
    }
}

#endif // GRAFT_MODEL_FEATURE_MAPPING_HPP
