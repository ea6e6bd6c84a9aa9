#ifndef GRAFT_COMMON_SAVE_LOAD_HPP
#define GRAFT_COMMON_SAVE_LOAD_HPP
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace Graft::Common::SaveLoad {
    using PropertyTree = boost::property_tree::ptree;

    namespace Detail {
        template <class Numeric>
        Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
            const auto value = tree.get_optional<Numeric>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing numeric field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline bool get_boolean(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<bool>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing boolean field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context)
        {
            const auto value = tree.get_optional<std::string>(key);
            if (!value) {
                std::ostringstream message;
                message << "Missing string field '" << key << "' in " << context;
                throw std::runtime_error(message.str());
            }
            return *value;
        }

        // The JSON writer has no null; absent optionals are stored as "".
        inline void put_optional_string(PropertyTree& tree, const std::string& key, const std::optional<std::string>& value)
        {
            tree.put(key, value.value_or(std::string{}));
        }

        inline std::optional<std::string> get_optional_string(const PropertyTree& tree, const std::string& key)
        {
            auto value = tree.get_optional<std::string>(key);
            if (!value || value->empty()) {
                return std::nullopt;
            }
            return *value;
        }
    }

    inline void write_json_file(const std::filesystem::path& path, const PropertyTree& tree)
    {
        std::ofstream stream(path);
        if (!stream) {
            std::ostringstream message;
            message << "Failed to open '" << path.string() << "' for writing.";
            throw std::runtime_error(message.str());
        }
        boost::property_tree::write_json(stream, tree, true);
        stream.flush();
        if (!stream) {
            std::ostringstream message;
            message << "Failed to write '" << path.string() << "'.";
            throw std::runtime_error(message.str());
        }
    }

    inline PropertyTree read_json_file(const std::filesystem::path& path)
    {
        PropertyTree tree;
        boost::property_tree::read_json(path.string(), tree);
        return tree;
    }

    inline std::string to_json_string(const PropertyTree& tree)
    {
        std::ostringstream stream;
        boost::property_tree::write_json(stream, tree, false);
        return stream.str();
    }

    inline PropertyTree from_json_string(const std::string& text)
    {
        PropertyTree tree;
        std::istringstream stream(text);
        boost::property_tree::read_json(stream, tree);
        return tree;
    }
}

#endif // GRAFT_COMMON_SAVE_LOAD_HPP
