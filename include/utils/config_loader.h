#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace YAML { class Node; }

namespace catalog {
namespace utils {

/**
 * @brief Reads server configuration from YAML or JSON files.
 *
 * YAML documents are converted to nlohmann::json so callers only deal with
 * one representation. Format is chosen by extension (.yaml/.yml, else JSON).
 */
class ConfigLoader {
public:
    // Returns std::nullopt if the file is missing or unparsable
    static std::optional<nlohmann::json> loadFile(const std::string& path);

    // First readable file from `paths`, together with the path it came from
    static std::optional<std::pair<std::string, nlohmann::json>> loadFirst(
        const std::vector<std::string>& paths);

    static const std::vector<std::string>& defaultSearchPaths();

    static nlohmann::json yamlToJson(const YAML::Node& node);
};

} // namespace utils
} // namespace catalog
