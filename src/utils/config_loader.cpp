#include "utils/config_loader.h"
#include "utils/logger.h"

#include <fstream>
#include <yaml-cpp/yaml.h>

namespace catalog {
namespace utils {

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Scalars: bool, then integer, then double, else string
nlohmann::json scalarToJson(const YAML::Node& n) {
    bool b = false;
    if (YAML::convert<bool>::decode(n, b)) return b;
    long long i = 0;
    if (YAML::convert<long long>::decode(n, i)) return i;
    double d = 0.0;
    if (YAML::convert<double>::decode(n, d)) return d;
    return n.Scalar();
}

} // namespace

nlohmann::json ConfigLoader::yamlToJson(const YAML::Node& n) {
    if (!n || n.IsNull()) return nullptr;
    if (n.IsScalar()) return scalarToJson(n);
    if (n.IsSequence()) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& it : n) arr.push_back(yamlToJson(it));
        return arr;
    }
    if (n.IsMap()) {
        nlohmann::json obj = nlohmann::json::object();
        for (auto it = n.begin(); it != n.end(); ++it) {
            obj[it->first.as<std::string>()] = yamlToJson(it->second);
        }
        return obj;
    }
    return nullptr;
}

std::optional<nlohmann::json> ConfigLoader::loadFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) return std::nullopt;

    if (endsWith(path, ".yaml") || endsWith(path, ".yml")) {
        try {
            return yamlToJson(YAML::Load(f));
        } catch (const YAML::Exception& e) {
            CATALOG_WARN("Failed to parse YAML config {}: {}", path, e.what());
            return std::nullopt;
        }
    }

    try {
        nlohmann::json j;
        f >> j;
        return j;
    } catch (const nlohmann::json::exception& e) {
        CATALOG_WARN("Failed to parse JSON config {}: {}", path, e.what());
        return std::nullopt;
    }
}

std::optional<std::pair<std::string, nlohmann::json>> ConfigLoader::loadFirst(
    const std::vector<std::string>& paths
) {
    for (const auto& p : paths) {
        auto cfg = loadFile(p);
        if (cfg) return std::make_pair(p, std::move(*cfg));
    }
    return std::nullopt;
}

const std::vector<std::string>& ConfigLoader::defaultSearchPaths() {
    static const std::vector<std::string> paths = {
        "./config.yaml", "./config.yml", "./config.json",
        "./config/config.yaml", "./config/config.yml", "./config/config.json"
    };
    return paths;
}

} // namespace utils
} // namespace catalog
