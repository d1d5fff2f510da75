#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ArmySearch {

/**
 * @brief Finds and parses the JSON files that configure a search.
 *
 * Directories are tried in order and the first hit wins:
 * 1. the directory given to setConfigDir()
 * 2. $ARMYSEARCH_CONFIG_DIR
 * 3. ./config/
 * 4. ~/.config/armysearch/
 * 5. /etc/armysearch/
 *
 * Within a directory "<name>.local" shadows "<name>" as a whole file. Values the
 * file omits keep the defaults of T, so a partial file is a valid config.
 */
class ConfigLoader {
public:
    static constexpr const char* kConfigDirEnvVar = "ARMYSEARCH_CONFIG_DIR";

    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    static std::optional<std::string> explicitConfigDir_;
    static Result<nlohmann::json, std::string> loadJson(const std::string& filename);
    static Result<nlohmann::json, std::string> tryLoadJson(const std::filesystem::path& path);
};

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    auto jsonResult = loadJson(filename);
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }

    try {
        T config;
        from_json(jsonResult.value(), config);
        return Result<T, std::string>::okay(config);
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + filename + ": " + e.what());
    }
}

} // namespace ArmySearch
