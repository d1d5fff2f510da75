#include "ConfigLoader.h"
#include "LoggingChannels.h"
#include <cstdlib>
#include <fstream>

namespace ArmySearch {

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_ = std::nullopt;
}

std::vector<std::filesystem::path> ConfigLoader::getSearchPaths()
{
    namespace fs = std::filesystem;
    std::vector<fs::path> paths;

    // 1. Directory set by the caller (highest priority).
    if (explicitConfigDir_.has_value()) {
        paths.push_back(fs::path(explicitConfigDir_.value()));
    }

    // 2. $ARMYSEARCH_CONFIG_DIR, for runs launched by scripts.
    if (const char* envDir = std::getenv(kConfigDirEnvVar); envDir && *envDir) {
        paths.push_back(fs::path(envDir));
    }

    // 3. ./config/ next to the working directory.
    paths.push_back(fs::current_path() / "config");

    // 4. ~/.config/armysearch/ for per-user settings.
    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "armysearch");
    }

    // 5. /etc/armysearch/ for machine-wide defaults.
    paths.push_back(fs::path("/etc/armysearch"));

    return paths;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    namespace fs = std::filesystem;
    const auto isFile = [](const fs::path& path) {
        std::error_code ec;
        return fs::is_regular_file(path, ec);
    };

    for (const auto& dir : getSearchPaths()) {
        // A .local copy shadows the checked-in file in the same directory.
        const fs::path localPath = dir / (filename + ".local");
        if (isFile(localPath)) {
            return localPath;
        }

        const fs::path basePath = dir / filename;
        if (isFile(basePath)) {
            return basePath;
        }
    }

    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::tryLoadJson(const std::filesystem::path& path)
{
    namespace fs = std::filesystem;

    try {
        // nlohmann reports an empty stream as a parse error; name it instead.
        if (fs::file_size(path) == 0) {
            std::string error = "Empty config file: " + path.string();
            LOG_WARN(Config, "ConfigLoader: {}", error);
            return Result<nlohmann::json, std::string>::error(error);
        }

        std::ifstream file(path);
        if (!file.is_open()) {
            std::string error = "Cannot open config file: " + path.string();
            LOG_WARN(Config, "ConfigLoader: {}", error);
            return Result<nlohmann::json, std::string>::error(error);
        }

        return Result<nlohmann::json, std::string>::okay(nlohmann::json::parse(file));
    }
    catch (const nlohmann::json::parse_error& e) {
        std::string error = "Parse error in " + path.string() + ": " + e.what();
        LOG_ERROR(Config, "ConfigLoader: {}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }
    catch (const std::exception& e) {
        std::string error = "Error reading " + path.string() + ": " + e.what();
        LOG_ERROR(Config, "ConfigLoader: {}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }
}

Result<nlohmann::json, std::string> ConfigLoader::loadJson(const std::string& filename)
{
    auto path = findConfigFile(filename);
    if (!path.has_value()) {
        std::string error = "Config file not found: " + filename;
        LOG_DEBUG(Config, "ConfigLoader: {}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }

    LOG_INFO(Config, "ConfigLoader: Loading {} from {}", filename, path->string());
    return tryLoadJson(path.value());
}

} // namespace ArmySearch
