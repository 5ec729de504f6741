#include "ConfigLoader.hpp"
#include <fstream>
#include "Config.hpp"
#include "ConfigParsers.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace st {

namespace fs = std::filesystem;

Result<void> ConfigLoader::load(Config& config, const fs::path& path) {
    try {
        auto tbl = toml::parse_file(path.string());

        if (auto gen = tbl["general"].as_table()) {
            config.setDebug((*gen)["debug"].value_or(false));
        }
        Logger::setDebug(config.debug());

        ConfigParsers::parseSong(tbl, config.song());
        ConfigParsers::parseCache(tbl, config.cache());

        config.markClean();
        LOG_INFO("Config loaded from: {}", path.string());
        return Result<void>::ok();
    } catch (const toml::parse_error& err) {
        return Result<void>::err(std::string("Config parse error: ") +
                                 err.what());
    }
}

Result<void> ConfigLoader::loadDefault(Config& config) {
    auto configDir = file::configDir();
    auto defaultPath = configDir / "config.toml";
    config.configPath_ = defaultPath;

    if (fs::exists(defaultPath)) {
        return load(config, defaultPath);
    }

    LOG_WARN("No config file found, using built-in defaults");
    if (!file::ensureDir(configDir)) {
        return Result<void>::err("Failed to create config directory: " +
                                 configDir.string());
    }
    return save(config, defaultPath);
}

Result<void> ConfigLoader::save(const Config& config, const fs::path& path) {
    try {
        auto tbl = ConfigParsers::serialize(
                config.song(), config.cache(), config.debug());
        fs::path tempPath = path;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath);
            if (!file)
                return Result<void>::err("Failed to open temp config file");
            file << tbl;
        }
        fs::rename(tempPath, path);
        LOG_DEBUG("Config saved to: {}", path.string());
        return Result<void>::ok();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save config: {}", e.what());
        return Result<void>::err(std::string("Failed to save config: ") +
                                 e.what());
    }
}

} // namespace st
