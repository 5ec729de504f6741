#include "Config.hpp"
#include "ConfigLoader.hpp"

namespace st {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Result<void> Config::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    configPath_ = path;
    return ConfigLoader::load(*this, path);
}

Result<void> Config::loadDefault() {
    std::lock_guard lock(mutex_);
    return ConfigLoader::loadDefault(*this);
}

Result<void> Config::save(const std::filesystem::path& path) const {
    std::lock_guard lock(mutex_);
    return ConfigLoader::save(*this, path);
}

void Config::reset() {
    std::lock_guard lock(mutex_);
    song_ = SongConfig{};
    cache_ = CacheConfig{};
    debug_ = false;
    markDirty();
}

} // namespace st
