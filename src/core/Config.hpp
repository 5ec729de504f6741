/**
 * @file Config.hpp
 * @brief Configuration management singleton.
 *
 * Process-wide access to the song and cache settings. Parsing is delegated
 * to ConfigParsers and file I/O to ConfigLoader. Load and save are
 * serialized by a mutex; the song/ types receive copies of the structs and
 * never touch the singleton themselves.
 *
 * @section Dependencies
 * - ConfigData
 * - ConfigLoader
 * - ConfigParsers
 */

#pragma once
#include <filesystem>
#include <mutex>
#include "ConfigData.hpp"
#include "util/Result.hpp"

namespace st {

class Config {
public:
    static Config& instance();

    Result<void> load(const std::filesystem::path& path);
    Result<void> save(const std::filesystem::path& path) const;
    Result<void> loadDefault();

    // Restores built-in defaults, keeping the config path
    void reset();

    std::filesystem::path configPath() const {
        return configPath_;
    }
    bool debug() const {
        return debug_;
    }
    void setDebug(bool v) {
        debug_ = v;
        markDirty();
    }

    const SongConfig& song() const {
        return song_;
    }
    const CacheConfig& cache() const {
        return cache_;
    }

    SongConfig& song() {
        markDirty();
        return song_;
    }
    CacheConfig& cache() {
        markDirty();
        return cache_;
    }

    bool isDirty() const {
        return dirty_;
    }
    void markClean() {
        dirty_ = false;
    }

private:
    friend class ConfigLoader;

    Config() = default;
    void markDirty() {
        dirty_ = true;
    }

    std::filesystem::path configPath_;
    bool dirty_{false};
    bool debug_{false};

    SongConfig song_;
    CacheConfig cache_;

    mutable std::mutex mutex_;
};

#define CONFIG st::Config::instance()

} // namespace st
