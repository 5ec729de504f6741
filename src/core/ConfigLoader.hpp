/**
 * @file ConfigLoader.hpp
 * @brief Configuration file I/O.
 *
 * Reads and writes the TOML configuration file. Writes go to a temporary
 * file first and are renamed into place.
 *
 * @section Dependencies
 * - Config
 * - std::filesystem
 */

#pragma once
#include <filesystem>
#include "util/Result.hpp"

namespace st {

class Config;

class ConfigLoader {
public:
    static Result<void> load(Config& config, const std::filesystem::path& path);
    static Result<void> save(const Config& config,
                             const std::filesystem::path& path);
    static Result<void> loadDefault(Config& config);
};

} // namespace st
