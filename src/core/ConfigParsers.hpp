/**
 * @file ConfigParsers.hpp
 * @brief TOML parsing and serialization logic.
 *
 * Converts between toml++ tables and the configuration structs in
 * ConfigData.hpp.
 *
 * @section Dependencies
 * - toml++
 * - ConfigData
 */

#pragma once
#include <toml++/toml.h>
#include "ConfigData.hpp"

namespace st {

class ConfigParsers {
public:
    static void parseSong(const toml::table& tbl, SongConfig& cfg);
    static void parseCache(const toml::table& tbl, CacheConfig& cfg);

    static toml::table serialize(const SongConfig& song,
                                 const CacheConfig& cache,
                                 bool debug);
};

} // namespace st
