#include "ConfigParsers.hpp"
#include <algorithm>
#include <type_traits>
#include "Logger.hpp"

namespace st {

namespace {
template <typename T>
T get(const toml::table& tbl, std::string_view key, T defaultVal) {
    if (auto node = tbl[key]) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto val = node.value<std::string>())
                return *val;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto val = node.value<bool>())
                return *val;
        } else if constexpr (std::is_integral_v<T>) {
            if (auto val = node.value<i64>())
                return static_cast<T>(*val);
        }
    }
    return defaultVal;
}
} // namespace

void ConfigParsers::parseSong(const toml::table& tbl, SongConfig& cfg) {
    if (auto song = tbl["song"].as_table()) {
        cfg.defaultTrackLength = std::max<i64>(
                get(*song, "default_track_length", i64{1500}), 0);
        cfg.systemPrompt = get(*song, "system_prompt", cfg.systemPrompt);
        cfg.genre = get(*song, "genre", std::string());

        auto strategy = get(*song, "merge_strategy", std::string("identity"));
        if (strategy != "identity" && strategy != "positional") {
            LOG_WARN("Unknown merge_strategy '{}', using identity", strategy);
            strategy = "identity";
        }
        cfg.mergeStrategy = strategy;
    }
}

void ConfigParsers::parseCache(const toml::table& tbl, CacheConfig& cfg) {
    if (auto cache = tbl["cache"].as_table()) {
        cfg.msPerToken = std::clamp(get(*cache, "ms_per_token", 20u), 1u, 1000u);
        cfg.fineElementsPerToken = std::clamp(
                get(*cache, "fine_elements_per_token", 8u), 1u, 64u);
    }
}

toml::table ConfigParsers::serialize(const SongConfig& song,
                                     const CacheConfig& cache,
                                     bool debug) {
    toml::table root;
    root.insert("general", toml::table{{"debug", debug}});
    root.insert("song",
                toml::table{{"default_track_length", song.defaultTrackLength},
                            {"system_prompt", song.systemPrompt},
                            {"genre", song.genre},
                            {"merge_strategy", song.mergeStrategy}});
    root.insert("cache",
                toml::table{{"ms_per_token", (i64)cache.msPerToken},
                            {"fine_elements_per_token",
                             (i64)cache.fineElementsPerToken}});
    return root;
}

} // namespace st
