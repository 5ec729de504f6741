/**
 * @file ConfigData.hpp
 * @brief Configuration data structures.
 *
 * Plain structs holding configuration values. Kept apart from the parsing
 * and loading logic so song/ headers can take them by value without pulling
 * in toml++.
 */

#pragma once
#include <string>
#include "util/Types.hpp"

namespace st {

// Song-level generation parameters ([song] table)
struct SongConfig {
    i64 defaultTrackLength{1500}; // frames, 30 s at 50 fps
    std::string systemPrompt{
            "Generate music from the given lyrics segment by segment."};
    std::string genre;
    std::string mergeStrategy{"identity"}; // identity, positional
};

// Token timing of the generator ([cache] table)
struct CacheConfig {
    u32 msPerToken{20};
    u32 fineElementsPerToken{8}; // refine-stage elements per base token
};

} // namespace st
