/**
 * @file LyricsParser.hpp
 * @brief Tagged lyric script to segment descriptors.
 *
 * A script is a sequence of blocks:
 *
 *     #length 12.5
 *     #mood calm
 *     [verse]
 *     first line
 *     second line
 *
 * Each `[Name]` header starts one segment. The `#tag value` lines before a
 * header belong to that header only. A lyric body runs until the next `[`,
 * the next `#` or the end of the script. Header names are word characters
 * only; anything else in brackets is not a header.
 *
 * The `length` tag is coerced to frames: `12.5` is seconds (x50, truncated),
 * `300t` is a raw token count. Other tags keep their trimmed string. A tag
 * that fails to coerce is dropped and reported in ParsedLyrics::errors; the
 * rest of the script still parses.
 */

#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "SongTypes.hpp"
#include "util/Result.hpp"

namespace st::song {

struct SegmentDescriptor {
    std::string name;
    TagMap tags;
    std::string lyrics;
};

struct TagError {
    std::string segmentName;
    std::string tagName;
    std::string rawValue;
    std::string message;
};

struct ParsedLyrics {
    std::vector<SegmentDescriptor> segments;
    std::vector<TagError> errors;
};

class LyricsParser {
public:
    static ParsedLyrics parse(std::string_view script);

    // Coerces one tag value. Only "length" is typed; everything else passes
    // through as a string.
    static Result<TagValue> parseTag(std::string_view name,
                                     std::string_view value);
};

} // namespace st::song
