/**
 * @file SegmentMerge.hpp
 * @brief Carries cached tokens from an old segment list into a re-parsed one.
 *
 * Positional merging copies old[i] into new[i] for every shared index. It is
 * exact when the edit only touched lyrics or tags, but inserting, removing or
 * reordering a section shifts every following segment onto the wrong tokens.
 *
 * Identity merging matches segments instead:
 *  1. by `#id` tag, when that id appears exactly once in each list;
 *  2. by a longest-common-subsequence diff of section names;
 *  3. by position, when neither side of index i matched anything else
 *     (an in-place rename), whatever the list lengths.
 * A segment whose name still fits an unmatched old segment after step 2 is
 * reported as Ambiguous and starts empty.
 */

#pragma once
#include <optional>
#include <string_view>
#include <vector>
#include "SongSegment.hpp"

namespace st::song {

enum class MergeStrategy { Positional, Identity };

enum class MatchKind {
    Id,         // same #id tag
    Name,       // paired by the section name diff
    Positional, // same index
    Ambiguous,  // several candidates, not merged
    None        // new segment, nothing to adopt
};

struct MergeEntry {
    usize newIndex{0};
    std::optional<usize> oldIndex;
    MatchKind kind{MatchKind::None};
    bool contentChanged{false};
};

struct MergeReport {
    MergeStrategy strategy{MergeStrategy::Identity};
    std::vector<MergeEntry> entries; // one per new segment, in order

    usize merged() const;
    usize ambiguous() const;
};

std::optional<MergeStrategy> mergeStrategyFromString(std::string_view name);
const char* mergeStrategyName(MergeStrategy strategy);
const char* matchKindName(MatchKind kind);

// Copies token buffers from previous into next according to strategy.
// Only token buffers move; next keeps its own name, tags and lyrics.
MergeReport mergeForward(const std::vector<SongSegment>& previous,
                         std::vector<SongSegment>& next,
                         MergeStrategy strategy);

} // namespace st::song
