/**
 * @file GenerationCache.hpp
 * @brief Flat generator buffers plus the segment boundaries inside them.
 *
 * The cache is built from a Song, handed to the generator, optionally
 * rewound, and folded back into the Song. It owns copies of the token data;
 * it refers to the Song's segments only by position.
 *
 * Boundary offsets are always in base-stage tokens (20 ms each at the
 * reference rate). A refine-stage buffer holds fineElementsPerToken
 * elements per base token, so a boundary [start, end) covers
 * [start * k, end * k) there.
 *
 * None of the operations fail on short or missing data. Rewinding past the
 * start empties the table, and transfers skip or clamp slices that the
 * buffers cannot cover. The reports returned alongside make those cases
 * visible.
 *
 * @section Dependencies
 * - Song
 * - Qt Core (QJsonObject snapshots)
 */

#pragma once
#include <QJsonObject>
#include <string>
#include <vector>
#include "Song.hpp"
#include "core/ConfigData.hpp"
#include "util/Result.hpp"

namespace st::song {

struct BoundaryRecord {
    std::string name;
    usize start{0};
    usize end{0};

    usize length() const {
        return end > start ? end - start : 0;
    }
    bool operator==(const BoundaryRecord&) const = default;
};

struct RewindReport {
    usize requestedTokens{0};
    usize removedTokens{0};
    usize droppedSegments{0};
    bool clamped{false}; // asked for more than the table held
};

struct TransferIssue {
    enum class Kind {
        Skipped,  // buffer empty or slice starts past its end
        Clamped,  // buffer shorter than the slice end
        NoSegment // boundary index beyond the song's segments
    };

    Kind kind{Kind::Skipped};
    usize boundaryIndex{0};
    Stage stage{Stage::Base};
    Track track{Track::Vocal};
    usize wantedEnd{0}; // in the stage's own elements
    usize available{0};
};

struct TransferReport {
    usize slicesWritten{0};
    std::vector<TransferIssue> issues;

    usize count(TransferIssue::Kind kind) const;
    bool degraded() const {
        return !issues.empty();
    }
};

class GenerationCache {
public:
    GenerationCache();
    // Zero timing values are raised to 1
    explicit GenerationCache(const CacheConfig& config);

    static GenerationCache createFrom(const Song& song,
                                      const CacheConfig& config = CacheConfig{});

    void addTracks(Stage stage, StageTracks tracks);
    void addSegment(std::string name, usize start, usize end);

    // Moves the end of the last boundary, e.g. once the generator has
    // refilled a rewound segment. No-op on an empty table.
    void setLastSegmentEnd(usize end);

    const std::vector<BoundaryRecord>& segments() const {
        return segments_;
    }

    // The generator extends these in place
    TokenSeq& track(Stage stage, Track track) {
        return tracks_.at(stage, track);
    }
    const TokenSeq& track(Stage stage, Track track) const {
        return tracks_.at(stage, track);
    }

    // Sum of boundary lengths, base tokens
    usize totalLength() const;

    // Where generation resumes: end of the last boundary, 0 when empty
    usize resumeToken() const;

    usize elementsPerToken(Stage stage) const;

    // Drops durationMs worth of base tokens from the tail of the boundary
    // table. Token buffers are left as they are.
    RewindReport rewind(i64 durationMs);

    // Slices the flat buffers back into song's segments by boundary index
    TransferReport transferToSong(Song& song) const;

    // {"tracks": [[[...], ...] per stage], "segments": [[name, start, end], ...]}
    QJsonObject save() const;

    // Installs tracks and segments from data. A missing key keeps the
    // current value; malformed data is rejected without touching anything.
    Result<void> load(const QJsonObject& data);

private:
    CacheConfig config_;
    TokenGrid tracks_;
    std::vector<BoundaryRecord> segments_;
};

} // namespace st::song
