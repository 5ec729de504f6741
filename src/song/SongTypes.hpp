#pragma once
// SongTypes.hpp - Token, stage/track and tag types shared by the song model

#include <array>
#include <map>
#include <string>
#include <variant>
#include <vector>
#include "util/Types.hpp"

namespace st::song {

using Token = i64;
using TokenSeq = std::vector<Token>;

// Generation pass. Base tokens run at 50 per second; each Refine step
// carries several finer codec elements per Base token.
enum class Stage : usize { Base = 0, Refine = 1 };

// Parallel channel within a stage
enum class Track : usize { Vocal = 0, Instrumental = 1 };

inline constexpr usize kNrStages = 2;
inline constexpr usize kNrTracks = 2;

inline constexpr i64 kFramesPerSecond = 50;
inline constexpr i64 kMsPerToken = 20;

constexpr usize stageIndex(Stage s) {
    return static_cast<usize>(s);
}
constexpr usize trackIndex(Track t) {
    return static_cast<usize>(t);
}

constexpr std::array<Stage, kNrStages> allStages() {
    return {Stage::Base, Stage::Refine};
}
constexpr std::array<Track, kNrTracks> allTracks() {
    return {Track::Vocal, Track::Instrumental};
}

const char* stageName(Stage s);
const char* trackName(Track t);

// Fixed stage x track grid. Shape is a compile-time constant, so indexing
// goes through the enums and cannot run out of bounds.
template <typename T>
class TrackGrid {
public:
    using Row = std::array<T, kNrTracks>;

    T& at(Stage s, Track t) {
        return cells_[stageIndex(s)][trackIndex(t)];
    }
    const T& at(Stage s, Track t) const {
        return cells_[stageIndex(s)][trackIndex(t)];
    }

    Row& stage(Stage s) {
        return cells_[stageIndex(s)];
    }
    const Row& stage(Stage s) const {
        return cells_[stageIndex(s)];
    }

    bool operator==(const TrackGrid&) const = default;

private:
    std::array<Row, kNrStages> cells_{};
};

using TokenGrid = TrackGrid<TokenSeq>;
using StageTracks = TokenGrid::Row;

// Tag values are integers once coerced (length) or the raw trimmed string
using TagValue = std::variant<i64, std::string>;
using TagMap = std::map<std::string, TagValue>;

} // namespace st::song
