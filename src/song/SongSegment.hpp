#pragma once
// SongSegment.hpp - One lyric section with its cached generator tokens

#include <optional>
#include <string>
#include <utility>
#include "LyricsParser.hpp"
#include "SongTypes.hpp"
#include "util/Result.hpp"

namespace st::song {

class SongSegment {
public:
    SongSegment() = default;

    static SongSegment create(std::string name, TagMap tags, std::string lyrics);
    static SongSegment create(SegmentDescriptor descriptor);

    // "[name]\nlyrics\n\n"
    std::string toString() const;

    const std::string& name() const {
        return name_;
    }
    const TagMap& tags() const {
        return tags_;
    }
    const std::string& lyrics() const {
        return lyrics_;
    }

    const TagValue* tag(const std::string& name) const;

    // Frame count from the length tag, if it holds an integer
    std::optional<i64> trackLength() const;

    // Identity key from the id tag
    std::optional<std::string> id() const;

    bool sameContent(const SongSegment& other) const;

    usize cachedLength(Stage stage, Track track) const {
        return tracks_.at(stage, track).size();
    }
    bool hasCachedTokens() const;

    const TokenSeq& track(Stage stage, Track track) const {
        return tracks_.at(stage, track);
    }
    TokenSeq& track(Stage stage, Track track) {
        return tracks_.at(stage, track);
    }
    void setTrack(Stage stage, Track track, TokenSeq tokens) {
        tracks_.at(stage, track) = std::move(tokens);
    }

    const TokenGrid& tracks() const {
        return tracks_;
    }

    void clearStage(Stage stage);

    // Takes a deep copy of other's token buffers, leaving name, tags and
    // lyrics alone
    void adoptTracks(const SongSegment& other) {
        tracks_ = other.tracks_;
    }

    // Base-stage tracks interleaved time-major: [V I V I ...]
    Result<TokenSeq> mergedStage1Tracks() const;

private:
    std::string name_;
    TagMap tags_;
    std::string lyrics_;
    TokenGrid tracks_;
};

} // namespace st::song
