/**
 * @file Song.hpp
 * @brief Lyric script, its segments and the global generation parameters.
 *
 * A Song owns its segments by value; copying a Song is a deep clone of every
 * cached token buffer, which is how callers snapshot before a destructive
 * edit. Setting new lyrics re-parses the script and carries cached tokens
 * over to the new segments (see SegmentMerge.hpp).
 *
 * Lengths are in frames, 50 per second. A segment without a length tag
 * counts as defaultTrackLength().
 *
 * @section Dependencies
 * - LyricsParser
 * - SegmentMerge
 * - ConfigData (SongConfig)
 */

#pragma once
#include <string>
#include <utility>
#include <vector>
#include "SegmentMerge.hpp"
#include "SongSegment.hpp"
#include "core/ConfigData.hpp"

namespace st::song {

class Song {
public:
    using Segments = std::vector<SongSegment>;

    Song();
    explicit Song(const SongConfig& config);

    MergeReport setLyrics(std::string lyricsText);

    const std::string& rawLyrics() const {
        return rawLyrics_;
    }
    // Normalized script: every segment's toString(), concatenated
    const std::string& lyrics() const {
        return lyrics_;
    }
    std::string toString() const {
        return lyrics_;
    }

    // Tag errors from the last setLyrics()
    const std::vector<TagError>& parseErrors() const {
        return parseErrors_;
    }

    i64 length() const;
    f64 lengthSeconds() const;

    i64 defaultTrackLength() const {
        return defaultTrackLength_;
    }
    void setDefaultTrackLength(i64 frames) {
        defaultTrackLength_ = frames;
    }

    const std::string& systemPrompt() const {
        return systemPrompt_;
    }
    void setSystemPrompt(std::string prompt) {
        systemPrompt_ = std::move(prompt);
    }

    const TokenSeq& audioPrompt() const {
        return audioPrompt_;
    }
    void setAudioPrompt(TokenSeq prompt) {
        audioPrompt_ = std::move(prompt);
    }

    const std::string& genre() const {
        return genre_;
    }
    void setGenre(std::string genre) {
        genre_ = std::move(genre);
    }

    MergeStrategy mergeStrategy() const {
        return mergeStrategy_;
    }
    void setMergeStrategy(MergeStrategy strategy) {
        mergeStrategy_ = strategy;
    }

    // Per track, the segments' buffers for stage concatenated in order.
    // Empty segments contribute nothing.
    StageTracks mergeSegments(Stage stage) const;

    void clearCache(Stage stage);

    const Segments& segments() const {
        return segments_;
    }
    usize size() const {
        return segments_.size();
    }
    bool empty() const {
        return segments_.empty();
    }

    SongSegment& operator[](usize index) {
        return segments_[index];
    }
    const SongSegment& operator[](usize index) const {
        return segments_[index];
    }

    Segments::iterator begin() {
        return segments_.begin();
    }
    Segments::iterator end() {
        return segments_.end();
    }
    Segments::const_iterator begin() const {
        return segments_.begin();
    }
    Segments::const_iterator end() const {
        return segments_.end();
    }

private:
    void rebuildLyrics();

    Segments segments_;
    std::vector<TagError> parseErrors_;
    TokenSeq audioPrompt_;
    i64 defaultTrackLength_;
    std::string systemPrompt_;
    std::string rawLyrics_;
    std::string lyrics_;
    std::string genre_;
    MergeStrategy mergeStrategy_{MergeStrategy::Identity};
};

} // namespace st::song
