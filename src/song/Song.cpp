#include "Song.hpp"
#include <string_view>
#include "core/Logger.hpp"

namespace st::song {

Song::Song() : Song(SongConfig{}) {}

Song::Song(const SongConfig& config)
    : defaultTrackLength_(config.defaultTrackLength),
      systemPrompt_(config.systemPrompt),
      genre_(config.genre) {
    if (auto strategy = mergeStrategyFromString(config.mergeStrategy)) {
        mergeStrategy_ = *strategy;
    } else {
        LOG_WARN("Unknown merge strategy '{}', using identity",
                 config.mergeStrategy);
    }
}

MergeReport Song::setLyrics(std::string lyricsText) {
    rawLyrics_ = std::move(lyricsText);

    auto first = rawLyrics_.find_first_not_of(" \t\r\n\f\v");
    std::string_view script;
    if (first != std::string::npos) {
        auto last = rawLyrics_.find_last_not_of(" \t\r\n\f\v");
        script = std::string_view(rawLyrics_).substr(first, last - first + 1);
    }

    auto parsed = LyricsParser::parse(script);

    Segments next;
    next.reserve(parsed.segments.size());
    for (auto& descriptor : parsed.segments) {
        next.push_back(SongSegment::create(std::move(descriptor)));
    }

    auto report = mergeForward(segments_, next, mergeStrategy_);
    if (report.ambiguous() > 0) {
        LOG_WARN("Lyrics update: {} segment(s) could not be matched to "
                 "cached tokens unambiguously",
                 report.ambiguous());
    }
    LOG_DEBUG("Lyrics update: {} -> {} segments, {} carried over ({})",
              segments_.size(),
              next.size(),
              report.merged(),
              mergeStrategyName(mergeStrategy_));

    segments_ = std::move(next);
    parseErrors_ = std::move(parsed.errors);
    rebuildLyrics();
    return report;
}

void Song::rebuildLyrics() {
    lyrics_.clear();
    for (const auto& segment : segments_) {
        lyrics_ += segment.toString();
    }
}

i64 Song::length() const {
    i64 total = 0;
    for (const auto& segment : segments_) {
        total += segment.trackLength().value_or(defaultTrackLength_);
    }
    return total;
}

f64 Song::lengthSeconds() const {
    return static_cast<f64>(length()) / static_cast<f64>(kFramesPerSecond);
}

StageTracks Song::mergeSegments(Stage stage) const {
    StageTracks merged;
    for (auto t : allTracks()) {
        auto& full = merged[trackIndex(t)];
        for (const auto& segment : segments_) {
            const auto& tokens = segment.track(stage, t);
            full.insert(full.end(), tokens.begin(), tokens.end());
        }
    }
    return merged;
}

void Song::clearCache(Stage stage) {
    for (auto& segment : segments_) {
        segment.clearStage(stage);
    }
    LOG_DEBUG("Cleared {} stage cache of {} segments",
              stageName(stage),
              segments_.size());
}

} // namespace st::song
