#include "SongSegment.hpp"
#include "TrackInterleave.hpp"

namespace st::song {

SongSegment SongSegment::create(std::string name,
                                TagMap tags,
                                std::string lyrics) {
    SongSegment segment;
    segment.name_ = std::move(name);
    segment.tags_ = std::move(tags);
    segment.lyrics_ = std::move(lyrics);
    return segment;
}

SongSegment SongSegment::create(SegmentDescriptor descriptor) {
    return create(std::move(descriptor.name),
                  std::move(descriptor.tags),
                  std::move(descriptor.lyrics));
}

std::string SongSegment::toString() const {
    return "[" + name_ + "]\n" + lyrics_ + "\n\n";
}

const TagValue* SongSegment::tag(const std::string& name) const {
    auto it = tags_.find(name);
    return it != tags_.end() ? &it->second : nullptr;
}

std::optional<i64> SongSegment::trackLength() const {
    if (auto* value = tag("length")) {
        if (auto* frames = std::get_if<i64>(value))
            return *frames;
    }
    return std::nullopt;
}

std::optional<std::string> SongSegment::id() const {
    auto* value = tag("id");
    if (!value)
        return std::nullopt;
    if (auto* s = std::get_if<std::string>(value)) {
        if (s->empty())
            return std::nullopt;
        return *s;
    }
    return std::to_string(std::get<i64>(*value));
}

bool SongSegment::sameContent(const SongSegment& other) const {
    return name_ == other.name_ && tags_ == other.tags_ &&
           lyrics_ == other.lyrics_;
}

bool SongSegment::hasCachedTokens() const {
    for (auto stage : allStages()) {
        for (auto t : allTracks()) {
            if (!tracks_.at(stage, t).empty())
                return true;
        }
    }
    return false;
}

void SongSegment::clearStage(Stage stage) {
    for (auto& tokens : tracks_.stage(stage)) {
        tokens.clear();
    }
}

Result<TokenSeq> SongSegment::mergedStage1Tracks() const {
    return interleave(tracks_.stage(Stage::Base));
}

} // namespace st::song
