#include "GenerationCache.hpp"
#include <QJsonArray>
#include <QJsonValue>
#include <QString>
#include <algorithm>
#include <cmath>
#include <optional>
#include "core/Logger.hpp"

namespace st::song {

namespace {

QJsonArray tokensToJson(const TokenSeq& tokens) {
    QJsonArray arr;
    for (Token t : tokens) {
        arr.append(static_cast<qint64>(t));
    }
    return arr;
}

std::optional<i64> jsonInteger(const QJsonValue& v) {
    if (!v.isDouble())
        return std::nullopt;
    const double d = v.toDouble();
    if (!std::isfinite(d) || std::trunc(d) != d)
        return std::nullopt;
    return static_cast<i64>(v.toInteger());
}

Result<TokenSeq> tokensFromJson(const QJsonValue& v) {
    if (!v.isArray())
        return Result<TokenSeq>::err("track is not an array");
    const auto arr = v.toArray();
    TokenSeq tokens;
    tokens.reserve(static_cast<usize>(arr.size()));
    for (const auto& item : arr) {
        auto token = jsonInteger(item);
        if (!token)
            return Result<TokenSeq>::err("track holds a non-integer token");
        tokens.push_back(*token);
    }
    return Result<TokenSeq>::ok(std::move(tokens));
}

Result<TokenGrid> tracksFromJson(const QJsonValue& v) {
    if (!v.isArray())
        return Result<TokenGrid>::err("\"tracks\" is not an array");
    const auto stages = v.toArray();
    if (static_cast<usize>(stages.size()) > kNrStages) {
        LOG_WARN("Cache snapshot has {} stages, keeping the first {}",
                 stages.size(),
                 kNrStages);
    }

    TokenGrid grid;
    for (auto stage : allStages()) {
        const auto si = static_cast<qsizetype>(stageIndex(stage));
        if (si >= stages.size())
            break;
        if (!stages[si].isArray())
            return Result<TokenGrid>::err("stage entry is not an array");
        const auto tracks = stages[si].toArray();
        for (auto t : allTracks()) {
            const auto ti = static_cast<qsizetype>(trackIndex(t));
            if (ti >= tracks.size())
                break;
            auto tokens = tokensFromJson(tracks[ti]);
            if (tokens.isErr())
                return Result<TokenGrid>::err(tokens.error().message);
            grid.at(stage, t) = std::move(*tokens);
        }
    }
    return Result<TokenGrid>::ok(std::move(grid));
}

Result<std::vector<BoundaryRecord>> segmentsFromJson(const QJsonValue& v) {
    using R = Result<std::vector<BoundaryRecord>>;
    if (!v.isArray())
        return R::err("\"segments\" is not an array");

    std::vector<BoundaryRecord> records;
    for (const auto& item : v.toArray()) {
        const auto triple = item.toArray();
        if (!item.isArray() || triple.size() != 3 || !triple[0].isString())
            return R::err("segment entry is not [name, start, end]");
        auto start = jsonInteger(triple[1]);
        auto end = jsonInteger(triple[2]);
        if (!start || !end || *start < 0 || *end < 0)
            return R::err("segment offsets must be non-negative integers");
        records.push_back({triple[0].toString().toStdString(),
                           static_cast<usize>(*start),
                           static_cast<usize>(*end)});
    }
    return R::ok(std::move(records));
}

} // namespace

usize TransferReport::count(TransferIssue::Kind kind) const {
    return static_cast<usize>(
            std::count_if(issues.begin(), issues.end(), [kind](const auto& i) {
                return i.kind == kind;
            }));
}

GenerationCache::GenerationCache() : GenerationCache(CacheConfig{}) {}

GenerationCache::GenerationCache(const CacheConfig& config) : config_(config) {
    if (config_.msPerToken == 0 || config_.fineElementsPerToken == 0) {
        LOG_WARN("Cache timing {} ms/token, {} refine elements/token "
                 "raised to at least 1",
                 config_.msPerToken,
                 config_.fineElementsPerToken);
        config_.msPerToken = std::max(config_.msPerToken, u32{1});
        config_.fineElementsPerToken =
                std::max(config_.fineElementsPerToken, u32{1});
    }
}

GenerationCache GenerationCache::createFrom(const Song& song,
                                            const CacheConfig& config) {
    GenerationCache cache(config);

    for (auto stage : allStages()) {
        cache.addTracks(stage, song.mergeSegments(stage));
    }

    // Segments without base tokens take no room and get no boundary
    usize cursor = 0;
    for (const auto& segment : song) {
        const usize length = segment.cachedLength(Stage::Base, Track::Vocal);
        if (length == 0)
            continue;
        cache.addSegment(segment.name(), cursor, cursor + length);
        cursor += length;
    }

    LOG_DEBUG("Generation cache: {} of {} segments cached, {} base tokens",
              cache.segments_.size(),
              song.size(),
              cursor);
    return cache;
}

void GenerationCache::addTracks(Stage stage, StageTracks tracks) {
    tracks_.stage(stage) = std::move(tracks);
}

void GenerationCache::addSegment(std::string name, usize start, usize end) {
    segments_.push_back({std::move(name), start, end});
}

void GenerationCache::setLastSegmentEnd(usize end) {
    if (segments_.empty())
        return;
    auto& last = segments_.back();
    last.end = std::max(end, last.start);
}

usize GenerationCache::totalLength() const {
    usize total = 0;
    for (const auto& record : segments_) {
        total += record.length();
    }
    return total;
}

usize GenerationCache::resumeToken() const {
    return segments_.empty() ? 0 : segments_.back().end;
}

usize GenerationCache::elementsPerToken(Stage stage) const {
    return stage == Stage::Base ? 1 : config_.fineElementsPerToken;
}

RewindReport GenerationCache::rewind(i64 durationMs) {
    RewindReport report;
    if (durationMs < 0) {
        LOG_WARN("Rewind by negative duration {} ms ignored", durationMs);
        return report;
    }

    usize tokens = static_cast<usize>(durationMs) / config_.msPerToken;
    report.requestedTokens = tokens;

    const usize total = totalLength();
    if (tokens > 0 && tokens >= total && !segments_.empty()) {
        report.removedTokens = total;
        report.droppedSegments = segments_.size();
        report.clamped = tokens > total;
        segments_.clear();
    } else {
        while (!segments_.empty()) {
            auto& last = segments_.back();
            const usize length = last.length();
            if (tokens > length) {
                tokens -= length;
                report.removedTokens += length;
                ++report.droppedSegments;
                segments_.pop_back();
                continue;
            }
            last.end -= tokens;
            report.removedTokens += tokens;
            break;
        }
        report.clamped = segments_.empty() && report.requestedTokens > 0;
    }

    LOG_DEBUG("Rewind {} ms: {} tokens removed, {} segments dropped, "
              "resume at {}",
              durationMs,
              report.removedTokens,
              report.droppedSegments,
              resumeToken());
    return report;
}

TransferReport GenerationCache::transferToSong(Song& song) const {
    TransferReport report;

    for (usize i = 0; i < segments_.size(); ++i) {
        const auto& record = segments_[i];
        if (i >= song.size()) {
            report.issues.push_back({TransferIssue::Kind::NoSegment, i});
            continue;
        }

        for (auto stage : allStages()) {
            const usize k = elementsPerToken(stage);
            for (auto t : allTracks()) {
                const auto& buffer = tracks_.at(stage, t);
                const usize start = record.start * k;
                usize end = std::max(record.end * k, start);

                if (buffer.empty() || start > buffer.size()) {
                    report.issues.push_back({TransferIssue::Kind::Skipped,
                                             i,
                                             stage,
                                             t,
                                             end,
                                             buffer.size()});
                    continue;
                }
                if (end > buffer.size()) {
                    report.issues.push_back({TransferIssue::Kind::Clamped,
                                             i,
                                             stage,
                                             t,
                                             end,
                                             buffer.size()});
                    end = buffer.size();
                }

                song[i].setTrack(stage,
                                 t,
                                 TokenSeq(buffer.begin() + start,
                                          buffer.begin() + end));
                ++report.slicesWritten;
            }
        }
    }

    if (report.degraded()) {
        LOG_DEBUG("Transfer to song: {} slices written, {} skipped, "
                  "{} clamped, {} without segment",
                  report.slicesWritten,
                  report.count(TransferIssue::Kind::Skipped),
                  report.count(TransferIssue::Kind::Clamped),
                  report.count(TransferIssue::Kind::NoSegment));
    }
    return report;
}

QJsonObject GenerationCache::save() const {
    QJsonArray stages;
    for (auto stage : allStages()) {
        QJsonArray tracks;
        for (auto t : allTracks()) {
            tracks.append(tokensToJson(tracks_.at(stage, t)));
        }
        stages.append(tracks);
    }

    QJsonArray segments;
    for (const auto& record : segments_) {
        segments.append(QJsonArray{QString::fromStdString(record.name),
                                   static_cast<qint64>(record.start),
                                   static_cast<qint64>(record.end)});
    }

    QJsonObject data;
    data.insert("tracks", stages);
    data.insert("segments", segments);
    return data;
}

Result<void> GenerationCache::load(const QJsonObject& data) {
    auto tracks = Result<TokenGrid>::ok(tracks_);
    if (data.contains("tracks"))
        tracks = tracksFromJson(data.value("tracks"));
    if (tracks.isErr()) {
        LOG_ERROR("Cache snapshot rejected: {}", tracks.error().message);
        return Result<void>::err(tracks.error().message);
    }

    auto segments = Result<std::vector<BoundaryRecord>>::ok(segments_);
    if (data.contains("segments"))
        segments = segmentsFromJson(data.value("segments"));
    if (segments.isErr()) {
        LOG_ERROR("Cache snapshot rejected: {}", segments.error().message);
        return Result<void>::err(segments.error().message);
    }

    tracks_ = std::move(*tracks);
    segments_ = std::move(*segments);
    return Result<void>::ok();
}

} // namespace st::song
