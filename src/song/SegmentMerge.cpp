#include "SegmentMerge.hpp"
#include <algorithm>
#include <map>
#include <string>
#include "core/Logger.hpp"

namespace st::song {

namespace {

struct Matching {
    std::vector<std::optional<usize>> oldFor; // indexed by new segment
    std::vector<MatchKind> kind;
    std::vector<bool> oldUsed;

    Matching(usize oldCount, usize newCount)
        : oldFor(newCount), kind(newCount, MatchKind::None), oldUsed(oldCount) {}

    void pair(usize newIdx, usize oldIdx, MatchKind k) {
        oldFor[newIdx] = oldIdx;
        kind[newIdx] = k;
        oldUsed[oldIdx] = true;
    }
    bool open(usize newIdx) const {
        return kind[newIdx] == MatchKind::None;
    }
};

// Same section name, and no conflicting identity keys
bool compatible(const SongSegment& prev, const SongSegment& next) {
    if (prev.name() != next.name())
        return false;
    auto a = prev.id();
    auto b = next.id();
    return !(a && b && *a != *b);
}

// An id is a key only when it names exactly one segment on each side.
// Repeated ids are left to the name diff.
void matchByIds(const std::vector<SongSegment>& previous,
                const std::vector<SongSegment>& next,
                Matching& m) {
    std::map<std::string, std::vector<usize>> oldById;
    std::map<std::string, usize> newIdCount;
    for (usize i = 0; i < previous.size(); ++i) {
        if (auto id = previous[i].id())
            oldById[*id].push_back(i);
    }
    for (const auto& segment : next) {
        if (auto id = segment.id())
            ++newIdCount[*id];
    }

    for (usize j = 0; j < next.size(); ++j) {
        auto id = next[j].id();
        if (!id)
            continue;
        auto it = oldById.find(*id);
        if (it == oldById.end())
            continue;
        if (it->second.size() != 1 || newIdCount[*id] != 1) {
            LOG_DEBUG("Segment merge: id '{}' of [{}] is not unique, "
                      "matching by name",
                      *id,
                      next[j].name());
            continue;
        }
        m.pair(j, it->second.front(), MatchKind::Id);
    }
}

// Longest common subsequence over the still unmatched segments
void matchByNames(const std::vector<SongSegment>& previous,
                  const std::vector<SongSegment>& next,
                  Matching& m) {
    std::vector<usize> olds;
    std::vector<usize> news;
    for (usize i = 0; i < previous.size(); ++i) {
        if (!m.oldUsed[i])
            olds.push_back(i);
    }
    for (usize j = 0; j < next.size(); ++j) {
        if (m.open(j))
            news.push_back(j);
    }
    if (olds.empty() || news.empty())
        return;

    const usize rows = olds.size();
    const usize cols = news.size();
    std::vector<usize> lcs((rows + 1) * (cols + 1), 0);
    auto at = [cols](usize r, usize c) { return r * (cols + 1) + c; };

    for (usize r = rows; r-- > 0;) {
        for (usize c = cols; c-- > 0;) {
            if (compatible(previous[olds[r]], next[news[c]])) {
                lcs[at(r, c)] = lcs[at(r + 1, c + 1)] + 1;
            } else {
                lcs[at(r, c)] = std::max(lcs[at(r + 1, c)], lcs[at(r, c + 1)]);
            }
        }
    }

    usize r = 0;
    usize c = 0;
    while (r < rows && c < cols) {
        if (compatible(previous[olds[r]], next[news[c]]) &&
            lcs[at(r, c)] == lcs[at(r + 1, c + 1)] + 1) {
            m.pair(news[c], olds[r], MatchKind::Name);
            ++r;
            ++c;
        } else if (lcs[at(r + 1, c)] >= lcs[at(r, c + 1)]) {
            ++r;
        } else {
            ++c;
        }
    }
}

void flagLeftoverNames(const std::vector<SongSegment>& previous,
                       const std::vector<SongSegment>& next,
                       Matching& m) {
    for (usize j = 0; j < next.size(); ++j) {
        if (!m.open(j))
            continue;
        for (usize i = 0; i < previous.size(); ++i) {
            if (!m.oldUsed[i] && compatible(previous[i], next[j])) {
                LOG_WARN("Segment merge: [{}] at {} could take cached tokens "
                         "of segment {}, left empty",
                         next[j].name(),
                         j,
                         i);
                m.kind[j] = MatchKind::Ambiguous;
                break;
            }
        }
    }
}

// Pairs an unmatched new[j] with an unused old[j] on the shared index range
void matchInPlace(const std::vector<SongSegment>& previous,
                  const std::vector<SongSegment>& next,
                  Matching& m) {
    const usize shared = std::min(previous.size(), next.size());
    for (usize j = 0; j < shared; ++j) {
        if (!m.open(j) || m.oldUsed[j])
            continue;
        auto a = previous[j].id();
        auto b = next[j].id();
        if (a && b && *a != *b)
            continue;
        m.pair(j, j, MatchKind::Positional);
    }
}

} // namespace

usize MergeReport::merged() const {
    return static_cast<usize>(
            std::count_if(entries.begin(), entries.end(), [](const auto& e) {
                return e.oldIndex.has_value();
            }));
}

usize MergeReport::ambiguous() const {
    return static_cast<usize>(
            std::count_if(entries.begin(), entries.end(), [](const auto& e) {
                return e.kind == MatchKind::Ambiguous;
            }));
}

std::optional<MergeStrategy> mergeStrategyFromString(std::string_view name) {
    if (name == "identity")
        return MergeStrategy::Identity;
    if (name == "positional")
        return MergeStrategy::Positional;
    return std::nullopt;
}

const char* mergeStrategyName(MergeStrategy strategy) {
    switch (strategy) {
    case MergeStrategy::Positional:
        return "positional";
    case MergeStrategy::Identity:
        return "identity";
    }
    return "unknown";
}

const char* matchKindName(MatchKind kind) {
    switch (kind) {
    case MatchKind::Id:
        return "id";
    case MatchKind::Name:
        return "name";
    case MatchKind::Positional:
        return "positional";
    case MatchKind::Ambiguous:
        return "ambiguous";
    case MatchKind::None:
        return "none";
    }
    return "unknown";
}

MergeReport mergeForward(const std::vector<SongSegment>& previous,
                         std::vector<SongSegment>& next,
                         MergeStrategy strategy) {
    Matching m(previous.size(), next.size());

    if (strategy == MergeStrategy::Positional) {
        const usize shared = std::min(previous.size(), next.size());
        for (usize i = 0; i < shared; ++i) {
            m.pair(i, i, MatchKind::Positional);
        }
    } else {
        matchByIds(previous, next, m);
        matchByNames(previous, next, m);
        flagLeftoverNames(previous, next, m);
        matchInPlace(previous, next, m);
    }

    MergeReport report;
    report.strategy = strategy;
    report.entries.reserve(next.size());

    for (usize j = 0; j < next.size(); ++j) {
        MergeEntry entry;
        entry.newIndex = j;
        entry.kind = m.kind[j];
        entry.oldIndex = m.oldFor[j];
        if (entry.oldIndex) {
            const auto& source = previous[*entry.oldIndex];
            entry.contentChanged = !next[j].sameContent(source);
            next[j].adoptTracks(source);
            LOG_DEBUG("Segment merge: [{}] {} <- {} ({})",
                      next[j].name(),
                      j,
                      *entry.oldIndex,
                      matchKindName(entry.kind));
        }
        report.entries.push_back(entry);
    }

    return report;
}

} // namespace st::song
