#include "TrackInterleave.hpp"
#include <string>
#include <utility>

namespace st::song {

Result<TokenSeq> interleave(const StageTracks& tracks) {
    const usize steps = tracks.front().size();
    for (usize t = 1; t < kNrTracks; ++t) {
        if (tracks[t].size() != steps) {
            return Result<TokenSeq>::err(
                    "track length mismatch: " + std::to_string(steps) +
                    " vs " + std::to_string(tracks[t].size()));
        }
    }

    TokenSeq out;
    out.reserve(steps * kNrTracks);
    for (usize n = 0; n < steps; ++n) {
        for (const auto& track : tracks) {
            out.push_back(track[n]);
        }
    }
    return Result<TokenSeq>::ok(std::move(out));
}

Result<StageTracks> deinterleave(const TokenSeq& tokens) {
    if (tokens.size() % kNrTracks != 0) {
        return Result<StageTracks>::err(
                "interleaved length " + std::to_string(tokens.size()) +
                " is not a multiple of " + std::to_string(kNrTracks));
    }

    StageTracks tracks;
    const usize steps = tokens.size() / kNrTracks;
    for (auto& track : tracks) {
        track.reserve(steps);
    }
    for (usize i = 0; i < tokens.size(); ++i) {
        tracks[i % kNrTracks].push_back(tokens[i]);
    }
    return Result<StageTracks>::ok(std::move(tracks));
}

} // namespace st::song
