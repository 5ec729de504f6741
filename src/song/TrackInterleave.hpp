#pragma once
// TrackInterleave.hpp - Track-major <-> time-major token layout

#include "SongTypes.hpp"
#include "util/Result.hpp"

namespace st::song {

// [t0[0], t1[0], t0[1], t1[1], ...]. Fails unless every track has the same
// length.
Result<TokenSeq> interleave(const StageTracks& tracks);

// Inverse of interleave. Fails unless the input length is a multiple of
// kNrTracks.
Result<StageTracks> deinterleave(const TokenSeq& tokens);

} // namespace st::song
