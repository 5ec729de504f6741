#include "SongTypes.hpp"

namespace st::song {

const char* stageName(Stage s) {
    switch (s) {
    case Stage::Base:
        return "base";
    case Stage::Refine:
        return "refine";
    }
    return "unknown";
}

const char* trackName(Track t) {
    switch (t) {
    case Track::Vocal:
        return "vocal";
    case Track::Instrumental:
        return "instrumental";
    }
    return "unknown";
}

} // namespace st::song
