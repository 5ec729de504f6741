#pragma once
// FileUtils.hpp - Filesystem helpers (XDG directories)

#include <filesystem>
#include "util/Types.hpp"

namespace st::file {

namespace fs = std::filesystem;

// $XDG_CONFIG_HOME/songtok or ~/.config/songtok
fs::path configDir();

// $XDG_CACHE_HOME/songtok or ~/.cache/songtok
fs::path cacheDir();

bool ensureDir(const fs::path& dir);

} // namespace st::file
