#include "FileUtils.hpp"
#include <cstdlib>
#include <system_error>

namespace st::file {

namespace {

constexpr const char* kAppDir = "songtok";

fs::path xdgDir(const char* envVar, const char* homeFallback) {
    if (const char* xdg = std::getenv(envVar); xdg && *xdg) {
        return fs::path(xdg) / kAppDir;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / homeFallback / kAppDir;
    }
    return fs::temp_directory_path() / kAppDir;
}

} // namespace

fs::path configDir() {
    return xdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path cacheDir() {
    return xdgDir("XDG_CACHE_HOME", ".cache");
}

bool ensureDir(const fs::path& dir) {
    std::error_code ec;
    if (fs::exists(dir, ec))
        return fs::is_directory(dir, ec);
    return fs::create_directories(dir, ec);
}

} // namespace st::file
