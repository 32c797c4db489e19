#include "FileUtils.hpp"
#include <cstdlib>
#include <string>
#include <system_error>

namespace oc::file {

namespace {

constexpr const char* kAppDir = "observer-core";

fs::path envPath(const char* name) {
    if (const char* v = std::getenv(name); v && *v)
        return fs::path(v);
    return {};
}

fs::path homeDir() {
#ifdef _WIN32
    if (auto p = envPath("USERPROFILE"); !p.empty())
        return p;
#endif
    if (auto p = envPath("HOME"); !p.empty())
        return p;
    std::error_code ec;
    return fs::temp_directory_path(ec);
}

} // namespace

fs::path configDir() {
#if defined(_WIN32)
    if (auto p = envPath("APPDATA"); !p.empty())
        return p / kAppDir;
#elif defined(__APPLE__)
    return homeDir() / "Library" / "Application Support" / kAppDir;
#else
    if (auto p = envPath("XDG_CONFIG_HOME"); !p.empty())
        return p / kAppDir;
#endif
    return homeDir() / ".config" / kAppDir;
}

fs::path cacheDir() {
#if defined(_WIN32)
    if (auto p = envPath("LOCALAPPDATA"); !p.empty())
        return p / kAppDir;
#elif defined(__APPLE__)
    return homeDir() / "Library" / "Caches" / kAppDir;
#else
    if (auto p = envPath("XDG_CACHE_HOME"); !p.empty())
        return p / kAppDir;
#endif
    return homeDir() / ".cache" / kAppDir;
}

bool ensureDir(const fs::path& dir) {
    if (dir.empty())
        return true;
    std::error_code ec;
    if (fs::is_directory(dir, ec))
        return true;
    fs::create_directories(dir, ec);
    return !ec;
}

fs::path expandPath(std::string_view path) {
    std::string p(path);
    if (p.starts_with("~/")) {
        p = homeDir().string() + p.substr(1);
    }
    return fs::path(p);
}

u64 fileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<u64>(size);
}

} // namespace oc::file
