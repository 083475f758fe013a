#include "FileUtils.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

namespace rs::file {

namespace {

fs::path xdgDir(const char* envName, const char* fallback) {
    if (const char* xdg = std::getenv(envName); xdg && *xdg) {
        return fs::path(xdg) / "reelsync";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / fallback / "reelsync";
    }
    return fs::temp_directory_path() / "reelsync";
}

} // namespace

fs::path configDir() {
    return xdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path cacheDir() {
    return xdgDir("XDG_CACHE_HOME", ".cache");
}

fs::path dataDir() {
    return xdgDir("XDG_DATA_HOME", ".local/share");
}

bool ensureDir(const fs::path& dir) {
    if (dir.empty()) {
        return true;
    }
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        return true;
    }
    return fs::create_directories(dir, ec) || fs::is_directory(dir, ec);
}

Result<std::vector<u8>> readBytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) {
        return Result<std::vector<u8>>::err("Cannot open file: " +
                                            path.string());
    }
    auto size = in.tellg();
    if (size < 0) {
        return Result<std::vector<u8>>::err("Cannot size file: " +
                                            path.string());
    }
    std::vector<u8> data(static_cast<usize>(size));
    in.seekg(0);
    if (!data.empty() &&
        !in.read(reinterpret_cast<char*>(data.data()), size)) {
        return Result<std::vector<u8>>::err("Short read: " + path.string());
    }
    return Result<std::vector<u8>>::ok(std::move(data));
}

Result<void> writeBytes(const fs::path& path, const std::vector<u8>& data) {
    ensureDir(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void>::err("Cannot open file for writing: " +
                                 path.string());
    }
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!out) {
        return Result<void>::err("Write failed: " + path.string());
    }
    return Result<void>::ok();
}

fs::path tempPath(std::string_view prefix, std::string_view extension) {
    static std::atomic<u64> counter{0};
    auto dir = cacheDir() / "tmp";
    ensureDir(dir);

    auto stamp = std::chrono::duration_cast<std::chrono::microseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    std::string name = std::string(prefix) + "-" + std::to_string(::getpid()) +
                       "-" + std::to_string(stamp) + "-" +
                       std::to_string(counter.fetch_add(1));
    if (!extension.empty()) {
        name += ".";
        name += extension;
    }
    return dir / name;
}

fs::path expandHome(std::string_view path) {
    std::string p(path);
    if (p.starts_with("~/")) {
        if (const char* home = std::getenv("HOME")) {
            p = std::string(home) + p.substr(1);
        }
    }
    return fs::path(p);
}

} // namespace rs::file
