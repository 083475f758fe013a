#pragma once
// FileUtils.hpp - Filesystem helpers (XDG dirs, whole-file I/O, temp paths)

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "Result.hpp"
#include "Types.hpp"

namespace rs::file {

namespace fs = std::filesystem;

fs::path configDir();
fs::path cacheDir();
fs::path dataDir();

bool ensureDir(const fs::path& dir);

Result<std::vector<u8>> readBytes(const fs::path& path);
Result<void> writeBytes(const fs::path& path, const std::vector<u8>& data);

// Unique path inside cacheDir()/tmp; the file itself is not created
fs::path tempPath(std::string_view prefix, std::string_view extension);

// "~/x" -> "$HOME/x"
fs::path expandHome(std::string_view path);

} // namespace rs::file
