#pragma once
// ═══════════════════════════════════════════════════════════════════
//  schemapp/fs.h — File and path helpers used by the importer
// ═══════════════════════════════════════════════════════════════════

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace schemapp::fs {

inline std::string readFileSync(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("ENOENT: no such file or directory, open '" + path + "'");
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

inline bool existsSync(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

inline bool isFileSync(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

// ── Top-level entry names of a directory, sorted by name ──
inline std::vector<std::string> readdirSync(const std::string& path) {
    std::error_code ec;
    std::filesystem::directory_iterator it(path, ec);
    if (ec) {
        throw std::runtime_error("ENOTDIR: cannot read directory '" + path + "': " + ec.message());
    }
    std::vector<std::string> result;
    for (auto& entry : it) {
        result.push_back(entry.path().filename().string());
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace schemapp::fs

namespace schemapp::path {

template <typename... Args>
std::string join(const std::string& first, const Args&... rest) {
    std::filesystem::path result(first);
    ((result /= rest), ...);
    return result.string();
}

inline std::string resolve(const std::string& p) {
    return std::filesystem::absolute(p).lexically_normal().string();
}

// ── path::extname ── ".json" for "user.json", "" for "README"
inline std::string extname(const std::string& p) {
    return std::filesystem::path(p).extension().string();
}

// ── path::stem ── "user" for "/schema/user.json"
inline std::string stem(const std::string& p) {
    return std::filesystem::path(p).stem().string();
}

} // namespace schemapp::path
