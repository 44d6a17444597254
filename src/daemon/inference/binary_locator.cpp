#include "inference/binary_locator.hpp"

#include <cstdlib>
#include <filesystem>
#include <string_view>
#include <unistd.h>

namespace fs = std::filesystem;

namespace binaries {

namespace {

bool is_executable(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

} // namespace

std::optional<std::string> find(const std::string& name, const std::string& bin_dir) {
    if (name.find('/') != std::string::npos) {
        if (is_executable(name)) return name;
        return std::nullopt;
    }

    if (!bin_dir.empty()) {
        auto candidate = fs::path(bin_dir) / name;
        if (is_executable(candidate)) return candidate.string();
    }

    const char* path = std::getenv("PATH");
    if (!path) return std::nullopt;

    std::string_view rest(path);
    while (!rest.empty()) {
        auto colon = rest.find(':');
        auto dir = rest.substr(0, colon);
        if (!dir.empty()) {
            auto candidate = fs::path(dir) / name;
            if (is_executable(candidate)) return candidate.string();
        }
        if (colon == std::string_view::npos) break;
        rest.remove_prefix(colon + 1);
    }
    return std::nullopt;
}

} // namespace binaries
