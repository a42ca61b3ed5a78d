#include "settings.h"
#include <fstream>
#include <spdlog/spdlog.h>

namespace util {
void Settings::init(const std::filesystem::path& path, bool must_exist) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_path_.empty()) {
        spdlog::debug("[Settings::init] Replacing settings loaded from {}", file_path_);
    }
    file_path_ = path.string();
    settings_ = json::object();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (must_exist) {
            throw ConfigError("settings file not found: " + file_path_);
        }
        spdlog::debug("[Settings::init] No settings file at {}, using defaults", file_path_);
        return;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open settings file: " + file_path_);
    }

    json loaded;
    try {
        file >> loaded;
    } catch (const json::exception& e) {
        throw ConfigError("malformed settings file " + file_path_ + ": " + e.what());
    }
    if (!loaded.is_object()) {
        throw ConfigError("settings file " + file_path_ + " must contain a JSON object");
    }
    settings_ = std::move(loaded);
    spdlog::info("[Settings::init] Settings loaded from {}", file_path_);
}

std::filesystem::path Settings::default_path(const std::string& executable_path) {
    std::filesystem::path exe_dir;
    if (!executable_path.empty()) {
        exe_dir = std::filesystem::path(executable_path).parent_path();
    }
    if (exe_dir.empty()) {
        exe_dir = std::filesystem::current_path();
    }
    return exe_dir / "settings.json";
}

} // namespace util
