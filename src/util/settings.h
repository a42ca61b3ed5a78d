#pragma once

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using namespace nlohmann;

namespace util {

// Raised for any configuration problem: unreadable or malformed settings, missing
// credentials, out-of-range tunables.
class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class Settings {
  public:
    static Settings& instance() {
        static Settings instance;
        return instance;
    }

    // Loads a JSON object from path. A missing file leaves the defaults in place
    // unless must_exist is set. Throws ConfigError on unreadable or malformed files.
    void init(const std::filesystem::path& path, bool must_exist = false);

    // Directory-relative default: settings.json next to the executable.
    static std::filesystem::path default_path(const std::string& executable_path);

    Settings(const Settings&) = delete;
    Settings& operator=(const Settings&) = delete;

    json get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settings_;
    }

    const std::string& file_path() const { return file_path_; }

  private:
    Settings() = default;
    ~Settings() = default;

    std::string file_path_;
    json settings_ = json::object();
    mutable std::mutex mutex_;
};
} // namespace util
