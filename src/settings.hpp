#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>

// Read side of the host's user settings storage.
class Settings {
public:
    virtual ~Settings() = default;
    virtual std::optional<std::string> get_string(const std::string& key) const = 0;

    std::string get_string_or(const std::string& key, const std::string& fallback = {}) const {
        auto v = get_string(key);
        return v ? *v : fallback;
    }
};

class MemorySettings : public Settings {
public:
    MemorySettings() = default;
    explicit MemorySettings(std::map<std::string, std::string> values)
        : values_(std::move(values)) {}

    std::optional<std::string> get_string(const std::string& key) const override;
    void set(const std::string& key, std::string value);
    void remove(const std::string& key);

private:
    std::map<std::string, std::string> values_;
};

// Settings loaded once from a JSON object on disk, e.g.
// {"username": "...", "password": "..."}. Non-string members are ignored.
class JsonSettings : public Settings {
public:
    explicit JsonSettings(std::string path);

    std::optional<std::string> get_string(const std::string& key) const override;

    // false when the file was missing or not a JSON object
    bool loaded() const { return loaded_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::map<std::string, std::string> values_;
    bool loaded_ = false;
};
