#include "settings.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>

using nlohmann::json;

std::optional<std::string> MemorySettings::get_string(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

void MemorySettings::set(const std::string& key, std::string value) {
    values_[key] = std::move(value);
}

void MemorySettings::remove(const std::string& key) {
    values_.erase(key);
}

JsonSettings::JsonSettings(std::string path) : path_(std::move(path)) {
    std::ifstream ifs(path_);
    if (!ifs) {
        std::cerr << "Settings file not found: " << path_ << std::endl;
        return;
    }
    json j = json::parse(ifs, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        std::cerr << "Settings file is not a JSON object: " << path_ << std::endl;
        return;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_string()) values_[it.key()] = it.value().get<std::string>();
    }
    loaded_ = true;
}

std::optional<std::string> JsonSettings::get_string(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}
