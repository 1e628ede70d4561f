// include/conduit/core/config.hpp
#pragma once
#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace conduit::core {

// Flat key/value configuration. Each config/<file>.json is flattened under its
// stem, so {"env": "production"} in app.json becomes "app.env".
class Config {
public:
    Config() = default;

    explicit Config(const std::filesystem::path& config_path) { load_from_path(config_path); }

    // Loads every *.json file of a directory. Files that fail to parse are skipped
    // and reported through load_errors().
    void load_from_path(const std::filesystem::path& config_path);

    // Throws std::runtime_error when the file cannot be read or parsed.
    void load_json_file(const std::filesystem::path& file_path);

    // Flattens `json` under `prefix`.
    void merge(const std::string& prefix, const nlohmann::json& json);

    std::string get(const std::string& key, std::string fallback = {}) const;
    int get_int(const std::string& key, int fallback = 0) const;
    bool get_bool(const std::string& key, bool fallback = false) const;
    std::vector<std::string> get_list(const std::string& key) const;

    void set(std::string key, std::string value) { values_[std::move(key)] = std::move(value); }
    bool has(const std::string& key) const { return values_.contains(key); }

    const std::vector<std::string>& load_errors() const { return load_errors_; }

private:
    void flatten_json(const nlohmann::json& json, const std::string& current_key);

    std::unordered_map<std::string, std::string> values_;
    std::vector<std::string> load_errors_;
};

} // namespace conduit::core
