#include <conduit/core/config.hpp>
#include <conduit/support/str.hpp>

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace conduit::core {

void Config::load_from_path(const std::filesystem::path& config_path)
{
    if (!std::filesystem::exists(config_path)) {
        return;
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(config_path)) {
        if (entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    // directory order is unspecified
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        try {
            load_json_file(file);
        } catch (const std::exception& e) {
            load_errors_.emplace_back(e.what());
        }
    }
}

void Config::load_json_file(const std::filesystem::path& file_path)
{
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file " + file_path.string());
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + file_path.string() + ": " + e.what());
    }
    merge(file_path.stem().string(), json);
}

void Config::merge(const std::string& prefix, const nlohmann::json& json)
{
    flatten_json(json, prefix);
}

std::string Config::get(const std::string& key, std::string fallback) const
{
    auto it = values_.find(key);
    return it != values_.end() ? it->second : fallback;
}

int Config::get_int(const std::string& key, int fallback) const
{
    auto it = values_.find(key);
    if (it == values_.end()) {
        return fallback;
    }
    try {
        return std::stoi(it->second);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

bool Config::get_bool(const std::string& key, bool fallback) const
{
    auto it = values_.find(key);
    if (it == values_.end()) {
        return fallback;
    }
    const auto lower = support::str::to_lower(it->second);
    return lower == "true" || lower == "1" || lower == "yes";
}

std::vector<std::string> Config::get_list(const std::string& key) const
{
    std::vector<std::string> result;
    auto it = values_.find(key);
    if (it == values_.end() || it->second.empty()) {
        return result;
    }
    for (const auto& item : support::str::split(it->second, ',')) {
        result.push_back(support::str::trim(item));
    }
    return result;
}

void Config::flatten_json(const nlohmann::json& json, const std::string& current_key)
{
    if (json.is_object()) {
        for (auto it = json.begin(); it != json.end(); ++it) {
            flatten_json(it.value(), current_key.empty() ? it.key() : current_key + "." + it.key());
        }
    } else if (json.is_array()) {
        std::string array_str;
        for (const auto& item : json) {
            if (!array_str.empty()) array_str += ",";
            array_str += item.is_string() ? item.get<std::string>() : item.dump();
        }
        values_[current_key] = array_str;
    } else if (json.is_string()) {
        values_[current_key] = json.get<std::string>();
    } else {
        values_[current_key] = json.dump();
    }
}

} // namespace conduit::core
