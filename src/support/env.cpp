#include <conduit/support/env.hpp>
#include <conduit/support/str.hpp>

#include <cstdlib>
#include <fstream>

namespace conduit::support {

bool Env::load(const std::filesystem::path& path, bool override_existing)
{
    if (!std::filesystem::exists(path)) {
        return false;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        auto comment_pos = line.find('#');
        if (comment_pos != std::string::npos) {
            line.erase(comment_pos);
        }

        line = str::trim(line);
        if (line.empty()) continue;

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = str::trim(line.substr(0, eq_pos));
        std::string value = str::trim(line.substr(eq_pos + 1));
        if (key.empty()) continue;

        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }

        ::setenv(key.c_str(), value.c_str(), override_existing ? 1 : 0);
    }

    return true;
}

std::string Env::get(const std::string& key, const std::string& fallback)
{
    const char* val = std::getenv(key.c_str());
    return val ? std::string(val) : fallback;
}

} // namespace conduit::support
