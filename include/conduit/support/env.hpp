#pragma once

#include <filesystem>
#include <string>

namespace conduit::support {

// Process environment and .env files.
class Env {
public:
    // Reads KEY=value lines into the process environment. Comments (#), blank
    // lines and surrounding quotes are handled. Variables already set in the
    // environment win unless `override_existing` is true. Returns false when
    // the file does not exist or cannot be read.
    static bool load(const std::filesystem::path& path, bool override_existing = false);

    static std::string get(const std::string& key, const std::string& fallback = "");
};

} // namespace conduit::support
