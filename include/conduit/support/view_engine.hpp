#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace conduit::support {

class ViewEngine {
public:
    virtual ~ViewEngine() = default;

    // Throws ViewNotFound when no template named `template_name` exists.
    virtual std::string render(const std::string& template_name, const nlohmann::json& data) = 0;
};

} // namespace conduit::support
