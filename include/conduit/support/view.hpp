// include/conduit/support/view.hpp
#pragma once
#include <conduit/support/view_engine.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace conduit::support {

class ViewNotFound : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// File-backed templates under a views directory.
//
// Supported syntax:
//   {{ user.name }}                      escaped interpolation of a dotted path
//   {!! body !!}                         raw interpolation
//   @if(user.admin) ... @endif           rendered when the value is truthy
//   @foreach(items as item) ... @endforeach
class View : public ViewEngine {
public:
    explicit View(std::filesystem::path views_path);

    std::string render(const std::string& template_name, const nlohmann::json& data) override;

    // Renders template source directly.
    [[nodiscard]] static std::string render_string(std::string_view tpl, const nlohmann::json& data);

    const std::filesystem::path& views_path() const { return views_path_; }

private:
    std::filesystem::path views_path_;
};

} // namespace conduit::support
