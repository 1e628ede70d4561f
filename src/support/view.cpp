#include <conduit/support/view.hpp>
#include <conduit/support/str.hpp>

#include <array>
#include <fstream>
#include <iterator>
#include <sstream>

namespace conduit::support {

namespace {

const nlohmann::json* lookup(const std::string& key, const nlohmann::json& data)
{
    const nlohmann::json* current = &data;
    for (const auto& part : str::split(key, '.')) {
        if (!current->is_object() || !current->contains(part)) {
            return nullptr;
        }
        current = &(*current)[part];
    }
    return current;
}

std::string stringify(const nlohmann::json* value)
{
    if (value == nullptr || value->is_null()) return {};
    if (value->is_string()) return value->get<std::string>();
    if (value->is_boolean()) return value->get<bool>() ? "true" : "false";
    return value->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool truthy(const nlohmann::json* value)
{
    if (value == nullptr || value->is_null()) return false;
    if (value->is_boolean()) return value->get<bool>();
    if (value->is_string()) return !value->get<std::string>().empty();
    if (value->is_number()) return value->get<double>() != 0;
    if (value->is_array() || value->is_object()) return !value->empty();
    return true;
}

// Position of the `close` tag balancing an already consumed `open`, or npos.
std::size_t find_matching(std::string_view tpl, std::size_t from, std::string_view open, std::string_view close)
{
    int depth = 1;
    std::size_t pos = from;
    while (pos < tpl.size()) {
        const auto next_open = tpl.find(open, pos);
        const auto next_close = tpl.find(close, pos);
        if (next_close == std::string_view::npos) {
            return std::string_view::npos;
        }
        if (next_open != std::string_view::npos && next_open < next_close) {
            ++depth;
            pos = next_open + open.size();
            continue;
        }
        if (--depth == 0) {
            return next_close;
        }
        pos = next_close + close.size();
    }
    return std::string_view::npos;
}

std::string render_block(std::string_view tpl, const nlohmann::json& data)
{
    static constexpr std::array<std::string_view, 4> kTags = {"{!!", "{{", "@if(", "@foreach("};

    std::string out;
    std::size_t pos = 0;
    while (pos < tpl.size()) {
        std::size_t tag_pos = std::string_view::npos;
        std::string_view tag;
        for (auto candidate : kTags) {
            const auto p = tpl.find(candidate, pos);
            if (p < tag_pos) {
                tag_pos = p;
                tag = candidate;
            }
        }
        if (tag_pos == std::string_view::npos) {
            out.append(tpl.substr(pos));
            break;
        }
        out.append(tpl.substr(pos, tag_pos - pos));

        const auto open_end = tag_pos + tag.size();
        if (tag == "{!!" || tag == "{{") {
            const std::string_view close = tag == "{!!" ? "!!}" : "}}";
            const auto close_pos = tpl.find(close, open_end);
            if (close_pos == std::string_view::npos) {
                out.append(tpl.substr(tag_pos));
                break;
            }
            const auto value = stringify(lookup(str::trim(tpl.substr(open_end, close_pos - open_end)), data));
            out += tag == "{!!" ? value : str::html_escape(value);
            pos = close_pos + close.size();
            continue;
        }

        const auto expr_end = tpl.find(')', open_end);
        const std::string_view end_tag = tag == "@if(" ? "@endif" : "@endforeach";
        const auto body_end = expr_end == std::string_view::npos
            ? std::string_view::npos
            : find_matching(tpl, expr_end + 1, tag, end_tag);
        if (body_end == std::string_view::npos) {
            out.append(tpl.substr(tag_pos));
            break;
        }

        const auto expr = str::trim(tpl.substr(open_end, expr_end - open_end));
        const auto body = tpl.substr(expr_end + 1, body_end - expr_end - 1);

        if (tag == "@if(") {
            if (truthy(lookup(expr, data))) {
                out += render_block(body, data);
            }
        } else {
            const auto as_pos = expr.find(" as ");
            if (as_pos != std::string::npos) {
                const auto* items = lookup(str::trim(expr.substr(0, as_pos)), data);
                const auto alias = str::trim(expr.substr(as_pos + 4));
                if (items != nullptr && items->is_array()) {
                    for (const auto& item : *items) {
                        nlohmann::json scope = data.is_object() ? data : nlohmann::json::object();
                        scope[alias] = item;
                        out += render_block(body, scope);
                    }
                }
            }
        }
        pos = body_end + end_tag.size();
    }
    return out;
}

} // namespace

View::View(std::filesystem::path views_path) : views_path_(std::move(views_path)) {}

std::string View::render(const std::string& template_name, const nlohmann::json& data)
{
    // Dotted names address subdirectories: "errors.error" -> errors/error.html
    const auto relative = str::replace_all(template_name, ".", "/");
    const std::array<std::string, 3> exts = {".html", ".htm", ".page"};

    for (const auto& ext : exts) {
        const auto path = views_path_ / (relative + ext);
        if (!std::filesystem::exists(path)) {
            continue;
        }
        std::ifstream file(path);
        if (!file) {
            throw ViewNotFound("View [" + template_name + "] could not be opened at " + path.string());
        }
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        return render_string(content, data);
    }

    throw ViewNotFound("View [" + template_name + "] not found in " + views_path_.string());
}

std::string View::render_string(std::string_view tpl, const nlohmann::json& data)
{
    return render_block(tpl, data);
}

} // namespace conduit::support
