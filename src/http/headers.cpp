#include <conduit/http/headers.hpp>
#include <conduit/support/str.hpp>

#include <algorithm>

namespace conduit::http {

Headers::Headers(std::initializer_list<Field> fields)
{
    for (const auto& [name, value] : fields) {
        set(name, value);
    }
}

void Headers::set(std::string name, std::string value)
{
    auto it = find(name);
    if (it != fields_.end()) {
        it->second = std::move(value);
        return;
    }
    fields_.emplace_back(std::move(name), std::move(value));
}

void Headers::append(std::string name, std::string value)
{
    auto it = find(name);
    if (it == fields_.end()) {
        fields_.emplace_back(std::move(name), std::move(value));
        return;
    }
    it->second += ", ";
    it->second += value;
}

bool Headers::remove(std::string_view name)
{
    auto it = find(name);
    if (it == fields_.end()) {
        return false;
    }
    fields_.erase(it);
    return true;
}

std::optional<std::string> Headers::get(std::string_view name) const
{
    auto it = find(name);
    if (it == fields_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Headers::get_or(std::string_view name, std::string fallback) const
{
    auto it = find(name);
    return it != fields_.end() ? it->second : fallback;
}

bool Headers::contains(std::string_view name) const
{
    return find(name) != fields_.end();
}

std::vector<Headers::Field>::iterator Headers::find(std::string_view name)
{
    return std::find_if(fields_.begin(), fields_.end(), [name](const Field& f) {
        return support::str::iequals(f.first, name);
    });
}

std::vector<Headers::Field>::const_iterator Headers::find(std::string_view name) const
{
    return std::find_if(fields_.begin(), fields_.end(), [name](const Field& f) {
        return support::str::iequals(f.first, name);
    });
}

bool operator==(const Headers& lhs, const Headers& rhs)
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    return std::all_of(lhs.begin(), lhs.end(), [&rhs](const Headers::Field& f) {
        auto other = rhs.get(f.first);
        return other && *other == f.second;
    });
}

} // namespace conduit::http
