#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace conduit::http {

// Header fields with case-insensitive names. Insertion order is preserved and the
// spelling of the first set() for a name is the one written on the wire.
class Headers {
public:
    using Field = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Field>::const_iterator;

    Headers() = default;
    Headers(std::initializer_list<Field> fields);

    void set(std::string name, std::string value);
    void append(std::string name, std::string value);
    bool remove(std::string_view name);

    [[nodiscard]] std::optional<std::string> get(std::string_view name) const;
    [[nodiscard]] std::string get_or(std::string_view name, std::string fallback = {}) const;
    [[nodiscard]] bool contains(std::string_view name) const;

    [[nodiscard]] std::size_t size() const { return fields_.size(); }
    [[nodiscard]] bool empty() const { return fields_.empty(); }
    [[nodiscard]] const_iterator begin() const { return fields_.begin(); }
    [[nodiscard]] const_iterator end() const { return fields_.end(); }

    // Order-insensitive, name-case-insensitive comparison.
    friend bool operator==(const Headers& lhs, const Headers& rhs);

private:
    [[nodiscard]] std::vector<Field>::iterator find(std::string_view name);
    [[nodiscard]] std::vector<Field>::const_iterator find(std::string_view name) const;

    std::vector<Field> fields_;
};

} // namespace conduit::http
