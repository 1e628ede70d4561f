#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace conduit::http {

// Media ranges from an Accept header, most preferred first.
class AcceptList {
public:
    struct Entry {
        std::string media_type;
        double quality = 1.0;
    };

    AcceptList() = default;

    // Parses "text/html;q=0.9, application/json". Entries with q=0 are dropped;
    // equal qualities keep header order.
    static AcceptList parse(std::string_view header);

    // True when the top-ranked media type contains `token`, e.g. prefers("html").
    [[nodiscard]] bool prefers(std::string_view token) const;

    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
};

} // namespace conduit::http
