#include <conduit/http/accept.hpp>
#include <conduit/support/str.hpp>

#include <algorithm>
#include <cstdlib>

namespace conduit::http {

namespace str = support::str;

AcceptList AcceptList::parse(std::string_view header)
{
    AcceptList list;
    for (const auto& range : str::split(header, ',')) {
        auto params = str::split(range, ';');
        Entry entry{str::to_lower(str::trim(params.front())), 1.0};
        if (entry.media_type.empty()) {
            continue;
        }

        for (std::size_t i = 1; i < params.size(); ++i) {
            auto param = str::trim(params[i]);
            if (param.size() > 2 && (param[0] == 'q' || param[0] == 'Q') && param[1] == '=') {
                char* end = nullptr;
                const double q = std::strtod(param.c_str() + 2, &end);
                if (end != param.c_str() + 2) {
                    entry.quality = std::clamp(q, 0.0, 1.0);
                }
            }
        }

        if (entry.quality > 0.0) {
            list.entries_.push_back(std::move(entry));
        }
    }

    std::stable_sort(list.entries_.begin(), list.entries_.end(), [](const Entry& a, const Entry& b) {
        return a.quality > b.quality;
    });
    return list;
}

bool AcceptList::prefers(std::string_view token) const
{
    if (entries_.empty()) {
        return false;
    }
    return str::icontains(entries_.front().media_type, token);
}

} // namespace conduit::http
