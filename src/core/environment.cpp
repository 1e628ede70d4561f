#include <conduit/core/environment.hpp>
#include <conduit/support/str.hpp>

namespace conduit::core {

Environment Environment::parse(std::string_view name)
{
    const auto lower = support::str::to_lower(support::str::trim(name));
    if (lower == "prod" || lower == "production") {
        return production();
    }
    if (lower.empty() || lower == "dev" || lower == "development" || lower == "local") {
        return development();
    }
    if (lower == "test" || lower == "testing") {
        return testing();
    }
    return custom(lower);
}

} // namespace conduit::core
