#include <conduit/http/protocol.hpp>

namespace conduit::http {

Method normalize_method(Request& request)
{
    if (auto override_method = request.field(kMethodOverrideField); override_method && !override_method->empty()) {
        request.set_method(*override_method);
    }

    const Method original = request.method();
    if (original == Method::Head) {
        request.set_method(Method::Get);
    }
    return original;
}

void finalize_response(Method original_method, Response& response)
{
    if (original_method == Method::Head) {
        response.clear_body();
    }
}

} // namespace conduit::http
