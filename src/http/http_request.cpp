#include "http/http_request.hpp"

namespace gzs::http {

bool HttpRequest::keep_alive() const {
    auto connection = headers.get("Connection");
    if (version == "HTTP/1.0") {
        return connection && iequals(*connection, "keep-alive");
    }
    return !connection || !iequals(*connection, "close");
}

} // namespace gzs::http
