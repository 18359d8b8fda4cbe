#pragma once

#include "cgi/cgi_types.hpp"

#include <string_view>

namespace gzs::cgi {

struct ParsedOutput {
    CgiResponse response;
    bool has_header_block = false; ///< A blank line separated headers from body
};

/// Split raw script output into status, headers and body.
///
/// The header block ends at the first "\r\n\r\n" or "\n\n", whichever
/// comes first. Without one, the whole output becomes a text/html body.
/// "Status: 404 Not Found" sets the status; "Location" without "Status"
/// means 302. Repeated header names keep the last value.
ParsedOutput parse_cgi_output(std::string_view output);

} // namespace gzs::cgi
