#include "cgi/cgi_environment.hpp"

#include <cctype>
#include <spdlog/spdlog.h>

namespace gzs::cgi {

namespace {

/// CR, LF and NUL would split or truncate an environment entry
std::string clean_value(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c != '\r' && c != '\n' && c != '\0') out += c;
    }
    return out;
}

std::string to_upper(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

std::string sanitize_query_string(std::string_view query) {
    std::string out;
    size_t start = 0;
    while (start <= query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string_view::npos) end = query.size();
        auto param = query.substr(start, end - start);
        start = end + 1;

        if (param.empty()) continue;
        if (param.find('=') == std::string_view::npos) {
            bool dash = param.front() == '-' ||
                        (param.size() >= 3 && param[0] == '%' && param[1] == '2' &&
                         (param[2] == 'd' || param[2] == 'D'));
            if (dash) {
                spdlog::warn("[CGI] Dropped query parameter that looks like a switch");
                continue;
            }
        }
        if (!out.empty()) out += '&';
        out.append(param);
    }
    return out;
}

std::string header_variable_name(std::string_view header) {
    if (header.empty()) return {};
    std::string out = "HTTP_";
    for (char c : header) {
        auto uc = static_cast<unsigned char>(c);
        if (c == '-' || c == '_') {
            out += '_';
        } else if (std::isalnum(uc)) {
            out += static_cast<char>(std::toupper(uc));
        } else {
            return {};
        }
    }
    return out;
}

CgiEnvironment build_cgi_environment(const fs::path& script_path,
                                     const CgiRequest& request,
                                     const CgiConfig& config) {
    const auto& url = request.url;
    auto query = sanitize_query_string(url.query);
    auto script = script_path.string();

    CgiEnvironment env;
    // Required by php-cgi's force-redirect check
    env["REDIRECT_STATUS"] = "CGI";

    env["GATEWAY_INTERFACE"] = "CGI/1.1";
    env["SERVER_SOFTWARE"] = config.server_software;
    env["SERVER_PROTOCOL"] = "HTTP/1.1";
    env["SERVER_NAME"] = url.hostname.empty() ? "localhost" : clean_value(url.hostname);
    env["SERVER_PORT"] = std::to_string(url.port.value_or(80));

    env["REQUEST_METHOD"] = to_upper(clean_value(request.method));
    env["REQUEST_URI"] = clean_value(query.empty() ? url.path : url.path + "?" + query);
    env["SCRIPT_NAME"] = clean_value(url.path);
    env["SCRIPT_FILENAME"] = script;
    env["PATH_INFO"] = "";
    env["PATH_TRANSLATED"] = script;
    env["QUERY_STRING"] = clean_value(query);
    env["DOCUMENT_ROOT"] = config.document_root.string();

    env["REMOTE_ADDR"] = request.remote_addr.empty() ? "127.0.0.1"
                                                     : clean_value(request.remote_addr);
    env["REMOTE_HOST"] = "localhost";

    if (request.body && !request.body->empty()) {
        env["CONTENT_LENGTH"] = std::to_string(request.body->size());
        auto type = request.headers.get("Content-Type");
        env["CONTENT_TYPE"] = type ? clean_value(*type)
                                   : "application/x-www-form-urlencoded";
    }

    for (const auto& [name, value] : request.headers) {
        if (http::iequals(name, "Content-Type") || http::iequals(name, "Content-Length")) {
            continue;
        }
        // httpoxy: HTTP_PROXY would be read as an outbound proxy setting
        if (http::iequals(name, "Proxy")) {
            continue;
        }
        auto var = header_variable_name(name);
        if (var.empty()) {
            spdlog::debug("[CGI] Skipping header with invalid name");
            continue;
        }
        // Repeated headers are joined with ", "
        auto [it, inserted] = env.try_emplace(var, clean_value(value));
        if (!inserted) {
            it->second += ", " + clean_value(value);
        }
    }

    return env;
}

} // namespace gzs::cgi
