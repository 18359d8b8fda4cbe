#include "http/url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>

namespace gzs::http {

namespace {

bool starts_with_icase(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) {
            return false;
        }
    }
    return true;
}

} // namespace

Result<Url> parse_absolute_url(std::string_view url) {
    std::string_view rest;
    if (starts_with_icase(url, "http://")) {
        rest = url.substr(7);
    } else if (starts_with_icase(url, "https://")) {
        rest = url.substr(8);
    } else {
        return Error(ErrorKind::InvalidInput, "Invalid URL: unsupported scheme");
    }

    if (auto hash = rest.find('#'); hash != std::string_view::npos) {
        rest = rest.substr(0, hash);
    }

    auto authority_end = rest.find_first_of("/?");
    auto authority = rest.substr(0, authority_end);
    auto target = authority_end == std::string_view::npos
                      ? std::string_view{}
                      : rest.substr(authority_end);

    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    std::string_view host = authority;
    std::string_view port_text;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return Error(ErrorKind::InvalidInput, "Invalid URL: unterminated IPv6 host");
        }
        host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            port_text = authority.substr(close + 2);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port_text = authority.substr(colon + 1);
    }

    if (host.empty()) {
        return Error(ErrorKind::InvalidInput, "Invalid URL: missing host");
    }

    Url out = split_target(target.empty() ? std::string_view("/") : target);
    if (out.path.empty() || out.path.front() != '/') {
        out.path.insert(out.path.begin(), '/');
    }
    out.hostname.assign(host);
    std::transform(out.hostname.begin(), out.hostname.end(), out.hostname.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (!port_text.empty()) {
        u16 port = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(),
                                         port_text.data() + port_text.size(), port);
        if (ec != std::errc() || ptr != port_text.data() + port_text.size()) {
            return Error(ErrorKind::InvalidInput, "Invalid URL: bad port");
        }
        out.port = port;
    }
    return out;
}

Url split_target(std::string_view target) {
    Url out;
    auto q = target.find('?');
    out.path.assign(target.substr(0, q));
    if (q != std::string_view::npos) {
        out.query.assign(target.substr(q + 1));
    }
    return out;
}

std::string strip_port(std::string_view host) {
    if (!host.empty() && host.front() == '[') {
        auto close = host.find(']');
        return std::string(host.substr(1, close == std::string_view::npos
                                              ? std::string_view::npos
                                              : close - 1));
    }
    return std::string(host.substr(0, host.find(':')));
}

std::string normalize_path(std::string_view path) {
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string_view::npos) end = path.size();
        auto segment = path.substr(start, end - start);
        if (segment.empty() || segment == ".") {
            // skip
        } else if (segment == "..") {
            if (!segments.empty()) segments.pop_back();
        } else {
            segments.push_back(segment);
        }
        start = end + 1;
    }

    std::string result;
    for (auto segment : segments) {
        if (!result.empty()) result += '/';
        result.append(segment);
    }
    return result;
}

} // namespace gzs::http
