#include "http/headers.hpp"

#include <algorithm>
#include <cctype>

namespace gzs::http {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

void HeaderMap::set(std::string name, std::string value) {
    for (auto& entry : entries_) {
        if (iequals(entry.first, name)) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(std::move(name), std::move(value));
}

void HeaderMap::add(std::string name, std::string value) {
    entries_.emplace_back(std::move(name), std::move(value));
}

void HeaderMap::remove(std::string_view name) {
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const Entry& e) { return iequals(e.first, name); }),
                   entries_.end());
}

std::optional<std::string> HeaderMap::get(std::string_view name) const {
    for (const auto& entry : entries_) {
        if (iequals(entry.first, name)) {
            return entry.second;
        }
    }
    return std::nullopt;
}

bool HeaderMap::contains(std::string_view name) const {
    return get(name).has_value();
}

} // namespace gzs::http
