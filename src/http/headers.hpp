#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gzs::http {

bool iequals(std::string_view a, std::string_view b);

/// Ordered header list with case-insensitive names. set() replaces an
/// existing entry in place (last write wins, first position kept).
class HeaderMap {
public:
    using Entry = std::pair<std::string, std::string>;

    void set(std::string name, std::string value);
    void add(std::string name, std::string value);
    void remove(std::string_view name);

    std::optional<std::string> get(std::string_view name) const;
    bool contains(std::string_view name) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
};

} // namespace gzs::http
