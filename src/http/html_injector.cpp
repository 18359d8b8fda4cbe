#include "http/html_injector.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <spdlog/spdlog.h>

namespace gzs::http {

namespace {

// Stubs for the globals Unity WebGL loaders call before their runtime exists
constexpr std::string_view kUnityPolyfills = R"(
<script>
window.UnityProgress = window.UnityProgress || function(gameInstance, progress) {
  if (!gameInstance.Module) return;
  if (!gameInstance.progress) {
    gameInstance.progress = { loaded: 0, total: 1 };
  }
  gameInstance.progress.loaded = progress;
  if (progress === 1) {
    console.log('[Unity] Game loaded successfully');
  }
};

window.createUnityInstance = window.createUnityInstance || function(canvas, config) {
  return new Promise((resolve) => {
    console.log('[Unity] createUnityInstance called - using polyfill');
    resolve({
      Module: {},
      SetFullscreen: function() {},
      SendMessage: function() {},
      Quit: function() { return Promise.resolve(); }
    });
  });
};

if (typeof UnityLoader2020 === 'undefined') {
  window.UnityLoader2020 = {
    Error: {
      handler: function(message, filename, lineno) {
        console.warn('[Unity] Error:', message, 'at', filename + ':' + lineno);
        return true;
      }
    }
  };
}
</script>
)";

constexpr std::string_view kGeneralPolyfills = R"(
<script>
if (typeof window.external === 'undefined') {
  window.external = {};
}

if (typeof AudioContext === 'undefined' && typeof webkitAudioContext !== 'undefined') {
  window.AudioContext = webkitAudioContext;
}
</script>
)";

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Lowercase markers; any one of them means a Unity page
constexpr std::array<std::string_view, 5> kUnityMarkers = {
    "unityprogress", "unityloader", "createunityinstance", "unityframework.js",
    "unityengine",
};

/// "build/" followed by ".loader.js" on the same line.
bool has_build_loader(std::string_view lower) {
    size_t pos = 0;
    while ((pos = lower.find("build/", pos)) != std::string_view::npos) {
        auto loader = lower.find(".loader.js", pos + 6);
        if (loader == std::string_view::npos) {
            return false;
        }
        auto eol = lower.find_first_of("\r\n", pos);
        if (eol == std::string_view::npos || loader < eol) {
            return true;
        }
        pos = eol;
    }
    return false;
}

/// Position just past the first "<name>" or "<name attrs...>" tag, or npos.
/// "<header>" does not count as "<head".
size_t find_tag_end(std::string_view lower, std::string_view open) {
    size_t pos = 0;
    while ((pos = lower.find(open, pos)) != std::string_view::npos) {
        auto next = pos + open.size();
        if (next >= lower.size()) {
            return std::string_view::npos;
        }
        if (lower[next] == '>') {
            return next + 1;
        }
        if (is_space(lower[next])) {
            auto close = lower.find('>', next);
            return close == std::string_view::npos ? close : close + 1;
        }
        pos = next;
    }
    return std::string_view::npos;
}

} // namespace

bool needs_unity_polyfills(std::string_view html) {
    auto lower = to_lower(html);
    for (auto marker : kUnityMarkers) {
        if (lower.find(marker) != std::string::npos) {
            return true;
        }
    }
    return has_build_loader(lower);
}

std::string inject_polyfills(std::string_view html) {
    if (html.find("<html") == std::string_view::npos &&
        html.find("<head") == std::string_view::npos) {
        return std::string(html);
    }

    std::string scripts;
    if (needs_unity_polyfills(html)) {
        spdlog::debug("[HTMLInjector] Injecting Unity WebGL polyfills");
        scripts += kUnityPolyfills;
    }
    scripts += kGeneralPolyfills;

    auto lower = to_lower(html);
    std::string out;
    if (auto insert_at = find_tag_end(lower, "<head"); insert_at != std::string::npos) {
        out.reserve(html.size() + scripts.size());
        out.append(html.substr(0, insert_at));
        out += scripts;
        out.append(html.substr(insert_at));
    } else if (insert_at = find_tag_end(lower, "<html"); insert_at != std::string::npos) {
        out.reserve(html.size() + scripts.size() + 13);
        out.append(html.substr(0, insert_at));
        out += "<head>";
        out += scripts;
        out += "</head>";
        out.append(html.substr(insert_at));
    } else {
        // "<html" or "<head" present but never closed into a tag
        out = "<!DOCTYPE html><html><head>";
        out += scripts;
        out += "</head><body>";
        out.append(html);
        out += "</body></html>";
    }
    return out;
}

} // namespace gzs::http
