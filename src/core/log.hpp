#pragma once

#include <filesystem>
#include <string_view>
#include <spdlog/spdlog.h>

namespace gzs::log {

/// Initialize logging with a console sink and, when log_file is non-empty,
/// a file sink. level is an spdlog level name ("debug", "info", ...).
void init(const std::filesystem::path& log_file = {},
          std::string_view level = "info");

/// Flush and shutdown logging.
void shutdown();

} // namespace gzs::log
