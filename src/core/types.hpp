#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace gzs {

namespace fs = std::filesystem;

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i32 = int32_t;
using i64 = int64_t;

/// Raw file or message payload.
using Bytes = std::vector<char>;

constexpr u64 KiB = 1024;
constexpr u64 MiB = 1024 * KiB;

} // namespace gzs
