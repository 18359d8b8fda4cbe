#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gzs::vfs {

/// Read-only random-access view of one ZIP file. The central directory is
/// indexed once at open; reads seek straight to the stored entry position.
/// Reads are serialized internally because the minizip handle carries the
/// current-file cursor.
class ZipArchive {
public:
    struct Entry {
        std::string name; ///< As stored in the archive
        u64 uncompressed_size = 0;
        u64 pos_in_central_dir = 0;
        u64 num_of_file = 0;
    };

    /// Open the archive and index every file entry (directories skipped).
    /// Fails with MountError if the file is missing or not a valid ZIP.
    static Result<std::unique_ptr<ZipArchive>> open(const fs::path& path);

    ~ZipArchive();

    // Non-copyable
    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    /// Look up an entry by path: exact name first, then case-insensitive.
    /// A leading '/' and backslash separators are tolerated.
    const Entry* find(std::string_view path) const;

    /// Decompress an entry returned by find().
    Result<Bytes> read(const Entry& entry) const;

    /// Stored names of all file entries, optionally filtered by a '*'
    /// suffix pattern ("*.swf") or a plain case-insensitive substring.
    std::vector<std::string> list(std::string_view pattern = {}) const;

    const fs::path& path() const { return path_; }
    size_t file_count() const { return entries_.size(); }

private:
    ZipArchive(fs::path path, void* handle) : path_(std::move(path)), handle_(handle) {}

    static std::string normalize_key(std::string_view path);
    static std::string lower(std::string_view s);

    fs::path path_;
    void* handle_ = nullptr; // unzFile from minizip
    mutable std::mutex mutex_;

    /// Entries keyed by stored name (separators normalized, no leading /).
    std::unordered_map<std::string, Entry> entries_;
    /// Lowercased key -> stored key. First entry wins on collisions.
    std::unordered_map<std::string, std::string> folded_;
};

} // namespace gzs::vfs
