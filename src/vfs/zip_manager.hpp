#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "vfs/zip_archive.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gzs::vfs {

struct MountInfo {
    std::string id;
    fs::path zip_path;
    std::chrono::system_clock::time_point mount_time;
    size_t file_count = 0;
};

struct FoundFile {
    Bytes data;
    std::string mount_id;
    std::string entry_path; ///< Entry name inside the archive
};

/// Maps a "<host>/<path>" request path to a candidate archive entry path.
using PathFormatter = std::string (*)(std::string_view rel_path);

/// Registry of mounted archives. Archives are searched in mount order
/// (first-mounted-wins), and within each archive every path convention in
/// path_variants() is tried in order.
///
/// Thread-safe: lookups hold a shared lock only long enough to snapshot the
/// registry, mount/unmount of one id are serialized by a per-id mutex, and
/// each archive serializes its own reads.
class ZipManager {
public:
    explicit ZipManager(u64 max_buffered_file_size = 50 * MiB)
        : max_buffered_file_size_(max_buffered_file_size) {}

    // Non-copyable
    ZipManager(const ZipManager&) = delete;
    ZipManager& operator=(const ZipManager&) = delete;

    /// Open and register an archive. Mounting an id that is already mounted
    /// succeeds without touching the existing mount. Fails with MountError
    /// for a missing or corrupt archive, or once unmount_all() has run.
    Result<void> mount(const std::string& id, const fs::path& zip_path);

    /// Close and forget an archive. False if id was not mounted.
    bool unmount(const std::string& id);

    /// Search all mounts for "<host>/<path>".
    std::optional<FoundFile> find_file(std::string_view rel_path) const;

    /// Read one entry from one mount, path taken literally.
    std::optional<Bytes> read_file(const std::string& id, std::string_view path) const;

    /// Entry names of one mount, filtered like ZipArchive::list().
    std::vector<std::string> list_files(const std::string& id,
                                        std::string_view pattern = {}) const;

    std::vector<MountInfo> list_mounts() const;
    bool is_mounted(const std::string& id) const;
    size_t mount_count() const;

    /// Close every archive and refuse further mounts.
    void unmount_all();

    /// Archive layouts seen in the wild, most common first:
    /// content/<p>, htdocs/<p>, <p>, Legacy/htdocs/<p>.
    static const std::vector<PathFormatter>& path_variants();

private:
    struct MountedArchive {
        std::string id;
        fs::path zip_path;
        std::chrono::system_clock::time_point mounted_at;
        std::unique_ptr<ZipArchive> archive;
    };
    using MountPtr = std::shared_ptr<const MountedArchive>;

    MountPtr lookup(const std::string& id) const;
    std::vector<MountPtr> snapshot() const;
    Result<void> mount_locked(const std::string& id, const fs::path& zip_path);
    bool unmount_locked(const std::string& id);

    std::shared_ptr<std::mutex> id_lock(const std::string& id);
    /// Drop the per-id mutex once no other caller holds it.
    void release_id_lock(const std::string& id);

    /// Read entry unless it is over the buffering cap or corrupt.
    std::optional<Bytes> read_entry(const MountedArchive& mount,
                                    const ZipArchive::Entry& entry) const;

    u64 max_buffered_file_size_;

    mutable std::shared_mutex mutex_;
    std::vector<MountPtr> mounts_; ///< In mount order

    std::mutex id_locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> id_locks_;

    std::atomic<bool> shutting_down_{false};
};

} // namespace gzs::vfs
