#include "vfs/zip_manager.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace gzs::vfs {

const std::vector<PathFormatter>& ZipManager::path_variants() {
    static const std::vector<PathFormatter> variants = {
        [](std::string_view p) { return "content/" + std::string(p); },
        [](std::string_view p) { return "htdocs/" + std::string(p); },
        [](std::string_view p) { return std::string(p); },
        [](std::string_view p) { return "Legacy/htdocs/" + std::string(p); },
    };
    return variants;
}

std::shared_ptr<std::mutex> ZipManager::id_lock(const std::string& id) {
    std::lock_guard lock(id_locks_mutex_);
    auto& slot = id_locks_[id];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

void ZipManager::release_id_lock(const std::string& id) {
    std::lock_guard lock(id_locks_mutex_);
    auto it = id_locks_.find(id);
    // One reference held by the map, one by the caller
    if (it != id_locks_.end() && it->second.use_count() <= 2) {
        id_locks_.erase(it);
    }
}

ZipManager::MountPtr ZipManager::lookup(const std::string& id) const {
    std::shared_lock lock(mutex_);
    for (const auto& mount : mounts_) {
        if (mount->id == id) return mount;
    }
    return nullptr;
}

std::vector<ZipManager::MountPtr> ZipManager::snapshot() const {
    std::shared_lock lock(mutex_);
    return mounts_;
}

Result<void> ZipManager::mount(const std::string& id, const fs::path& zip_path) {
    if (shutting_down_) {
        return Error(ErrorKind::MountError, "ZIP manager is shutting down");
    }

    auto id_mutex = id_lock(id);
    Result<void> result;
    {
        std::lock_guard guard(*id_mutex);
        result = mount_locked(id, zip_path);
    }
    release_id_lock(id);
    return result;
}

Result<void> ZipManager::mount_locked(const std::string& id, const fs::path& zip_path) {
    if (lookup(id)) {
        spdlog::debug("[ZipManager] ZIP already mounted: {}", id);
        return {};
    }

    spdlog::info("[ZipManager] Mounting ZIP: {} -> {}", id, zip_path.string());
    auto archive = ZipArchive::open(zip_path);
    if (!archive) {
        spdlog::error("[ZipManager] {}", archive.error().message);
        return archive.error();
    }

    auto mount = std::make_shared<MountedArchive>();
    mount->id = id;
    mount->zip_path = zip_path;
    mount->mounted_at = std::chrono::system_clock::now();
    mount->archive = archive.take();
    size_t files = mount->archive->file_count();

    {
        std::unique_lock lock(mutex_);
        // unmount_all() may have run while the archive was being indexed
        if (shutting_down_) {
            return Error(ErrorKind::MountError, "ZIP manager is shutting down");
        }
        mounts_.push_back(std::move(mount));
    }

    spdlog::info("[ZipManager] Mounted ZIP: {} ({} files)", id, files);
    return {};
}

bool ZipManager::unmount(const std::string& id) {
    auto id_mutex = id_lock(id);
    bool removed = false;
    {
        std::lock_guard guard(*id_mutex);
        removed = unmount_locked(id);
    }
    release_id_lock(id);
    return removed;
}

bool ZipManager::unmount_locked(const std::string& id) {
    MountPtr removed;
    {
        std::unique_lock lock(mutex_);
        auto it = std::find_if(mounts_.begin(), mounts_.end(),
                               [&](const MountPtr& m) { return m->id == id; });
        if (it == mounts_.end()) {
            spdlog::warn("[ZipManager] ZIP not mounted: {}", id);
            return false;
        }
        removed = std::move(*it);
        mounts_.erase(it);
    }
    // The archive closes when the last in-flight reader releases it
    spdlog::info("[ZipManager] Unmounted ZIP: {}", id);
    return true;
}

std::optional<Bytes> ZipManager::read_entry(const MountedArchive& mount,
                                            const ZipArchive::Entry& entry) const {
    if (entry.uncompressed_size > max_buffered_file_size_) {
        spdlog::warn("[ZipManager] Skipping {}:{} ({} bytes exceeds buffer limit)",
                     mount.id, entry.name, entry.uncompressed_size);
        return std::nullopt;
    }
    auto data = mount.archive->read(entry);
    if (!data) {
        spdlog::warn("[ZipManager] {} in {}", data.error().message, mount.id);
        return std::nullopt;
    }
    return data.take();
}

std::optional<FoundFile> ZipManager::find_file(std::string_view rel_path) const {
    for (const auto& mount : snapshot()) {
        for (auto format : path_variants()) {
            auto candidate = format(rel_path);
            const auto* entry = mount->archive->find(candidate);
            if (!entry) continue;

            auto data = read_entry(*mount, *entry);
            if (!data) continue;

            spdlog::debug("[ZipManager] Found in {}: {}", mount->id, entry->name);
            return FoundFile{std::move(*data), mount->id, entry->name};
        }
    }
    return std::nullopt;
}

std::optional<Bytes> ZipManager::read_file(const std::string& id,
                                           std::string_view path) const {
    auto mount = lookup(id);
    if (!mount) {
        spdlog::debug("[ZipManager] ZIP not mounted: {}", id);
        return std::nullopt;
    }
    const auto* entry = mount->archive->find(path);
    if (!entry) {
        return std::nullopt;
    }
    return read_entry(*mount, *entry);
}

std::vector<std::string> ZipManager::list_files(const std::string& id,
                                                std::string_view pattern) const {
    auto mount = lookup(id);
    if (!mount) return {};
    return mount->archive->list(pattern);
}

std::vector<MountInfo> ZipManager::list_mounts() const {
    std::vector<MountInfo> result;
    for (const auto& mount : snapshot()) {
        result.push_back({mount->id, mount->zip_path, mount->mounted_at,
                          mount->archive->file_count()});
    }
    return result;
}

bool ZipManager::is_mounted(const std::string& id) const {
    return lookup(id) != nullptr;
}

size_t ZipManager::mount_count() const {
    std::shared_lock lock(mutex_);
    return mounts_.size();
}

void ZipManager::unmount_all() {
    shutting_down_ = true;

    std::vector<MountPtr> closing;
    {
        std::unique_lock lock(mutex_);
        closing.swap(mounts_);
    }
    spdlog::info("[ZipManager] Unmounting all ZIPs ({})...", closing.size());
    closing.clear();
    spdlog::info("[ZipManager] All ZIPs unmounted");
}

} // namespace gzs::vfs
