#include "vfs/zip_archive.hpp"

#include <algorithm>
#include <cctype>
#include <minizip/unzip.h>
#include <spdlog/spdlog.h>

namespace gzs::vfs {

std::string ZipArchive::normalize_key(std::string_view path) {
    std::string result(path);
    std::replace(result.begin(), result.end(), '\\', '/');
    while (!result.empty() && result[0] == '/') {
        result.erase(0, 1);
    }
    return result;
}

std::string ZipArchive::lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

Result<std::unique_ptr<ZipArchive>> ZipArchive::open(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Error(ErrorKind::MountError,
                     "ZIP file not found: " + path.string());
    }

    unzFile handle = unzOpen(path.string().c_str());
    if (!handle) {
        return Error(ErrorKind::MountError,
                     "Failed to open ZIP archive: " + path.string());
    }
    std::unique_ptr<ZipArchive> archive(new ZipArchive(path, handle));

    // Read central directory
    int ret = unzGoToFirstFile(handle);
    while (ret == UNZ_OK) {
        unz_file_info file_info;
        if (unzGetCurrentFileInfo(handle, &file_info, nullptr, 0, nullptr, 0,
                                  nullptr, 0) != UNZ_OK) {
            return Error(ErrorKind::MountError,
                         "Corrupt central directory in " + path.string());
        }
        std::string name(file_info.size_filename, '\0');
        if (unzGetCurrentFileInfo(handle, &file_info, name.data(),
                                  static_cast<uLong>(name.size()), nullptr, 0,
                                  nullptr, 0) != UNZ_OK) {
            return Error(ErrorKind::MountError,
                         "Corrupt central directory in " + path.string());
        }

        // Skip directories (entries ending with /)
        if (!name.empty() && name.back() != '/' && name.back() != '\\') {
            unz_file_pos pos;
            if (unzGetFilePos(handle, &pos) != UNZ_OK) {
                return Error(ErrorKind::MountError,
                             "Corrupt central directory in " + path.string());
            }

            Entry entry;
            entry.name = name;
            entry.uncompressed_size = file_info.uncompressed_size;
            entry.pos_in_central_dir = pos.pos_in_zip_directory;
            entry.num_of_file = pos.num_of_file;

            auto key = normalize_key(name);
            archive->folded_.emplace(lower(key), key);
            archive->entries_.emplace(std::move(key), std::move(entry));
        }

        ret = unzGoToNextFile(handle);
    }
    if (ret != UNZ_END_OF_LIST_OF_FILE) {
        return Error(ErrorKind::MountError,
                     "Corrupt central directory in " + path.string());
    }

    spdlog::debug("[ZipArchive] {}: {} files indexed",
                  path.filename().string(), archive->entries_.size());
    return archive;
}

ZipArchive::~ZipArchive() {
    if (handle_) {
        unzClose(static_cast<unzFile>(handle_));
    }
}

const ZipArchive::Entry* ZipArchive::find(std::string_view path) const {
    auto key = normalize_key(path);
    if (auto it = entries_.find(key); it != entries_.end()) {
        return &it->second;
    }
    auto folded = folded_.find(lower(key));
    if (folded == folded_.end()) {
        return nullptr;
    }
    return &entries_.at(folded->second);
}

std::vector<std::string> ZipArchive::list(std::string_view pattern) const {
    std::vector<std::string> results;

    auto pat = lower(pattern);
    bool suffix_match = !pat.empty() && pat[0] == '*';
    if (suffix_match) {
        pat.erase(0, 1);
    }

    for (const auto& [key, entry] : entries_) {
        auto folded = lower(key);
        bool match = false;
        if (pat.empty()) {
            match = true;
        } else if (suffix_match) {
            match = folded.size() >= pat.size() &&
                    folded.compare(folded.size() - pat.size(), pat.size(), pat) == 0;
        } else {
            match = folded.find(pat) != std::string::npos;
        }
        if (match) {
            results.push_back(entry.name);
        }
    }

    std::sort(results.begin(), results.end());
    return results;
}

Result<Bytes> ZipArchive::read(const Entry& entry) const {
    std::lock_guard lock(mutex_);
    auto handle = static_cast<unzFile>(handle_);

    unz_file_pos pos;
    pos.pos_in_zip_directory = static_cast<uLong>(entry.pos_in_central_dir);
    pos.num_of_file = static_cast<uLong>(entry.num_of_file);
    if (unzGoToFilePos(handle, &pos) != UNZ_OK) {
        return Error(ErrorKind::Internal, "Cannot seek to entry " + entry.name);
    }
    if (unzOpenCurrentFile(handle) != UNZ_OK) {
        return Error(ErrorKind::Internal, "Cannot open entry " + entry.name);
    }

    Bytes buffer(entry.uncompressed_size);
    u64 total = 0;
    while (total < buffer.size()) {
        auto chunk = static_cast<unsigned>(
            std::min<u64>(buffer.size() - total, 1 * MiB));
        int n = unzReadCurrentFile(handle, buffer.data() + total, chunk);
        if (n <= 0) break;
        total += static_cast<u64>(n);
    }
    // Also verifies the CRC once the whole entry has been consumed
    int close_ret = unzCloseCurrentFile(handle);

    if (total != entry.uncompressed_size || close_ret != UNZ_OK) {
        return Error(ErrorKind::Internal, "Corrupt entry " + entry.name);
    }
    return buffer;
}

} // namespace gzs::vfs
