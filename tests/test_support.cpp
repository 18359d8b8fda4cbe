#include "test_support.hpp"

#include <atomic>
#include <fstream>
#include <minizip/zip.h>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace gzs::test {

TempDir::TempDir() {
    static std::atomic<int> counter{0};
    path_ = fs::temp_directory_path() /
            ("gzs_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
    fs::remove_all(path_);
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void write_file(const fs::path& path, const std::string& contents) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << contents;
    if (!out) {
        throw std::runtime_error("cannot write " + path.string());
    }
}

std::string read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void make_zip(const fs::path& path,
              const std::vector<std::pair<std::string, std::string>>& entries) {
    fs::create_directories(path.parent_path());
    zipFile zf = zipOpen(path.string().c_str(), APPEND_STATUS_CREATE);
    if (!zf) {
        throw std::runtime_error("zipOpen failed for " + path.string());
    }
    for (const auto& [name, data] : entries) {
        zip_fileinfo info{};
        int ret = zipOpenNewFileInZip(zf, name.c_str(), &info, nullptr, 0, nullptr, 0,
                                      nullptr, Z_DEFLATED, Z_DEFAULT_COMPRESSION);
        if (ret == ZIP_OK && !data.empty()) {
            ret = zipWriteInFileInZip(zf, data.data(), static_cast<unsigned>(data.size()));
        }
        if (ret == ZIP_OK) {
            ret = zipCloseFileInZip(zf);
        }
        if (ret != ZIP_OK) {
            zipClose(zf, nullptr);
            throw std::runtime_error("cannot add " + name + " to " + path.string());
        }
    }
    if (zipClose(zf, nullptr) != ZIP_OK) {
        throw std::runtime_error("zipClose failed for " + path.string());
    }
}

void write_script(const fs::path& path, const std::string& body) {
    write_file(path, body);
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
}

std::string to_string(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

Bytes to_bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

} // namespace gzs::test
