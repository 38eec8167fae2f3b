/**
 * @file TempFile.cpp
 * @brief Scoped temporary file implementation
 */

#include "routerkit/TempFile.hpp"
#include "routerkit/Errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

namespace routerkit {

namespace {
    void write_file(const std::string& path, const std::string& contents, std::ios::openmode mode) {
        std::ofstream ofs(path, std::ios::binary | mode);
        if (!ofs) {
            throw RouterKitError("Cannot open temporary file for writing: " + path);
        }
        ofs << contents;
        ofs.flush();
        if (!ofs) {
            throw RouterKitError("Write failed for temporary file: " + path);
        }
    }
}

TempFile::TempFile(const std::string& prefix, const std::string& suffix) {
    std::string pattern = (fs::temp_directory_path() / (prefix + "-XXXXXX")).string() + suffix;
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    const int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        throw RouterKitError("Unable to create temporary file " + pattern + ": " + std::strerror(errno));
    }
    ::close(fd);
    path_ = buf.data();
}

TempFile TempFile::copy_of(const std::string& source, const std::string& prefix) {
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        throw FileNotFoundError(source);
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    TempFile copy(prefix);
    copy.write(ss.str());
    return copy;
}

TempFile::~TempFile() {
    release();
}

TempFile::TempFile(TempFile&& other) noexcept
    : path_(std::move(other.path_))
{
    other.path_.clear();
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void TempFile::write(const std::string& contents) const {
    write_file(path_, contents, std::ios::trunc);
}

void TempFile::append(const std::string& contents) const {
    write_file(path_, contents, std::ios::app);
}

void TempFile::release() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(path_, ec);
    path_.clear();
}

} // namespace routerkit
