#include "runtime/temp_source_file.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace snipexec::runtime {

using core::errors::ErrorCategory;
using core::errors::ExecError;

namespace {

bool write_all(const int fd, const std::string& data) {
    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

}  // namespace

TempSourceFile::TempSourceFile(std::filesystem::path path) : path_(std::move(path)) {}

TempSourceFile::TempSourceFile(TempSourceFile&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempSourceFile& TempSourceFile::operator=(TempSourceFile&& other) noexcept {
    if (this != &other) {
        remove_now();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

TempSourceFile::~TempSourceFile() {
    remove_now();
}

void TempSourceFile::remove_now() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        LOG_WARN("TempSourceFile: failed to remove " + path_.string() + ": " +
                 ec.message());
    }
    path_.clear();
}

core::errors::Result<TempSourceFile> TempSourceFile::create(
    const std::filesystem::path& directory, const std::string& contents,
    const std::string& suffix) {
    std::error_code ec;
    std::filesystem::path dir = directory;
    if (dir.empty()) {
        dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            return ExecError{ErrorCategory::Internal,
                             "Unable to locate a temporary directory: " + ec.message(),
                             "temp_dir_unavailable"};
        }
    }

    // mkstemps fills in the X's and creates the file with O_EXCL, so two
    // concurrent runs can never end up with the same name.
    const std::string pattern = (dir / ("snipexec_XXXXXX" + suffix)).string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    const int fd = mkstemps(name.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        return ExecError{ErrorCategory::Internal,
                         "Failed to create temporary source file in " + dir.string() +
                             ": " + std::strerror(errno),
                         "temp_file_create_failed"};
    }

    TempSourceFile file{std::filesystem::path(name.data())};
    const bool ok = write_all(fd, contents);
    static_cast<void>(close(fd));
    if (!ok) {
        return ExecError{ErrorCategory::Internal,
                         "Failed to write temporary source file: " +
                             file.path().string(),
                         "temp_file_write_failed"};
    }
    return std::move(file);
}

}  // namespace snipexec::runtime
