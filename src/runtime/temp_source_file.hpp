#pragma once

#include <filesystem>
#include <string>
#include "core/errors/exec_errors.hpp"

namespace snipexec::runtime {

// A uniquely named source file that is deleted when the object goes away.
// Deleting a file that is already gone counts as success.
class TempSourceFile {
public:
    static core::errors::Result<TempSourceFile> create(
        const std::filesystem::path& directory, const std::string& contents,
        const std::string& suffix = ".py");

    TempSourceFile(TempSourceFile&& other) noexcept;
    TempSourceFile& operator=(TempSourceFile&& other) noexcept;
    TempSourceFile(const TempSourceFile&) = delete;
    TempSourceFile& operator=(const TempSourceFile&) = delete;
    ~TempSourceFile();

    const std::filesystem::path& path() const { return path_; }

private:
    explicit TempSourceFile(std::filesystem::path path);
    void remove_now() noexcept;

    std::filesystem::path path_;
};

}  // namespace snipexec::runtime
