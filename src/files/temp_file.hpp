#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

namespace verdict::files {

struct FileCloser {
    void operator()(std::FILE* file) const {
        if (file) {
            std::fclose(file);
        }
    }
};

// Owning stdio handle. Child processes are bound to it through boost.process's FILE* redirection.
using FileHandle = std::unique_ptr<std::FILE, FileCloser>;

// Anonymous file reclaimed once every descriptor to it is closed.
// memfd on Linux, tmpfile() elsewhere. Throws JudgeError when neither is available.
FileHandle CreateTempFile();

// Independent handle to the same underlying file, suitable for a child's stdin/stdout.
// The new descriptor is the lowest free one not below `lowest_fd`.
FileHandle MakeClonedStdio(const FileHandle& file, int lowest_fd = 0);

// Opens `path` for writing, truncating whatever a previous user left behind.
FileHandle CreateFile(const std::filesystem::path& path);
FileHandle OpenForReading(const std::filesystem::path& path);

std::string ReadAll(const FileHandle& file);
std::string ReadFile(const std::filesystem::path& path);
void WriteFile(const std::filesystem::path& path, const std::string& content);

class TemporaryDirectory {
public:
    explicit TemporaryDirectory(const std::string& prefix = "verdict");
    ~TemporaryDirectory();

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace verdict::files
