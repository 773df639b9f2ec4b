#include "files/temp_file.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>
#include <vector>
#if defined(__linux__)
#include <sys/mman.h>
#endif

#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace verdict::files {
namespace {

std::string ErrnoMessage(const std::string& what, int error = errno) {
    return what + ": " + std::strerror(error);
}

}  // namespace

FileHandle CreateTempFile() {
#if defined(__linux__)
    const int fd = ::memfd_create("verdict temporary file", MFD_CLOEXEC);
    if (fd < 0) {
        throw JudgeError(ErrnoMessage("memfd_create()"));
    }
    FileHandle file(::fdopen(fd, "w+b"));
    if (!file) {
        const auto message = ErrnoMessage("fdopen()");
        ::close(fd);
        throw JudgeError(message);
    }
    return file;
#else
    FileHandle file(std::tmpfile());
    if (!file) {
        throw JudgeError(ErrnoMessage("tmpfile()"));
    }
    return file;
#endif
}

FileHandle MakeClonedStdio(const FileHandle& file, int lowest_fd) {
    const int fd = ::fcntl(::fileno(file.get()), F_DUPFD_CLOEXEC, lowest_fd);
    if (fd < 0) {
        throw JudgeError(ErrnoMessage("dup()"));
    }
    FileHandle clone(::fdopen(fd, "r+b"));
    if (!clone) {
        const auto message = ErrnoMessage("fdopen()");
        ::close(fd);
        throw JudgeError(message);
    }
    return clone;
}

FileHandle CreateFile(const std::filesystem::path& path) {
    // "e" sets O_CLOEXEC so pooled files never leak into other workers' children
    FileHandle file(std::fopen(path.c_str(), "w+be"));
    if (!file) {
        const int error = errno;
        throw JudgeError(ErrnoMessage("Failed to create temporary file " + path.string(), error));
    }
    return file;
}

FileHandle OpenForReading(const std::filesystem::path& path) {
    FileHandle file(std::fopen(path.c_str(), "rbe"));
    if (!file) {
        const int error = errno;
        throw JudgeError(ErrnoMessage("Failed to open " + path.string(), error));
    }
    return file;
}

std::string ReadAll(const FileHandle& file) {
    std::fflush(file.get());
    std::rewind(file.get());
    std::string content;
    std::vector<char> buffer(1 << 16);
    while (true) {
        const auto read = std::fread(buffer.data(), 1, buffer.size(), file.get());
        content.append(buffer.data(), read);
        if (read < buffer.size()) {
            break;
        }
    }
    if (std::ferror(file.get())) {
        throw JudgeError("Failed to read temporary file");
    }
    return content;
}

std::string ReadFile(const std::filesystem::path& path) {
    return ReadAll(OpenForReading(path));
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
    FileHandle file(std::fopen(path.c_str(), "wbe"));
    if (!file) {
        const int error = errno;
        throw JudgeError(ErrnoMessage("Couldn't write " + path.string(), error));
    }
    if (std::fwrite(content.data(), 1, content.size(), file.get()) != content.size() ||
        std::fflush(file.get()) != 0) {
        throw JudgeError(ErrnoMessage("Couldn't write " + path.string()));
    }
}

TemporaryDirectory::TemporaryDirectory(const std::string& prefix) {
    auto pattern = (std::filesystem::temp_directory_path() / (prefix + "-XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw JudgeError(ErrnoMessage("mkdtemp()"));
    }
    path_ = buffer.data();
}

TemporaryDirectory::~TemporaryDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "pool",
                   "failed to remove " + path_.string() + ": " + ec.message());
    }
}

}  // namespace verdict::files
