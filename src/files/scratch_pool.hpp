#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/lockfree/queue.hpp>

namespace verdict::files {

// Program output, sio2jail report and sio2jail stderr are the most a single test holds at once.
constexpr std::size_t kScratchFilesPerTest = 3;

// Fixed set of reusable file names shared by all workers. Names, not open files, are pooled:
// every lease creates a fresh file at its path so no content leaks between uses.
//
// Fill() must complete before any concurrent Acquire()/Release(); after that the pool is
// lock-free and safe to use from any number of threads.
class ScratchPool {
public:
    explicit ScratchPool(std::size_t capacity);

    ScratchPool(const ScratchPool&) = delete;
    ScratchPool& operator=(const ScratchPool&) = delete;

    void Fill(const std::filesystem::path& base_directory);

    // Throws JudgeError when empty: correct callers never hold more than the pool was sized for.
    std::filesystem::path Acquire();
    void Release(const std::filesystem::path& path);

    std::size_t Capacity() const { return capacity_; }
    std::size_t Available() const { return available_.load(); }

private:
    std::size_t capacity_;
    std::vector<std::filesystem::path> paths_;
    std::unordered_map<std::string, std::size_t> slots_;
    std::unique_ptr<std::atomic<bool>[]> checked_out_;
    boost::lockfree::queue<std::size_t> free_slots_;
    std::atomic<std::size_t> available_{0};
    bool filled_ = false;
};

// Holds one pool path for the lifetime of the object; the backing file is removed and the
// path returned on every exit path.
class ScratchLease {
public:
    explicit ScratchLease(ScratchPool& pool);
    ~ScratchLease();

    ScratchLease(const ScratchLease&) = delete;
    ScratchLease& operator=(const ScratchLease&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    ScratchPool& pool_;
    std::filesystem::path path_;
};

}  // namespace verdict::files
