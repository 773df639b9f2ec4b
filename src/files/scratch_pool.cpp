#include "files/scratch_pool.hpp"

#include <stdexcept>
#include <system_error>

#include "utils/errors.hpp"
#include "utils/logging.hpp"

namespace verdict::files {

ScratchPool::ScratchPool(std::size_t capacity)
    : capacity_(capacity)
    , checked_out_(std::make_unique<std::atomic<bool>[]>(capacity))
    , free_slots_(capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("scratch pool capacity must be positive");
    }
    for (std::size_t i = 0; i < capacity_; ++i) {
        checked_out_[i].store(false);
    }
}

void ScratchPool::Fill(const std::filesystem::path& base_directory) {
    if (filled_) {
        throw std::logic_error("scratch pool is already filled");
    }
    paths_.reserve(capacity_);
    for (std::size_t i = 0; i < capacity_; ++i) {
        auto path = base_directory / ("scratch-" + std::to_string(i));
        slots_.emplace(path.string(), i);
        paths_.push_back(std::move(path));
        if (!free_slots_.bounded_push(i)) {
            throw JudgeError("Couldn't push into scratch pool");
        }
        available_.fetch_add(1);
    }
    filled_ = true;
    utils::Log(utils::LogLevel::kDebug, "pool",
               "filled " + std::to_string(capacity_) + " paths under " + base_directory.string());
}

std::filesystem::path ScratchPool::Acquire() {
    std::size_t slot = 0;
    if (!free_slots_.pop(slot)) {
        throw JudgeError("Couldn't acquire a scratch file: pool of " +
                         std::to_string(capacity_) + " is exhausted");
    }
    available_.fetch_sub(1);
    checked_out_[slot].store(true);
    return paths_[slot];
}

void ScratchPool::Release(const std::filesystem::path& path) {
    const auto it = slots_.find(path.string());
    if (it == slots_.end()) {
        throw std::invalid_argument("path was not issued by this scratch pool: " + path.string());
    }
    const auto slot = it->second;
    if (!checked_out_[slot].exchange(false)) {
        throw std::logic_error("scratch path released twice: " + path.string());
    }
    available_.fetch_add(1);
    if (!free_slots_.bounded_push(slot)) {
        throw JudgeError("Couldn't push into scratch pool");
    }
}

ScratchLease::ScratchLease(ScratchPool& pool)
    : pool_(pool)
    , path_(pool.Acquire()) {}

ScratchLease::~ScratchLease() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    try {
        pool_.Release(path_);
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "pool", ex.what());
    }
}

}  // namespace verdict::files
