#include "libinject/argument_pool.hpp"

#include <new>
#include <utility>

namespace libinject {

// ---------------------------------------------------------------
// lease
// ---------------------------------------------------------------

argument_pool::lease::lease(argument_pool* pool, std::vector<value> buffer) noexcept
    : pool_(pool)
    , buffer_(std::move(buffer))
{}

argument_pool::lease::lease(lease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr))
    , buffer_(std::move(other.buffer_))
{}

argument_pool::lease& argument_pool::lease::operator=(lease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = std::exchange(other.pool_, nullptr);
        buffer_ = std::move(other.buffer_);
    }
    return *this;
}

argument_pool::lease::~lease() {
    release();
}

void argument_pool::lease::release() noexcept {
    if (pool_) {
        std::exchange(pool_, nullptr)->give_back(std::move(buffer_));
    }
}

// ---------------------------------------------------------------
// argument_pool
// ---------------------------------------------------------------

argument_pool::argument_pool(std::size_t max_per_arity)
    : max_per_arity_(max_per_arity)
{}

argument_pool::lease argument_pool::rent(std::size_t n) {
    std::vector<value> buffer;
    {
        std::scoped_lock lck(mutex_);
        auto it = idle_.find(n);
        if (it != idle_.end() && !it->second.empty()) {
            buffer = std::move(it->second.back());
            it->second.pop_back();
        }
    }
    if (buffer.size() != n) {
        buffer.resize(n);
    }

    std::scoped_lock lck(mutex_);
    ++outstanding_;
    return lease(this, std::move(buffer));
}

void argument_pool::give_back(std::vector<value>&& buffer) noexcept {
    for (auto& v : buffer) v.reset();

    std::scoped_lock lck(mutex_);
    --outstanding_;
    try {
        auto& idle = idle_[buffer.size()];
        if (idle.size() < max_per_arity_) {
            idle.push_back(std::move(buffer));
        }
    } catch (const std::bad_alloc&) {
        // the buffer is simply dropped
    }
}

std::size_t argument_pool::available(std::size_t n) const {
    std::scoped_lock lck(mutex_);
    auto it = idle_.find(n);
    return it == idle_.end() ? 0 : it->second.size();
}

std::size_t argument_pool::outstanding() const {
    std::scoped_lock lck(mutex_);
    return outstanding_;
}

} // namespace libinject
