#pragma once

#include "export.hpp"
#include "value.hpp"

#include <cstddef>
#include <mutex>
#include <span>
#include <unordered_map>
#include <vector>

namespace libinject {

/// Reusable argument buffers for constructor and method invocation.
///
/// `rent(n)` hands out a lease over exactly `n` values.  The lease gives
/// the buffer back when it is destroyed, on every exit path, and the pool
/// clears it before keeping it for the next caller.  At most
/// `max_per_arity` idle buffers are kept per arity.
class LIBINJECT_EXPORT argument_pool {
public:
    class LIBINJECT_EXPORT lease {
    public:
        lease(lease&& other) noexcept;
        lease& operator=(lease&& other) noexcept;
        lease(const lease&) = delete;
        lease& operator=(const lease&) = delete;
        ~lease();

        std::span<value> args() noexcept { return buffer_; }
        std::size_t size() const noexcept { return buffer_.size(); }

    private:
        friend class argument_pool;
        lease(argument_pool* pool, std::vector<value> buffer) noexcept;
        void release() noexcept;

        argument_pool* pool_ = nullptr;
        std::vector<value> buffer_;
    };

    explicit argument_pool(std::size_t max_per_arity = 16);
    argument_pool(const argument_pool&) = delete;
    argument_pool& operator=(const argument_pool&) = delete;

    lease rent(std::size_t n);

    /// Idle buffers of arity `n`.
    std::size_t available(std::size_t n) const;

    /// Leases handed out and not yet returned.
    std::size_t outstanding() const;

private:
    void give_back(std::vector<value>&& buffer) noexcept;

    mutable std::mutex mutex_;
    std::unordered_map<std::size_t, std::vector<std::vector<value>>> idle_;
    std::size_t max_per_arity_;
    std::size_t outstanding_ = 0;
};

} // namespace libinject
