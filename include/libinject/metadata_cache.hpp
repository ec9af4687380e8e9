#pragma once

#include "export.hpp"
#include "metadata.hpp"
#include "type_descriptor.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace libinject {

/// Per-type store of injection metadata.
///
/// `get_or_create` builds the metadata for a type at most once, even when
/// several threads ask for the same type at the same time, and every caller
/// receives the same shared instance.  The map lock is held only to find or
/// insert the entry; the build itself runs under that entry's own
/// `std::once_flag`, so unrelated types never wait for each other.
/// A build that throws publishes nothing; the next call retries.
class LIBINJECT_EXPORT metadata_cache {
public:
    struct stats {
        std::size_t builds = 0;
        std::size_t hits = 0;
        std::size_t misses = 0;
    };

    metadata_cache() = default;
    metadata_cache(const metadata_cache&) = delete;
    metadata_cache& operator=(const metadata_cache&) = delete;

    std::shared_ptr<const injection_metadata> get_or_create(const type_descriptor& type);

    /// Published metadata for `type`, or nullptr.  Never builds.
    std::shared_ptr<const injection_metadata> try_get(const type_descriptor& type) const;

    bool remove(const type_descriptor& type);
    void clear();

    /// Number of types with published metadata.
    std::size_t count() const;

    stats statistics() const noexcept;

private:
    struct entry {
        std::once_flag once;
        std::shared_ptr<const injection_metadata> metadata;
        std::atomic<bool> ready{false};
    };

    mutable std::mutex mutex_;
    std::unordered_map<const type_descriptor*, std::shared_ptr<entry>> entries_;

    std::atomic<std::size_t> builds_{0};
    std::atomic<std::size_t> hits_{0};
    std::atomic<std::size_t> misses_{0};

    std::shared_ptr<entry> find_or_insert(const type_descriptor& type);
};

} // namespace libinject
