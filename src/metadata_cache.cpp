#include "libinject/metadata_cache.hpp"

#include <utility>

namespace libinject {

std::shared_ptr<metadata_cache::entry>
metadata_cache::find_or_insert(const type_descriptor& type) {
    std::scoped_lock lck(mutex_);
    auto& slot = entries_[&type];
    if (!slot) {
        slot = std::make_shared<entry>();
    }
    return slot;
}

std::shared_ptr<const injection_metadata>
metadata_cache::get_or_create(const type_descriptor& type) {
    auto e = find_or_insert(type);

    if (e->ready.load(std::memory_order_acquire)) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        return e->metadata;
    }

    misses_.fetch_add(1, std::memory_order_relaxed);
    std::call_once(e->once, [&] {
        e->metadata = build_metadata(type);
        builds_.fetch_add(1, std::memory_order_relaxed);
        e->ready.store(true, std::memory_order_release);
    });
    return e->metadata;
}

std::shared_ptr<const injection_metadata>
metadata_cache::try_get(const type_descriptor& type) const {
    std::shared_ptr<entry> e;
    {
        std::scoped_lock lck(mutex_);
        auto it = entries_.find(&type);
        if (it == entries_.end()) return nullptr;
        e = it->second;
    }
    if (!e->ready.load(std::memory_order_acquire)) return nullptr;
    return e->metadata;
}

bool metadata_cache::remove(const type_descriptor& type) {
    std::scoped_lock lck(mutex_);
    auto it = entries_.find(&type);
    if (it == entries_.end()) return false;
    bool was_published = it->second->ready.load(std::memory_order_acquire);
    entries_.erase(it);
    return was_published;
}

void metadata_cache::clear() {
    std::scoped_lock lck(mutex_);
    entries_.clear();
}

std::size_t metadata_cache::count() const {
    std::scoped_lock lck(mutex_);
    std::size_t n = 0;
    for (const auto& [type, e] : entries_) {
        if (e->ready.load(std::memory_order_acquire)) ++n;
    }
    return n;
}

metadata_cache::stats metadata_cache::statistics() const noexcept {
    return stats{
        builds_.load(std::memory_order_relaxed),
        hits_.load(std::memory_order_relaxed),
        misses_.load(std::memory_order_relaxed)};
}

} // namespace libinject
