#pragma once

#include <memory>
#include <utility>

namespace libinject {

/// Owning handle to an object created by a constructor invoker.  The
/// pointer addresses the most-derived object that was constructed and
/// `destroy` deletes it through that type.
class erased_ptr {
public:
    using destroy_fn = void (*)(void*);

    erased_ptr() = default;
    erased_ptr(void* object, destroy_fn destroy) noexcept
        : object_(object), destroy_(destroy) {}

    erased_ptr(erased_ptr&& other) noexcept
        : object_(std::exchange(other.object_, nullptr))
        , destroy_(std::exchange(other.destroy_, nullptr)) {}

    erased_ptr& operator=(erased_ptr&& other) noexcept {
        erased_ptr(std::move(other)).swap(*this);
        return *this;
    }

    erased_ptr(const erased_ptr&) = delete;
    erased_ptr& operator=(const erased_ptr&) = delete;

    ~erased_ptr() {
        if (object_) destroy_(object_);
    }

    void* get() const noexcept { return object_; }
    explicit operator bool() const noexcept { return object_ != nullptr; }

    void swap(erased_ptr& other) noexcept {
        std::swap(object_, other.object_);
        std::swap(destroy_, other.destroy_);
    }

private:
    template <typename T>
    friend std::unique_ptr<T> unique_from_erased(erased_ptr&& p) noexcept;

    void* object_ = nullptr;
    destroy_fn destroy_ = nullptr;
};

template <typename T, typename... Args>
erased_ptr make_erased(Args&&... args) {
    return erased_ptr(new T(std::forward<Args>(args)...),
                      [](void* p) { delete static_cast<T*>(p); });
}

/// Hand an object known to be a `T` over to a unique_ptr.
template <typename T>
std::unique_ptr<T> unique_from_erased(erased_ptr&& p) noexcept {
    p.destroy_ = nullptr;
    return std::unique_ptr<T>(static_cast<T*>(std::exchange(p.object_, nullptr)));
}

} // namespace libinject
