#pragma once

#include "export.hpp"
#include "type_traits.hpp"

#include <any>
#include <string>
#include <typeindex>

namespace libinject {

/// A resolved dependency.  Reference dependencies hold a
/// `std::shared_ptr<T>`, value dependencies hold the value itself.
using value = std::any;

// ---------------------------------------------------------------
// type_ref: runtime view of a declared dependency type
// ---------------------------------------------------------------

struct type_ref {
    std::type_index service = std::type_index(typeid(void));
    std::type_index storage = std::type_index(typeid(void));
    bool is_reference = false;
    value (*make_default)() = nullptr;
    bool (*is_default)(const value&) = nullptr;

    /// Zero value of the declared type: null for references, `T{}` for
    /// default-constructible values, an empty value otherwise.
    value zero() const { return make_default ? make_default() : value{}; }

    /// True when `v` holds the zero value of the declared type.
    bool holds_zero(const value& v) const {
        return is_default ? is_default(v) : !v.has_value();
    }

    /// Demangled name of the declared type.
    LIBINJECT_EXPORT std::string name() const;

    template <typename D>
    static type_ref of();
};

template <typename D>
type_ref type_ref::of() {
    using traits = dependency_traits<D>;
    using storage = typename traits::storage_type;

    type_ref ref;
    ref.service = std::type_index(typeid(typename traits::service_type));
    ref.storage = std::type_index(typeid(storage));
    ref.is_reference = traits::is_reference;

    if constexpr (default_constructible<storage>) {
        ref.make_default = []() -> value { return storage{}; };
    }

    if constexpr (traits::is_reference) {
        ref.is_default = [](const value& v) {
            const auto* p = std::any_cast<storage>(&v);
            return p == nullptr ? !v.has_value() : *p == nullptr;
        };
    } else if constexpr (zero_comparable<storage>) {
        ref.is_default = [](const value& v) {
            const auto* p = std::any_cast<storage>(&v);
            return p == nullptr ? !v.has_value() : *p == storage{};
        };
    }
    return ref;
}

} // namespace libinject
