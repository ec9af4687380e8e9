#pragma once

#include "export.hpp"
#include "exceptions.hpp"
#include "type_traits.hpp"
#include "value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <typeindex>

namespace libinject {

/// The capability the injection engine resolves dependencies against.
/// Implemented by a container; the engine never registers anything.
///
/// Values for reference services hold a `std::shared_ptr<T>` where `T` is
/// the requested service type; value services hold the value itself.
class LIBINJECT_EXPORT object_resolver {
public:
    virtual ~object_resolver() = default;

    /// Resolve `type`; empty when nothing is registered for it.
    virtual std::optional<value> try_resolve(std::type_index type) = 0;

    /// Resolve `type` registered under `key`; empty when no such entry.
    virtual std::optional<value> try_resolve_keyed(std::type_index type,
                                                   std::string_view key) = 0;

    /// The enclosing scope, or nullptr for a root resolver.
    virtual object_resolver* parent() const noexcept = 0;

    /// Resolve `type`.  Throws not_found if not registered.
    value resolve(std::type_index type) {
        auto v = try_resolve(type);
        if (!v) throw not_found(type);
        return std::move(*v);
    }

    /// Resolve `type` under `key`.  Throws not_found if not registered.
    value resolve_keyed(std::type_index type, std::string_view key) {
        auto v = try_resolve_keyed(type, key);
        if (!v) throw not_found(type, key);
        return std::move(*v);
    }

    // ---------------------------------------------------------------
    // Typed helpers.  D is the declared type: `std::shared_ptr<T>` for
    // a reference service, the value type otherwise.
    // ---------------------------------------------------------------

    template <typename D>
    D get() {
        return std::any_cast<D>(resolve(typeid(service_type_t<D>)));
    }

    template <typename D>
    D get(std::string_view key) {
        return std::any_cast<D>(resolve_keyed(typeid(service_type_t<D>), key));
    }

    template <typename D>
    std::optional<D> try_get() {
        auto v = try_resolve(typeid(service_type_t<D>));
        if (!v) return std::nullopt;
        return std::any_cast<D>(std::move(*v));
    }

protected:
    object_resolver() = default;
    object_resolver(const object_resolver&) = default;
    object_resolver& operator=(const object_resolver&) = default;
};

} // namespace libinject
