#pragma once

#include "export.hpp"
#include "descriptor.hpp"
#include "exceptions.hpp"
#include "inject_parameter.hpp"
#include "injector.hpp"
#include "resolver.hpp"
#include "type_builder.hpp"
#include "type_traits.hpp"

#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

namespace libinject {

/// Collects registrations and builds a resolver from them.
///
/// Each (service type, key) pair may be registered once; the empty key
/// means non-keyed.  Reference services are resolved as
/// `std::shared_ptr<T>`, value services as the value itself.
class LIBINJECT_EXPORT registry {
public:
    registry();
    ~registry();

    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;
    registry(registry&&) noexcept;
    registry& operator=(registry&&) noexcept;

    /// A fixed value service (e.g. `int`, `std::string`), copied out on
    /// every resolution.
    template <typename T>
        requires std::is_copy_constructible_v<T>
    registry& add_value(T v, std::string_view key = {},
                        std::source_location loc = std::source_location::current()) {
        static_assert(!dependency_traits<T>::is_reference,
            "add_value<T>: use add_instance for shared instances");
        descriptor d;
        d.component_type = typeid(T);
        d.kind = registration_kind::value;
        d.factory = [stored = value(std::move(v))](resolver&) -> value { return stored; };
        d.key = std::string(key);
        d.api_name = "add_value";
        d.registration_location = loc;
        return register_component(std::move(d));
    }

    /// A fixed shared instance of service `T`.
    template <typename T>
    registry& add_instance(std::shared_ptr<T> instance, std::string_view key = {},
                           std::source_location loc = std::source_location::current()) {
        if (!instance) throw argument_error("instance");
        descriptor d;
        d.component_type = typeid(T);
        d.kind = registration_kind::instance;
        d.factory = [stored = std::move(instance)](resolver&) -> value { return stored; };
        d.key = std::string(key);
        d.api_name = "add_instance";
        d.registration_location = loc;
        return register_component(std::move(d));
    }

    /// A factory called on every resolution.  `D` is the declared type:
    /// `add_factory<std::shared_ptr<IClock>>(...)` registers service IClock.
    template <typename D, typename F>
        requires std::is_invocable_r_v<D, F, resolver&>
    registry& add_factory(F factory, std::string_view key = {},
                          std::source_location loc = std::source_location::current()) {
        descriptor d;
        d.component_type = typeid(service_type_t<D>);
        d.kind = registration_kind::factory;
        d.factory = [f = std::move(factory)](resolver& r) -> value {
            return value(static_cast<D>(f(r)));
        };
        d.key = std::string(key);
        d.api_name = "add_factory";
        d.registration_location = loc;
        return register_component(std::move(d));
    }

    /// Service `I` implemented by `Impl`, created and injected through the
    /// resolver's injector on every resolution.  `overrides` are passed to
    /// each injection.
    template <typename I, typename Impl = I>
        requires derived_from_base<Impl, I>
    registry& add_type(std::string_view key = {},
                       std::vector<inject_parameter_ptr> overrides = {},
                       std::source_location loc = std::source_location::current()) {
        static_assert(!std::is_abstract_v<Impl>, "add_type<I, Impl>: Impl must be concrete");
        const type_descriptor* impl = &type_of<Impl>();

        descriptor d;
        d.component_type = typeid(I);
        d.kind = registration_kind::type;
        d.impl_descriptor = impl;
        d.overrides = overrides;
        d.factory = [impl, overrides = std::move(overrides)](resolver& r) -> value {
            auto obj = r.get_injector().instantiate(*impl, &r, overrides);
            std::shared_ptr<Impl> created = unique_from_erased<Impl>(std::move(obj));
            return value(std::shared_ptr<I>(std::move(created)));
        };
        d.key = std::string(key);
        d.api_name = "add_type";
        d.registration_location = loc;
        return register_component(std::move(d));
    }

    // ===============================================================
    // Build
    // ===============================================================

    /// Build the resolver.  Can be called once.
    std::shared_ptr<resolver> build(build_options options = {},
                                    std::source_location loc = std::source_location::current());

    const std::vector<descriptor>& descriptors() const;

private:
    registry& register_component(descriptor d);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace libinject
