#pragma once

#include "export.hpp"
#include "type_traits.hpp"
#include "value.hpp"

#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>

namespace libinject {

class object_resolver;

// ---------------------------------------------------------------
// inject_parameter: caller-supplied override for one call
// ---------------------------------------------------------------

/// An explicit override.  When a provider can supply a dependency it wins
/// over every other resolution strategy, keyed and from-parent included.
class LIBINJECT_EXPORT inject_parameter {
public:
    virtual ~inject_parameter() = default;

    virtual bool can_supply(const type_ref& type, std::string_view name) const = 0;
    virtual value get_value(object_resolver& resolver) const = 0;
};

using inject_parameter_ptr = std::shared_ptr<const inject_parameter>;

/// Overrides for one injection call, consulted in order.
using override_list = std::span<const inject_parameter_ptr>;

using value_factory = std::function<value(object_resolver&)>;

/// Supplies the dependency whose parameter or member has the given name.
class LIBINJECT_EXPORT named_parameter final : public inject_parameter {
public:
    named_parameter(std::string name, value v);
    named_parameter(std::string name, value_factory factory);

    bool can_supply(const type_ref& type, std::string_view name) const override;
    value get_value(object_resolver& resolver) const override;

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
    value value_;
    value_factory factory_;
};

/// Supplies every dependency declared with the given service type.
class LIBINJECT_EXPORT typed_parameter final : public inject_parameter {
public:
    typed_parameter(std::type_index service, value v);
    typed_parameter(std::type_index service, value_factory factory);

    bool can_supply(const type_ref& type, std::string_view name) const override;
    value get_value(object_resolver& resolver) const override;

    std::type_index service() const noexcept { return service_; }

private:
    std::type_index service_;
    value value_;
    value_factory factory_;
};

// ---------------------------------------------------------------
// Convenience constructors
// ---------------------------------------------------------------

/// with_parameter<std::shared_ptr<I>>(ptr) / with_parameter<int>(3)
template <typename D>
inject_parameter_ptr with_parameter(D v) {
    return std::make_shared<typed_parameter>(
        std::type_index(typeid(service_type_t<D>)), value(std::move(v)));
}

template <typename D>
inject_parameter_ptr with_parameter(std::string name, D v) {
    return std::make_shared<named_parameter>(std::move(name), value(std::move(v)));
}

template <typename D, typename F>
    requires std::is_invocable_r_v<D, F, object_resolver&>
inject_parameter_ptr with_parameter_factory(F factory) {
    return std::make_shared<typed_parameter>(
        std::type_index(typeid(service_type_t<D>)),
        value_factory([f = std::move(factory)](object_resolver& r) -> value {
            return value(static_cast<D>(f(r)));
        }));
}

} // namespace libinject
