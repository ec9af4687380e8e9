#include "libinject/parameter_resolver.hpp"
#include "libinject/exceptions.hpp"
#include "logging_internal.hpp"

#include <utility>

namespace libinject {

namespace {

value recover(const parameter_info& param, const char* reason) {
    if (internal::log_enabled(spdlog::level::debug)) {
        internal::log()->debug("Optional dependency '{}' ({}) {}; using {} value",
                               param.name, param.type.name(), reason,
                               param.has_default_value ? "declared default" : "zero");
    }
    return param.fallback_value();
}

} // namespace

value resolve_value(const parameter_info& param, object_resolver& resolver,
                    override_list overrides) {
    for (const auto& provider : overrides) {
        if (provider && provider->can_supply(param.type, param.name)) {
            return provider->get_value(resolver);
        }
    }

    const bool may_default = param.is_optional || param.has_default_value;

    if (param.from_parent) {
        object_resolver* parent = resolver.parent();
        if (!parent) {
            if (may_default) return recover(param, "has no parent container");
            throw no_parent_container(param.type.service, param.name);
        }
        if (param.key) {
            return parent->resolve_keyed(param.type.service, *param.key);
        }
        return parent->resolve(param.type.service);
    }

    if (param.key) {
        try {
            if (auto v = resolver.try_resolve_keyed(param.type.service, *param.key)) {
                return std::move(*v);
            }
        } catch (const di_error&) {
            if (may_default) return recover(param, "failed keyed resolution");
            throw;
        }
        if (may_default) return recover(param, "is not registered under its key");
        throw not_found(param.type.service, *param.key);
    }

    if (auto v = resolver.try_resolve(param.type.service)) {
        return std::move(*v);
    }

    if (may_default) return recover(param, "is not registered");
    throw not_found(param.type.service);
}

} // namespace libinject
