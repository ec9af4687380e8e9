#pragma once

#include "inject_parameter.hpp"
#include "type_descriptor.hpp"
#include "value.hpp"

#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

namespace libinject {

class injector;
class resolver;

enum class registration_kind {
    value,      // a fixed value, returned as is
    instance,   // a fixed shared instance
    factory,    // a user factory, called per resolution
    type        // built through the injector, per resolution
};

using factory_fn = std::function<value(resolver&)>;

// ---------------------------------------------------------------
// build_options
// ---------------------------------------------------------------

struct build_options {
    /// Check at build time that every required dependency of an
    /// add_type registration can be satisfied and that the add_type
    /// registrations form no cycle.
    bool validate_on_build = true;

    /// Resolver consulted for services not registered here, and by
    /// from-parent dependencies.
    std::shared_ptr<libinject::resolver> parent;

    /// Injector used by add_type registrations.  When null the parent's
    /// injector is shared, or a fresh one is created for a root.
    std::shared_ptr<libinject::injector> injector;
};

// ---------------------------------------------------------------
// descriptor: one registration record
// ---------------------------------------------------------------

struct descriptor {
    std::type_index component_type = std::type_index(typeid(void));
    registration_kind kind = registration_kind::factory;
    factory_fn factory;
    std::string key;                            // empty = non-keyed

    // add_type only
    const type_descriptor* impl_descriptor = nullptr;
    std::vector<inject_parameter_ptr> overrides;

    std::string api_name;
    std::source_location registration_location;
    std::any registration_stacktrace;           // empty unless captured
};

} // namespace libinject
