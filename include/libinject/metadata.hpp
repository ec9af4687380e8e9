#pragma once

#include "export.hpp"
#include "type_descriptor.hpp"
#include "value.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace libinject {

// ---------------------------------------------------------------
// Injection metadata: derived once per type, immutable afterwards
// ---------------------------------------------------------------

/// One dependency: a constructor or method parameter, or a field or
/// property (which never carry a default value).
struct parameter_info {
    std::string name;
    type_ref type;
    bool is_optional = false;           // annotated optional, or has a default
    std::optional<std::string> key;
    bool from_parent = false;
    bool has_default_value = false;
    value default_value;

    /// Value used when an optional dependency cannot be resolved.
    value fallback_value() const {
        return has_default_value ? default_value : type.zero();
    }
};

struct constructor_info {
    std::string type_name;
    constructor_fn invoke;
    std::vector<parameter_info> parameters;
};

/// A field or property injection point.  `set` accepts a pointer to the
/// most-derived object, even for members declared on a base.
struct member_info {
    parameter_info target;
    setter_fn set;

    const std::string& name() const noexcept { return target.name; }
};

struct method_info {
    std::string name;
    int order = 0;
    std::vector<parameter_info> parameters;
    method_fn invoke;
};

struct injection_metadata {
    const type_descriptor* target = nullptr;
    std::optional<constructor_info> constructor;
    std::vector<member_info> fields;
    std::vector<member_info> properties;
    std::vector<method_info> methods;   // sorted by order, stable

    bool has_injection_points() const noexcept {
        return constructor.has_value() || !fields.empty()
            || !properties.empty() || !methods.empty();
    }
};

/// Build the metadata for `type`.  Absence of a constructor or of any
/// injection point is not an error.  Prefer `metadata_cache`, which calls
/// this at most once per type.
LIBINJECT_EXPORT std::shared_ptr<const injection_metadata>
build_metadata(const type_descriptor& type);

} // namespace libinject
