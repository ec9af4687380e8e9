#pragma once

#include "export.hpp"
#include "erased_ptr.hpp"
#include "value.hpp"

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

namespace libinject {

class type_descriptor;

// ---------------------------------------------------------------
// Member handles
// ---------------------------------------------------------------

using constructor_fn = std::function<erased_ptr(std::span<value>)>;
using method_fn      = std::function<void(void*, std::span<value>)>;
using setter_fn      = std::function<void(void*, value)>;
using getter_fn      = std::function<value(const void*)>;
using upcast_fn      = void* (*)(void*);

/// Facts already extracted from whatever marks an injection point.
struct annotations {
    bool inject = false;
    bool optional = false;
    std::optional<std::string> key;
    bool from_parent = false;
    int order = 0;              // methods only
};

enum class visibility {
    public_access,
    non_public
};

struct reflected_parameter {
    std::string name;
    type_ref type;
    annotations attributes;
    std::optional<value> default_value;
};

struct reflected_constructor {
    std::vector<reflected_parameter> parameters;
    visibility access = visibility::public_access;
    annotations attributes;
    constructor_fn invoke;
};

struct reflected_field {
    std::string name;
    type_ref type;
    annotations attributes;
    setter_fn set;
    getter_fn get;
};

struct reflected_property {
    std::string name;
    type_ref type;
    annotations attributes;
    getter_fn get;
    setter_fn set;              // empty for read-only properties

    bool can_write() const noexcept { return static_cast<bool>(set); }
};

struct reflected_method {
    std::string name;
    std::vector<reflected_parameter> parameters;
    annotations attributes;
    bool is_accessor = false;   // property getter/setter
    method_fn invoke;
};

/// Link to the single direct base.  `upcast` converts a pointer to the
/// described type into a pointer to the base subobject.
struct reflected_base {
    const type_descriptor* type = nullptr;
    upcast_fn upcast = nullptr;
};

// ---------------------------------------------------------------
// type_descriptor: what the engine knows about one type
// ---------------------------------------------------------------

/// Descriptors are compared by identity: `type_of<T>()` hands out one
/// object per type and the metadata cache keys on its address.
class LIBINJECT_EXPORT type_descriptor {
public:
    type_descriptor(std::type_index id, std::string name, bool is_abstract);

    type_descriptor(const type_descriptor&) = delete;
    type_descriptor& operator=(const type_descriptor&) = delete;
    type_descriptor(type_descriptor&&) noexcept = default;
    type_descriptor& operator=(type_descriptor&&) noexcept = default;

    std::type_index id() const noexcept { return id_; }
    const std::string& name() const noexcept { return name_; }
    bool is_abstract() const noexcept { return is_abstract_; }

    /// Direct base, or nullptr when the type declares none.
    const reflected_base* base() const noexcept {
        return base_ ? &*base_ : nullptr;
    }

    const std::vector<reflected_constructor>& constructors() const noexcept { return constructors_; }
    const std::vector<reflected_field>& fields() const noexcept { return fields_; }
    const std::vector<reflected_property>& properties() const noexcept { return properties_; }
    const std::vector<reflected_method>& methods() const noexcept { return methods_; }

    /// Value-initializing factory, present for default-constructible,
    /// non-abstract types whether or not a constructor was described.
    const constructor_fn& fallback_factory() const noexcept { return fallback_; }

    bool operator==(const type_descriptor& other) const noexcept { return this == &other; }

    // ---------------------------------------------------------------
    // Mutation: used by type_builder while the descriptor is built
    // ---------------------------------------------------------------

    void set_base(reflected_base base);
    void set_fallback_factory(constructor_fn factory);
    void add_constructor(reflected_constructor ctor);
    void add_field(reflected_field field);
    void add_property(reflected_property property);
    void add_method(reflected_method method);

private:
    std::type_index id_;
    std::string name_;
    bool is_abstract_ = false;
    std::optional<reflected_base> base_;
    std::vector<reflected_constructor> constructors_;
    std::vector<reflected_field> fields_;
    std::vector<reflected_property> properties_;
    std::vector<reflected_method> methods_;
    constructor_fn fallback_;
};

} // namespace libinject
