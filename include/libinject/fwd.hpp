#pragma once

/// @file fwd.hpp
/// Forward declarations for all public libinject symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

namespace libinject {

// erased_ptr.hpp
class erased_ptr;

// value.hpp
struct type_ref;

// type_descriptor.hpp
struct annotations;
struct reflected_parameter;
struct reflected_constructor;
struct reflected_field;
struct reflected_property;
struct reflected_method;
struct reflected_base;
class type_descriptor;

// type_builder.hpp
class param;
template <typename T>
class type_builder;

// metadata.hpp
struct parameter_info;
struct constructor_info;
struct member_info;
struct method_info;
struct injection_metadata;

// metadata_cache.hpp / argument_pool.hpp / options.hpp
class metadata_cache;
class argument_pool;
struct injector_options;

// inject_parameter.hpp
class inject_parameter;
class named_parameter;
class typed_parameter;

// object_resolver.hpp / injectors.hpp / injector.hpp
class object_resolver;
class constructor_injector;
class member_injector;
class method_injector;
class injector;

// exceptions.hpp
class di_error;
class not_found;
class no_parent_container;
class argument_error;
class not_constructible;
class cyclic_dependency;
class duplicate_registration;
class resolution_error;

// descriptor.hpp / registry.hpp / resolver.hpp
struct build_options;
struct descriptor;
class registry;
class resolver;

} // namespace libinject
