#pragma once

#include "export.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <source_location>
#include <typeindex>
#include <vector>

namespace libinject {

namespace internal {
/// Readable name of a type; the raw typeid name where demangling fails.
LIBINJECT_EXPORT std::string demangle(std::type_index type);
} // namespace internal

/// Root of every error raised by the injection engine and the container.
/// what() carries the message, the raising source location and, once
/// enclosing injectors have added it, the chain of types and members that
/// were being resolved.
class LIBINJECT_EXPORT di_error : public std::runtime_error {
public:
    explicit di_error(const std::string& message,
                      std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Extra lines shown by full_diagnostic(), such as a stack trace.
    void set_diagnostic_detail(std::string detail);
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    std::string full_diagnostic() const;

    /// Record the type or member an enclosing injector was working on.
    /// Innermost first: "... (while resolving Repository -> Service::init)"
    void append_resolution_context(const std::string& component_info);

    const char* what() const noexcept override;

private:
    std::source_location location_;
    std::string diagnostic_detail_;
    std::string context_;
    std::string message_with_context_;
};

/// Ordinary or keyed resolution found nothing for a required dependency.
class LIBINJECT_EXPORT not_found : public di_error {
public:
    explicit not_found(std::type_index type,
                       std::source_location loc = std::source_location::current());

    not_found(std::type_index type, std::string_view key,
              std::source_location loc = std::source_location::current());

    /// Construct with an additional diagnostic hint (appended to the message).
    not_found(std::type_index type, std::string_view key,
              std::string_view hint,
              std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

/// A from-parent dependency was requested on a resolver without a parent.
class LIBINJECT_EXPORT no_parent_container : public di_error {
public:
    no_parent_container(std::type_index type, std::string_view dependency_name,
                        std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

/// A null instance or resolver was handed to an injector.
class LIBINJECT_EXPORT argument_error : public di_error {
public:
    explicit argument_error(std::string_view argument_name,
                            std::source_location loc = std::source_location::current());
};

/// The target type is abstract or offers no usable constructor.
class LIBINJECT_EXPORT not_constructible : public di_error {
public:
    not_constructible(std::string_view type_name, std::string_view reason,
                      std::source_location loc = std::source_location::current());
};

class LIBINJECT_EXPORT cyclic_dependency : public di_error {
public:
    explicit cyclic_dependency(const std::vector<std::type_index>& cycle,
                               std::source_location loc = std::source_location::current());

    const std::vector<std::type_index>& cycle() const noexcept { return cycle_; }

private:
    std::vector<std::type_index> cycle_;
};

class LIBINJECT_EXPORT duplicate_registration : public di_error {
public:
    explicit duplicate_registration(std::type_index type,
                                    std::source_location loc = std::source_location::current());

    duplicate_registration(std::type_index type, std::string_view key,
                           std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

/// A constructor, method or member write failed for a reason unrelated to
/// resolution.  The original exception is kept as cause().
class LIBINJECT_EXPORT resolution_error : public di_error {
public:
    resolution_error(std::string_view type_name, const std::exception& inner,
                     std::source_location loc = std::source_location::current());

    /// Failure while injecting a named member or method of `type_name`.
    resolution_error(std::string_view type_name, std::string_view member_name,
                     const std::exception& inner,
                     std::source_location loc = std::source_location::current());

    /// Failure by a thrown object that is not a std::exception.
    resolution_error(std::string_view type_name, std::exception_ptr cause,
                     std::source_location loc = std::source_location::current());

    resolution_error(std::string_view type_name, std::string_view member_name,
                     std::exception_ptr cause,
                     std::source_location loc = std::source_location::current());

    const std::string& type_name() const noexcept { return type_name_; }
    const std::string& member_name() const noexcept { return member_name_; }

    /// The thrown object that was wrapped.
    std::exception_ptr cause() const noexcept { return cause_; }

private:
    std::string type_name_;
    std::string member_name_;
    std::exception_ptr cause_;
};

} // namespace libinject
