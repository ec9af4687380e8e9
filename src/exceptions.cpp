#include "libinject/exceptions.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <typeindex>
#include <utility>

#if defined(__GNUC__)
#include <cxxabi.h>
#endif

namespace libinject {

namespace internal {

std::string demangle(std::type_index type) {
#if defined(__GNUC__)
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> readable(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status), &std::free);
    if (status == 0 && readable) return readable.get();
#endif
    return type.name();
}

} // namespace internal

namespace {

std::string at_location(const std::string& msg, const std::source_location& loc) {
    return msg + " [at " + loc.file_name() + ":" + std::to_string(loc.line()) + "]";
}

std::string component(std::type_index type, std::string_view key) {
    std::string s = internal::demangle(type);
    if (!key.empty()) s += " (key=\"" + std::string(key) + "\")";
    return s;
}

std::string cycle_path(const std::vector<std::type_index>& cycle) {
    std::string path;
    for (const auto& type : cycle) {
        if (!path.empty()) path += " -> ";
        path += internal::demangle(type);
    }
    return path;
}

std::string failure_subject(std::string_view type_name, std::string_view member_name) {
    if (member_name.empty()) return "Failed to create " + std::string(type_name);
    return "Failed to inject " + std::string(type_name) + "::" + std::string(member_name);
}

} // namespace

// ---------------------------------------------------------------
// di_error
// ---------------------------------------------------------------

di_error::di_error(const std::string& message, std::source_location loc)
    : std::runtime_error(at_location(message, loc))
    , location_(loc)
{}

void di_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

std::string di_error::full_diagnostic() const {
    std::string text = what();
    if (!diagnostic_detail_.empty()) text += "\n" + diagnostic_detail_;
    return text;
}

void di_error::append_resolution_context(const std::string& component_info) {
    if (!context_.empty()) context_ += " -> ";
    context_ += component_info;
    message_with_context_ = std::string(std::runtime_error::what())
                          + " (while resolving " + context_ + ")";
}

const char* di_error::what() const noexcept {
    return message_with_context_.empty() ? std::runtime_error::what()
                                         : message_with_context_.c_str();
}

// ---------------------------------------------------------------
// Lookup and registration errors
// ---------------------------------------------------------------

not_found::not_found(std::type_index type, std::source_location loc)
    : not_found(type, {}, {}, loc)
{}

not_found::not_found(std::type_index type, std::string_view key, std::source_location loc)
    : not_found(type, key, {}, loc)
{}

not_found::not_found(std::type_index type, std::string_view key,
                     std::string_view hint, std::source_location loc)
    : di_error("Component not found: " + component(type, key)
               + (hint.empty() ? std::string() : "; " + std::string(hint)), loc)
    , component_type_(type)
{}

no_parent_container::no_parent_container(std::type_index type,
                                         std::string_view dependency_name,
                                         std::source_location loc)
    : di_error("Cannot resolve " + internal::demangle(type)
               + " for '" + std::string(dependency_name)
               + "' from the parent container: resolver has no parent", loc)
    , component_type_(type)
{}

argument_error::argument_error(std::string_view argument_name,
                               std::source_location loc)
    : di_error("Argument must not be null: " + std::string(argument_name), loc)
{}

not_constructible::not_constructible(std::string_view type_name,
                                     std::string_view reason,
                                     std::source_location loc)
    : di_error("Cannot instantiate " + std::string(type_name)
               + ": " + std::string(reason), loc)
{}

cyclic_dependency::cyclic_dependency(const std::vector<std::type_index>& cycle,
                                     std::source_location loc)
    : di_error("Cyclic dependency detected: " + cycle_path(cycle), loc)
    , cycle_(cycle)
{}

duplicate_registration::duplicate_registration(std::type_index type,
                                               std::source_location loc)
    : duplicate_registration(type, {}, loc)
{}

duplicate_registration::duplicate_registration(std::type_index type,
                                               std::string_view key,
                                               std::source_location loc)
    : di_error("Duplicate registration for: " + component(type, key), loc)
    , component_type_(type)
{}

// ---------------------------------------------------------------
// Invocation failures
// ---------------------------------------------------------------

resolution_error::resolution_error(std::string_view type_name,
                                   const std::exception& inner,
                                   std::source_location loc)
    : resolution_error(type_name, {}, inner, loc)
{}

resolution_error::resolution_error(std::string_view type_name,
                                   std::string_view member_name,
                                   const std::exception& inner,
                                   std::source_location loc)
    : di_error(failure_subject(type_name, member_name) + ": " + inner.what(), loc)
    , type_name_(type_name)
    , member_name_(member_name)
    , cause_(std::current_exception())
{}

resolution_error::resolution_error(std::string_view type_name,
                                   std::exception_ptr cause,
                                   std::source_location loc)
    : resolution_error(type_name, {}, std::move(cause), loc)
{}

resolution_error::resolution_error(std::string_view type_name,
                                   std::string_view member_name,
                                   std::exception_ptr cause,
                                   std::source_location loc)
    : di_error(failure_subject(type_name, member_name) + ": unknown exception", loc)
    , type_name_(type_name)
    , member_name_(member_name)
    , cause_(std::move(cause))
{}

} // namespace libinject
