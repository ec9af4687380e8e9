#pragma once

// Internal helper for stacktrace capture and formatting.
// This header is NOT installed; only the library's .cpp files use it.

#include "libinject/descriptor.hpp"
#include "libinject/exceptions.hpp"

#include <any>
#include <string>
#include <sstream>

#ifdef LIBINJECT_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace libinject::internal {

/// Capture the current call stack.  Empty when the library was built
/// without stack trace support.  Implemented in stacktrace_capture.cpp.
std::any capture_stacktrace();

/// Format a stacktrace stored in a std::any into a human-readable string.
/// Returns an empty string if the any is empty or stacktrace support is
/// disabled.
inline std::string format_stacktrace(const std::any& st) {
#ifdef LIBINJECT_HAS_STACKTRACE
    if (const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st)) {
        if (trace->size() > 0) {
            std::ostringstream oss;
            oss << *trace;
            return oss.str();
        }
    }
#else
    (void)st;
#endif
    return {};
}

/// Attach the current call stack to `err` as its diagnostic detail,
/// headed by `context`.  No-op without stack trace support.
inline void attach_stacktrace(di_error& err, const std::string& context) {
    std::string trace = format_stacktrace(capture_stacktrace());
    if (trace.empty()) return;
    err.set_diagnostic_detail("Stacktrace at " + context + ":\n" + trace);
}

/// Format one descriptor's registration trace for diagnostic output.
/// Returns a block like:
///   "Registration stacktrace for IRepo [impl: SqlRepo] (called via add_type):\n  #0 ...\n"
/// or an empty string if no stacktrace is available.
inline std::string format_registration_trace(const descriptor& desc) {
    std::string trace = format_stacktrace(desc.registration_stacktrace);
    if (trace.empty()) return {};

    std::string header = "Registration stacktrace for " + demangle(desc.component_type);
    if (desc.impl_descriptor) {
        header += " [impl: " + desc.impl_descriptor->name() + "]";
    }
    if (!desc.api_name.empty()) {
        header += " (called via " + desc.api_name + ")";
    }
    return header + ":\n" + trace;
}

} // namespace libinject::internal
