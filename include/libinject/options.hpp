#pragma once

#include <cstddef>

namespace libinject {

struct injector_options {
    /// Use the value-initializing factory when a type has no selectable
    /// constructor but is default-constructible.
    bool allow_default_construction = true;

    /// Attach a call stack (Boost.Stacktrace) to wrapped invocation
    /// failures.  Ignored when built without stack trace support.
    bool capture_stacktrace = false;

    /// Idle argument buffers kept per arity.
    std::size_t pooled_buffers_per_arity = 16;
};

} // namespace libinject
