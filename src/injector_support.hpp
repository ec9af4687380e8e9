#pragma once

// Internal helpers shared by the injectors.

#include "libinject/exceptions.hpp"
#include "libinject/options.hpp"
#include "stacktrace_utils.hpp"

#include <string>
#include <string_view>

namespace libinject::internal {

inline std::string member_context(std::string_view owner, std::string_view member) {
    if (owner.empty()) return std::string(member);
    return std::string(owner) + "::" + std::string(member);
}

inline void maybe_attach_stacktrace(di_error& err, const injector_options& options,
                                    const std::string& context) {
    if (options.capture_stacktrace) {
        attach_stacktrace(err, context);
    }
}

} // namespace libinject::internal
