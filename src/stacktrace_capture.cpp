#include "stacktrace_utils.hpp"

#include <any>

#ifdef LIBINJECT_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace libinject::internal {

std::any capture_stacktrace() {
#ifdef LIBINJECT_HAS_STACKTRACE
    return std::any(boost::stacktrace::stacktrace());
#else
    return {};
#endif
}

} // namespace libinject::internal
