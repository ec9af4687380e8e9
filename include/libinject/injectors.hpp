#pragma once

#include "argument_pool.hpp"
#include "erased_ptr.hpp"
#include "export.hpp"
#include "inject_parameter.hpp"
#include "metadata.hpp"
#include "object_resolver.hpp"
#include "options.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace libinject {

// Each injector resolves dependencies through resolve_value().  A di_error
// raised while resolving propagates with the type or member appended as
// resolution context; any other exception is wrapped in resolution_error.
// Effects already applied before a failure are not rolled back.

class LIBINJECT_EXPORT constructor_injector {
public:
    constructor_injector(argument_pool& pool, const injector_options& options);

    /// Resolve every parameter in declaration order and invoke `ctor`.
    /// Throws argument_error when `ctor` or `resolver` is null.
    erased_ptr create_instance(const constructor_info* ctor,
                               object_resolver* resolver,
                               override_list overrides = {}) const;

private:
    argument_pool& pool_;
    const injector_options& options_;
};

/// Field or property injection.  An optional member whose resolved value
/// is the zero value of its type is left untouched.
class LIBINJECT_EXPORT member_injector {
public:
    member_injector(std::string kind, const injector_options& options);

    void inject(void* instance, const std::vector<member_info>& members,
                object_resolver* resolver, override_list overrides = {},
                std::string_view owner = {}) const;

    const std::string& kind() const noexcept { return kind_; }

private:
    std::string kind_;
    const injector_options& options_;
};

class LIBINJECT_EXPORT method_injector {
public:
    method_injector(argument_pool& pool, const injector_options& options);

    /// Invoke `methods` in the given order, one argument buffer per call.
    void inject(void* instance, const std::vector<method_info>& methods,
                object_resolver* resolver, override_list overrides = {},
                std::string_view owner = {}) const;

private:
    argument_pool& pool_;
    const injector_options& options_;
};

} // namespace libinject
