#pragma once

#include "argument_pool.hpp"
#include "erased_ptr.hpp"
#include "export.hpp"
#include "inject_parameter.hpp"
#include "injectors.hpp"
#include "metadata.hpp"
#include "metadata_cache.hpp"
#include "object_resolver.hpp"
#include "options.hpp"
#include "type_builder.hpp"
#include "type_descriptor.hpp"

#include <memory>

namespace libinject {

/// Entry point of the engine: creates objects and fills their injection
/// points.  Owns its argument pool; the metadata cache may be shared
/// with other injectors.
///
/// `instance` pointers handed to inject_all() must address the object as
/// the exact type described by `type` (as returned by create_instance()).
class LIBINJECT_EXPORT injector {
public:
    explicit injector(injector_options options = {},
                      std::shared_ptr<metadata_cache> cache = nullptr);

    injector(const injector&) = delete;
    injector& operator=(const injector&) = delete;

    /// Construct only.  Throws not_constructible for abstract types and
    /// for types with no usable constructor.
    erased_ptr create_instance(const type_descriptor& type, object_resolver* resolver,
                               override_list overrides = {});

    /// Inject fields, then properties, then methods.
    void inject_all(void* instance, const type_descriptor& type,
                    object_resolver* resolver, override_list overrides = {});

    /// create_instance() followed by inject_all().
    erased_ptr instantiate(const type_descriptor& type, object_resolver* resolver,
                           override_list overrides = {});

    std::shared_ptr<const injection_metadata> metadata(const type_descriptor& type);
    bool requires_injection(const type_descriptor& type);
    void clear_cache();

    const std::shared_ptr<metadata_cache>& cache() const noexcept { return cache_; }
    const injector_options& options() const noexcept { return options_; }
    const argument_pool& pool() const noexcept { return pool_; }

    // ---------------------------------------------------------------
    // Typed helpers
    // ---------------------------------------------------------------

    template <typename T>
    std::unique_ptr<T> create(object_resolver& resolver, override_list overrides = {}) {
        return unique_from_erased<T>(instantiate(type_of<T>(), &resolver, overrides));
    }

    template <typename T>
    void inject(T& instance, object_resolver& resolver, override_list overrides = {}) {
        inject_all(&instance, type_of<T>(), &resolver, overrides);
    }

private:
    injector_options options_;
    std::shared_ptr<metadata_cache> cache_;
    argument_pool pool_;
    constructor_injector constructors_;
    member_injector fields_;
    member_injector properties_;
    method_injector methods_;
};

} // namespace libinject
