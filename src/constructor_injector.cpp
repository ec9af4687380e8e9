#include "libinject/injectors.hpp"
#include "libinject/parameter_resolver.hpp"
#include "injector_support.hpp"

namespace libinject {

constructor_injector::constructor_injector(argument_pool& pool,
                                           const injector_options& options)
    : pool_(pool)
    , options_(options)
{}

erased_ptr constructor_injector::create_instance(const constructor_info* ctor,
                                                 object_resolver* resolver,
                                                 override_list overrides) const {
    if (!ctor) throw argument_error("constructor");
    if (!resolver) throw argument_error("resolver");

    const auto& params = ctor->parameters;
    auto lease = pool_.rent(params.size());
    auto args = lease.args();

    try {
        for (std::size_t i = 0; i < params.size(); ++i) {
            args[i] = resolve_value(params[i], *resolver, overrides);
        }
        return ctor->invoke(args);
    } catch (di_error& e) {
        e.append_resolution_context(ctor->type_name);
        throw;
    } catch (const std::exception& e) {
        resolution_error err(ctor->type_name, e);
        internal::maybe_attach_stacktrace(err, options_, ctor->type_name);
        throw err;
    } catch (...) {
        resolution_error err(ctor->type_name, std::current_exception());
        internal::maybe_attach_stacktrace(err, options_, ctor->type_name);
        throw err;
    }
}

} // namespace libinject
