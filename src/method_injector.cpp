#include "libinject/injectors.hpp"
#include "libinject/parameter_resolver.hpp"
#include "injector_support.hpp"

namespace libinject {

method_injector::method_injector(argument_pool& pool, const injector_options& options)
    : pool_(pool)
    , options_(options)
{}

void method_injector::inject(void* instance, const std::vector<method_info>& methods,
                             object_resolver* resolver, override_list overrides,
                             std::string_view owner) const {
    if (methods.empty()) return;
    if (!instance) throw argument_error("instance");
    if (!resolver) throw argument_error("resolver");

    for (const auto& method : methods) {
        const auto& params = method.parameters;
        auto lease = pool_.rent(params.size());
        auto args = lease.args();

        try {
            for (std::size_t i = 0; i < params.size(); ++i) {
                args[i] = resolve_value(params[i], *resolver, overrides);
            }
            method.invoke(instance, args);
        } catch (di_error& e) {
            e.append_resolution_context(internal::member_context(owner, method.name));
            throw;
        } catch (const std::exception& e) {
            resolution_error err(owner, method.name, e);
            internal::maybe_attach_stacktrace(err, options_,
                                              internal::member_context(owner, method.name));
            throw err;
        } catch (...) {
            resolution_error err(owner, method.name, std::current_exception());
            internal::maybe_attach_stacktrace(err, options_,
                                              internal::member_context(owner, method.name));
            throw err;
        }
    }
}

} // namespace libinject
