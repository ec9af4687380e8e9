#include "libinject/injectors.hpp"
#include "libinject/parameter_resolver.hpp"
#include "injector_support.hpp"
#include "logging_internal.hpp"

#include <utility>

namespace libinject {

member_injector::member_injector(std::string kind, const injector_options& options)
    : kind_(std::move(kind))
    , options_(options)
{}

void member_injector::inject(void* instance, const std::vector<member_info>& members,
                             object_resolver* resolver, override_list overrides,
                             std::string_view owner) const {
    if (members.empty()) return;
    if (!instance) throw argument_error("instance");
    if (!resolver) throw argument_error("resolver");

    for (const auto& member : members) {
        try {
            value v = resolve_value(member.target, *resolver, overrides);
            if (member.target.is_optional && member.target.type.holds_zero(v)) {
                if (internal::log_enabled(spdlog::level::trace)) {
                    internal::log()->trace("Left optional {} {} unset",
                                           kind_, internal::member_context(owner, member.name()));
                }
                continue;
            }
            member.set(instance, std::move(v));
        } catch (di_error& e) {
            e.append_resolution_context(internal::member_context(owner, member.name()));
            throw;
        } catch (const std::exception& e) {
            resolution_error err(owner, member.name(), e);
            internal::maybe_attach_stacktrace(err, options_,
                                              internal::member_context(owner, member.name()));
            throw err;
        } catch (...) {
            resolution_error err(owner, member.name(), std::current_exception());
            internal::maybe_attach_stacktrace(err, options_,
                                              internal::member_context(owner, member.name()));
            throw err;
        }
    }
}

} // namespace libinject
