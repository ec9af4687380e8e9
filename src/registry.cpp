#include "libinject/registry.hpp"
#include "libinject/resolver.hpp"
#include "stacktrace_utils.hpp"

#include <set>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace libinject {

void validate_descriptors(const std::vector<descriptor>& descriptors,
                          const resolver* parent,
                          injector& inj,
                          std::source_location loc);

struct registry::Impl {
    std::vector<descriptor> descriptors;
    std::set<std::pair<std::type_index, std::string>> slots;
    bool built = false;
};

registry::registry()
    : impl_(std::make_unique<Impl>())
{}

registry::~registry() = default;
registry::registry(registry&&) noexcept = default;
registry& registry::operator=(registry&&) noexcept = default;

const std::vector<descriptor>& registry::descriptors() const {
    return impl_->descriptors;
}

registry& registry::register_component(descriptor d) {
    if (impl_->built) {
        throw di_error("Cannot register components after build() has been called",
                       d.registration_location);
    }
    if (!impl_->slots.emplace(d.component_type, d.key).second) {
        if (d.key.empty()) {
            throw duplicate_registration(d.component_type, d.registration_location);
        }
        throw duplicate_registration(d.component_type, d.key, d.registration_location);
    }
    d.registration_stacktrace = internal::capture_stacktrace();
    impl_->descriptors.push_back(std::move(d));
    return *this;
}

std::shared_ptr<resolver> registry::build(build_options options, std::source_location loc) {
    if (impl_->built) {
        throw di_error("build() can only be called once", loc);
    }

    std::shared_ptr<injector> inj = options.injector;
    if (!inj) {
        inj = options.parent ? options.parent->shared_injector()
                             : std::make_shared<injector>();
    }

    if (options.validate_on_build) {
        validate_descriptors(impl_->descriptors, options.parent.get(), *inj, loc);
    }

    impl_->built = true;
    return resolver::make(impl_->descriptors, std::move(options.parent), std::move(inj));
}

} // namespace libinject
