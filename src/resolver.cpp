#include "libinject/resolver.hpp"
#include "libinject/exceptions.hpp"
#include "stacktrace_utils.hpp"

#include <map>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace libinject {

// ---------------------------------------------------------------
// Slot key: (type, key) → identifies one registration
// ---------------------------------------------------------------

using slot_key = std::pair<std::type_index, std::string>;

// ---------------------------------------------------------------
// Impl: resolver state, immutable after build
// ---------------------------------------------------------------

struct resolver::impl {
    std::vector<descriptor> descriptors;
    std::map<slot_key, std::size_t> slot_to_index;
    std::shared_ptr<resolver> parent;
    std::shared_ptr<injector> inj;

    impl(std::vector<descriptor> descs, std::shared_ptr<resolver> p,
         std::shared_ptr<injector> i)
        : descriptors(std::move(descs))
        , parent(std::move(p))
        , inj(std::move(i))
    {
        for (std::size_t idx = 0; idx < descriptors.size(); ++idx) {
            auto& d = descriptors[idx];
            slot_to_index.emplace(slot_key(d.component_type, d.key), idx);
        }
    }
};

// ---------------------------------------------------------------
// Constructors / Destructor
// ---------------------------------------------------------------

resolver::resolver(std::unique_ptr<impl> p_impl)
    : impl_(std::move(p_impl))
{}

resolver::~resolver() = default;

std::shared_ptr<resolver> resolver::make(std::vector<descriptor> descriptors,
                                         std::shared_ptr<resolver> parent,
                                         std::shared_ptr<injector> inj) {
    auto uni = std::make_unique<impl>(std::move(descriptors), std::move(parent), std::move(inj));
    return std::shared_ptr<resolver>(new resolver(std::move(uni)));
}

// ---------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------

object_resolver* resolver::parent() const noexcept {
    return impl_->parent.get();
}

const std::shared_ptr<resolver>& resolver::parent_resolver() const noexcept {
    return impl_->parent;
}

injector& resolver::get_injector() const noexcept {
    return *impl_->inj;
}

const std::shared_ptr<injector>& resolver::shared_injector() const noexcept {
    return impl_->inj;
}

const std::vector<descriptor>& resolver::descriptors() const noexcept {
    return impl_->descriptors;
}

const descriptor* resolver::find_local(std::type_index type, std::string_view key) const {
    auto it = impl_->slot_to_index.find(slot_key(type, std::string(key)));
    if (it == impl_->slot_to_index.end()) return nullptr;
    return &impl_->descriptors[it->second];
}

bool resolver::contains(std::type_index type, std::string_view key) const {
    if (find_local(type, key)) return true;
    return impl_->parent && impl_->parent->contains(type, key);
}

// ---------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------

value resolver::invoke_factory(const descriptor& desc) {
    try {
        return desc.factory(*this);
    } catch (di_error& e) {
        // Annotate with resolution context so nested failures show the
        // full chain: "... (while resolving B -> A)"
        std::string ctx = internal::demangle(desc.component_type);
        if (desc.impl_descriptor) {
            ctx += " [impl: " + desc.impl_descriptor->name() + "]";
        }
        e.append_resolution_context(ctx);
        if (e.diagnostic_detail().empty()) {
            auto trace = internal::format_registration_trace(desc);
            if (!trace.empty()) e.set_diagnostic_detail(trace);
        }
        throw;
    } catch (const std::exception& e) {
        auto ex = resolution_error(internal::demangle(desc.component_type), e);
        ex.set_diagnostic_detail(internal::format_registration_trace(desc));
        throw ex;
    } catch (...) {
        auto ex = resolution_error(internal::demangle(desc.component_type),
                                   std::current_exception());
        ex.set_diagnostic_detail(internal::format_registration_trace(desc));
        throw ex;
    }
}

std::optional<value> resolver::try_resolve(std::type_index type) {
    if (const auto* desc = find_local(type, {})) {
        return invoke_factory(*desc);
    }
    if (impl_->parent) {
        return impl_->parent->try_resolve(type);
    }
    return std::nullopt;
}

std::optional<value> resolver::try_resolve_keyed(std::type_index type, std::string_view key) {
    if (const auto* desc = find_local(type, key)) {
        return invoke_factory(*desc);
    }
    if (impl_->parent) {
        return impl_->parent->try_resolve_keyed(type, key);
    }
    return std::nullopt;
}

} // namespace libinject
