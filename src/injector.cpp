#include "libinject/injector.hpp"
#include "injector_support.hpp"
#include "logging_internal.hpp"

#include <utility>

namespace libinject {

injector::injector(injector_options options, std::shared_ptr<metadata_cache> cache)
    : options_(options)
    , cache_(cache ? std::move(cache) : std::make_shared<metadata_cache>())
    , pool_(options_.pooled_buffers_per_arity)
    , constructors_(pool_, options_)
    , fields_("field", options_)
    , properties_("property", options_)
    , methods_(pool_, options_)
{}

std::shared_ptr<const injection_metadata> injector::metadata(const type_descriptor& type) {
    return cache_->get_or_create(type);
}

bool injector::requires_injection(const type_descriptor& type) {
    return metadata(type)->has_injection_points();
}

void injector::clear_cache() {
    cache_->clear();
}

erased_ptr injector::create_instance(const type_descriptor& type, object_resolver* resolver,
                                     override_list overrides) {
    if (!resolver) throw argument_error("resolver");
    if (type.is_abstract()) {
        throw not_constructible(type.name(), "type is abstract");
    }

    auto meta = metadata(type);
    erased_ptr obj;

    if (meta->constructor) {
        obj = constructors_.create_instance(&*meta->constructor, resolver, overrides);
    } else if (options_.allow_default_construction && type.fallback_factory()) {
        try {
            obj = type.fallback_factory()({});
        } catch (di_error& e) {
            e.append_resolution_context(type.name());
            throw;
        } catch (const std::exception& e) {
            resolution_error err(type.name(), e);
            internal::maybe_attach_stacktrace(err, options_, type.name());
            throw err;
        } catch (...) {
            resolution_error err(type.name(), std::current_exception());
            internal::maybe_attach_stacktrace(err, options_, type.name());
            throw err;
        }
    } else {
        throw not_constructible(type.name(),
            options_.allow_default_construction
                ? "no usable constructor"
                : "no usable constructor and default construction is disabled");
    }

    if (internal::log_enabled(spdlog::level::trace)) {
        internal::log()->trace("Created instance of {}", type.name());
    }
    return obj;
}

void injector::inject_all(void* instance, const type_descriptor& type,
                          object_resolver* resolver, override_list overrides) {
    if (!instance) throw argument_error("instance");
    if (!resolver) throw argument_error("resolver");

    auto meta = metadata(type);
    fields_.inject(instance, meta->fields, resolver, overrides, type.name());
    properties_.inject(instance, meta->properties, resolver, overrides, type.name());
    methods_.inject(instance, meta->methods, resolver, overrides, type.name());
}

erased_ptr injector::instantiate(const type_descriptor& type, object_resolver* resolver,
                                 override_list overrides) {
    erased_ptr obj = create_instance(type, resolver, overrides);
    inject_all(obj.get(), type, resolver, overrides);
    return obj;
}

} // namespace libinject
