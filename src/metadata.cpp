#include "libinject/metadata.hpp"
#include "libinject/exceptions.hpp"
#include "logging_internal.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace libinject {

namespace {

/// One level of the ancestor chain together with the upcasts that lead
/// from the most-derived object to that level's subobject.
struct chain_level {
    const type_descriptor* type;
    std::vector<upcast_fn> path;
};

std::vector<chain_level> ancestor_chain(const type_descriptor& type) {
    std::vector<chain_level> chain;
    std::unordered_set<const type_descriptor*> seen;
    chain.push_back({&type, {}});
    seen.insert(&type);

    while (const reflected_base* base = chain.back().type->base()) {
        if (!seen.insert(base->type).second) {
            throw di_error("Cyclic base chain in description of " + type.name());
        }
        auto path = chain.back().path;
        path.push_back(base->upcast);
        chain.push_back({base->type, std::move(path)});
    }
    return chain;
}

void* to_level(void* self, const std::vector<upcast_fn>& path) {
    for (auto up : path) self = up(self);
    return self;
}

setter_fn compose(setter_fn set, const std::vector<upcast_fn>& path) {
    if (path.empty()) return set;
    return [set = std::move(set), path](void* self, value v) {
        set(to_level(self, path), std::move(v));
    };
}

method_fn compose(method_fn invoke, const std::vector<upcast_fn>& path) {
    if (path.empty()) return invoke;
    return [invoke = std::move(invoke), path](void* self, std::span<value> args) {
        invoke(to_level(self, path), args);
    };
}

parameter_info to_parameter(const reflected_parameter& p) {
    parameter_info info;
    info.name = p.name;
    info.type = p.type;
    info.key = p.attributes.key;
    info.from_parent = p.attributes.from_parent;
    info.has_default_value = p.default_value.has_value();
    if (info.has_default_value) {
        info.default_value = *p.default_value;
    }
    info.is_optional = p.attributes.optional || info.has_default_value;
    return info;
}

std::vector<parameter_info> to_parameters(const std::vector<reflected_parameter>& params) {
    std::vector<parameter_info> out;
    out.reserve(params.size());
    for (const auto& p : params) out.push_back(to_parameter(p));
    return out;
}

parameter_info to_member_target(const std::string& name, const type_ref& type,
                                const annotations& attrs) {
    parameter_info info;
    info.name = name;
    info.type = type;
    info.is_optional = attrs.optional;
    info.key = attrs.key;
    info.from_parent = attrs.from_parent;
    return info;
}

/// First inject-annotated constructor regardless of visibility; otherwise
/// the public constructor with the most parameters, first declared on a tie.
const reflected_constructor* select_constructor(const type_descriptor& type) {
    const auto& ctors = type.constructors();
    auto annotated = std::find_if(ctors.begin(), ctors.end(),
        [](const reflected_constructor& c) { return c.attributes.inject; });
    if (annotated != ctors.end()) return &*annotated;

    const reflected_constructor* best = nullptr;
    for (const auto& c : ctors) {
        if (c.access != visibility::public_access) continue;
        if (!best || c.parameters.size() > best->parameters.size()) {
            best = &c;
        }
    }
    return best;
}

} // namespace

std::shared_ptr<const injection_metadata> build_metadata(const type_descriptor& type) {
    auto meta = std::make_shared<injection_metadata>();
    meta->target = &type;

    if (const auto* ctor = select_constructor(type)) {
        meta->constructor = constructor_info{
            type.name(), ctor->invoke, to_parameters(ctor->parameters)};
    }

    for (const auto& level : ancestor_chain(type)) {
        for (const auto& f : level.type->fields()) {
            if (!f.attributes.inject) continue;
            meta->fields.push_back(member_info{
                to_member_target(f.name, f.type, f.attributes), compose(f.set, level.path)});
        }

        for (const auto& p : level.type->properties()) {
            if (!p.attributes.inject) continue;
            if (!p.can_write()) {
                internal::log()->warn("Skipping read-only property {}::{} marked for injection",
                                      level.type->name(), p.name);
                continue;
            }
            meta->properties.push_back(member_info{
                to_member_target(p.name, p.type, p.attributes), compose(p.set, level.path)});
        }

        for (const auto& m : level.type->methods()) {
            if (!m.attributes.inject || m.is_accessor) continue;
            meta->methods.push_back(method_info{
                m.name, m.attributes.order, to_parameters(m.parameters),
                compose(m.invoke, level.path)});
        }
    }

    std::stable_sort(meta->methods.begin(), meta->methods.end(),
        [](const method_info& a, const method_info& b) { return a.order < b.order; });

    internal::log()->debug(
        "Built injection metadata for {}: constructor={} ({} params), {} fields, {} properties, {} methods",
        type.name(), meta->constructor.has_value(),
        meta->constructor ? meta->constructor->parameters.size() : 0,
        meta->fields.size(), meta->properties.size(), meta->methods.size());

    return meta;
}

} // namespace libinject
