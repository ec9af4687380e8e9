#include "libinject/descriptor.hpp"
#include "libinject/exceptions.hpp"
#include "libinject/injector.hpp"
#include "libinject/resolver.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <map>
#include <source_location>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace libinject {

// slot_key = (type, key)
using slot_key = std::pair<std::type_index, std::string>;

namespace {

struct dependency {
    std::type_index type;
    std::string key;
    std::string name;
    bool from_parent = false;
    bool optional = false;
};

// Build an index from slot_key → descriptor index
auto build_slot_index(const std::vector<descriptor>& descriptors) {
    std::map<slot_key, std::size_t> idx;
    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        idx.emplace(slot_key(descriptors[i].component_type, descriptors[i].key), i);
    }
    return idx;
}

// ------------------------------------------------------------------
// Dependencies of an add_type registration, from its injection metadata.
// Dependencies its own overrides can supply are left out.
// ------------------------------------------------------------------
std::vector<dependency> collect_dependencies(const descriptor& desc, injector& inj) {
    std::vector<dependency> out;
    if (desc.kind != registration_kind::type || !desc.impl_descriptor) return out;

    auto meta = inj.metadata(*desc.impl_descriptor);
    auto add = [&](const parameter_info& p) {
        for (const auto& o : desc.overrides) {
            if (o && o->can_supply(p.type, p.name)) return;
        }
        out.push_back(dependency{p.type.service, p.key.value_or(std::string{}), p.name,
                                 p.from_parent, p.is_optional || p.has_default_value});
    };

    if (meta->constructor) {
        for (const auto& p : meta->constructor->parameters) add(p);
    }
    for (const auto& f : meta->fields) add(f.target);
    for (const auto& p : meta->properties) add(p.target);
    for (const auto& m : meta->methods) {
        for (const auto& p : m.parameters) add(p);
    }
    return out;
}

std::string consumer_hint(const descriptor& desc) {
    std::string hint = "required by " + internal::demangle(desc.component_type);
    if (desc.impl_descriptor) {
        hint += " [impl: " + desc.impl_descriptor->name() + "]";
    }
    if (desc.registration_location.file_name()[0]) {
        hint += " registered at "
            + std::string(desc.registration_location.file_name())
            + ":" + std::to_string(desc.registration_location.line());
    }
    return hint;
}

// ------------------------------------------------------------------
// Check that every add_type registration can be constructed
// ------------------------------------------------------------------
void check_constructible(const std::vector<descriptor>& descriptors,
                         injector& inj,
                         std::source_location loc) {
    for (auto& desc : descriptors) {
        if (desc.kind != registration_kind::type || !desc.impl_descriptor) continue;
        const auto& impl = *desc.impl_descriptor;
        if (inj.metadata(impl)->constructor) continue;
        if (inj.options().allow_default_construction && impl.fallback_factory()) continue;

        auto ex = not_constructible(impl.name(), "no usable constructor; " + consumer_hint(desc), loc);
        ex.set_diagnostic_detail(internal::format_registration_trace(desc));
        throw ex;
    }
}

// ------------------------------------------------------------------
// Check that every required dependency has a matching slot, here or
// in the parent chain
// ------------------------------------------------------------------
void check_missing_dependencies(
        const std::vector<descriptor>& descriptors,
        const std::map<slot_key, std::size_t>& slot_idx,
        const resolver* parent,
        injector& inj,
        std::source_location loc) {
    for (auto& desc : descriptors) {
        for (auto& dep : collect_dependencies(desc, inj)) {
            if (dep.optional) continue;

            if (dep.from_parent) {
                if (!parent) {
                    auto ex = no_parent_container(dep.type, dep.name, loc);
                    ex.set_diagnostic_detail(internal::format_registration_trace(desc));
                    throw ex;
                }
                if (parent->contains(dep.type, dep.key)) continue;
            } else {
                if (slot_idx.contains(slot_key(dep.type, dep.key))) continue;
                if (parent && parent->contains(dep.type, dep.key)) continue;
            }

            auto ex = not_found(dep.type, dep.key, consumer_hint(desc), loc);
            ex.set_diagnostic_detail(internal::format_registration_trace(desc));
            throw ex;
        }
    }
}

// ------------------------------------------------------------------
// Cycle detection (DFS on the add_type dependency graph)
// ------------------------------------------------------------------
enum class visit_state { unvisited, in_progress, done };

struct cycle_search {
    const std::vector<descriptor>& descriptors;
    const std::map<slot_key, std::size_t>& slot_idx;
    injector& inj;
    std::source_location loc;

    std::map<slot_key, visit_state> states;
    std::vector<slot_key> path;

    void visit(const slot_key& node) {
        auto& state = states[node];
        if (state == visit_state::done) return;
        if (state == visit_state::in_progress) {
            report(node);
        }

        state = visit_state::in_progress;
        path.push_back(node);

        auto it = slot_idx.find(node);
        if (it != slot_idx.end()) {
            for (auto& dep : collect_dependencies(descriptors[it->second], inj)) {
                if (dep.from_parent) continue;
                slot_key next(dep.type, dep.key);
                if (slot_idx.contains(next)) visit(next);
            }
        }

        path.pop_back();
        states[node] = visit_state::done;
    }

    [[noreturn]] void report(const slot_key& node) {
        // Build cycle path from where the node first appears
        auto first = std::find(path.begin(), path.end(), node);
        std::vector<std::type_index> cycle;
        for (auto p = first; p != path.end(); ++p) cycle.push_back(p->first);
        cycle.push_back(node.first);

        auto ex = cyclic_dependency(cycle, loc);
        // Attach registration stacktraces for all slots in the cycle
        std::string detail;
        for (auto p = first; p != path.end(); ++p) {
            std::string trace = internal::format_registration_trace(
                descriptors[slot_idx.at(*p)]);
            if (!trace.empty()) {
                if (!detail.empty()) detail += "\n";
                detail += trace;
            }
        }
        if (!detail.empty()) ex.set_diagnostic_detail(detail);
        throw ex;
    }
};

void check_cycles(const std::vector<descriptor>& descriptors,
                  const std::map<slot_key, std::size_t>& slot_idx,
                  injector& inj,
                  std::source_location loc) {
    cycle_search search{descriptors, slot_idx, inj, loc, {}, {}};
    for (auto& desc : descriptors) {
        if (desc.kind == registration_kind::type) {
            search.visit(slot_key(desc.component_type, desc.key));
        }
    }
}

} // anonymous namespace

// ------------------------------------------------------------------
// Public entry point called by registry::build
// ------------------------------------------------------------------
void validate_descriptors(const std::vector<descriptor>& descriptors,
                          const resolver* parent,
                          injector& inj,
                          std::source_location loc) {
    auto slot_idx = build_slot_index(descriptors);

    check_constructible(descriptors, inj, loc);
    check_missing_dependencies(descriptors, slot_idx, parent, inj, loc);
    check_cycles(descriptors, slot_idx, inj, loc);
}

} // namespace libinject
