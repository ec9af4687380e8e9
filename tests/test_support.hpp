#pragma once

#include <libinject.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>

namespace test {

/// In-memory object_resolver for exercising the engine without a container.
/// Values are added under their declared type: `add(std::make_shared<X>())`
/// registers service X, `add(3)` registers int.
class map_resolver : public libinject::object_resolver {
public:
    explicit map_resolver(map_resolver* parent = nullptr) : parent_(parent) {}

    template <typename D>
    map_resolver& add(D v) {
        values_[std::type_index(typeid(libinject::service_type_t<D>))] = libinject::value(std::move(v));
        return *this;
    }

    template <typename D>
    map_resolver& add_keyed(std::string key, D v) {
        keyed_[{std::type_index(typeid(libinject::service_type_t<D>)), std::move(key)}] =
            libinject::value(std::move(v));
        return *this;
    }

    /// Keyed lookups for `key` raise a di_error instead of answering.
    map_resolver& fail_keyed(std::string key) {
        failing_keys_.insert(std::move(key));
        return *this;
    }

    std::optional<libinject::value> try_resolve(std::type_index type) override {
        ++lookups;
        auto it = values_.find(type);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<libinject::value> try_resolve_keyed(std::type_index type,
                                                      std::string_view key) override {
        ++keyed_lookups;
        if (failing_keys_.contains(std::string(key))) {
            throw libinject::di_error("keyed lookup failed for " + std::string(key));
        }
        auto it = keyed_.find({type, std::string(key)});
        if (it == keyed_.end()) return std::nullopt;
        return it->second;
    }

    libinject::object_resolver* parent() const noexcept override { return parent_; }

    int lookups = 0;
    int keyed_lookups = 0;

private:
    map_resolver* parent_;
    std::map<std::type_index, libinject::value> values_;
    std::map<std::pair<std::type_index, std::string>, libinject::value> keyed_;
    std::set<std::string> failing_keys_;
};

/// Build a parameter_info for declared type D.
template <typename D>
libinject::parameter_info make_param(std::string name) {
    libinject::parameter_info p;
    p.name = std::move(name);
    p.type = libinject::type_ref::of<D>();
    return p;
}

} // namespace test
