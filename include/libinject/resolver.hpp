#pragma once

#include "export.hpp"
#include "descriptor.hpp"
#include "exceptions.hpp"
#include "inject_parameter.hpp"
#include "injector.hpp"
#include "object_resolver.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

namespace libinject {

/// The built container.  Services not registered here are looked up in
/// the parent, if any.  A lookup that finds nothing returns an empty
/// optional; a registration whose factory fails raises.
class LIBINJECT_EXPORT resolver final : public object_resolver {
public:
    ~resolver() override;

    resolver(const resolver&) = delete;
    resolver& operator=(const resolver&) = delete;

    std::optional<value> try_resolve(std::type_index type) override;
    std::optional<value> try_resolve_keyed(std::type_index type,
                                           std::string_view key) override;
    object_resolver* parent() const noexcept override;

    const std::shared_ptr<resolver>& parent_resolver() const noexcept;
    injector& get_injector() const noexcept;
    const std::shared_ptr<injector>& shared_injector() const noexcept;

    /// True when (type, key) is registered here or in the parent chain.
    bool contains(std::type_index type, std::string_view key = {}) const;

    const std::vector<descriptor>& descriptors() const noexcept;

    /// Create and inject a `T` against this resolver.
    template <typename T>
    std::unique_ptr<T> create(override_list overrides = {}) {
        return get_injector().create<T>(*this, overrides);
    }

    /// Inject an existing object against this resolver.
    template <typename T>
    void inject(T& instance, override_list overrides = {}) {
        get_injector().inject(instance, *this, overrides);
    }

private:
    friend class registry;

    struct impl;

    static std::shared_ptr<resolver> make(std::vector<descriptor> descriptors,
                                          std::shared_ptr<resolver> parent,
                                          std::shared_ptr<injector> inj);

    explicit resolver(std::unique_ptr<impl> impl);

    const descriptor* find_local(std::type_index type, std::string_view key) const;
    value invoke_factory(const descriptor& desc);

    std::unique_ptr<impl> impl_;
};

} // namespace libinject
