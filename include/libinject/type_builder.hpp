#pragma once

#include "erased_ptr.hpp"
#include "exceptions.hpp"
#include "type_descriptor.hpp"
#include "type_traits.hpp"
#include "value.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

namespace libinject {

template <typename T>
class type_builder;

template <typename T>
const type_descriptor& type_of();

// ---------------------------------------------------------------
// param: per-parameter facts for constructor and method parameters
// ---------------------------------------------------------------

class param {
public:
    param(std::string name) : name_(std::move(name)) {}   // NOLINT(google-explicit-constructor)
    param(const char* name) : name_(name) {}              // NOLINT(google-explicit-constructor)

    param& optional() { attributes_.optional = true; return *this; }
    param& keyed(std::string key) { attributes_.key = std::move(key); return *this; }
    param& from_parent() { attributes_.from_parent = true; return *this; }

    /// The default must have exactly the parameter's declared type
    /// (e.g. `std::string("x")`, not `"x"`).
    template <typename V>
    param& default_value(V v) { default_ = value(std::move(v)); return *this; }

    const std::string& name() const noexcept { return name_; }
    const annotations& attributes() const noexcept { return attributes_; }
    const std::optional<value>& declared_default() const noexcept { return default_; }

private:
    std::string name_;
    annotations attributes_;
    std::optional<value> default_;
};

// ---------------------------------------------------------------
// describe: customization point
// ---------------------------------------------------------------

/// Specialize `libinject::describe<T>` with a static `apply`, or give `T`
/// a static member `describe(libinject::type_builder<T>&)`.  Types with
/// neither get a descriptor without injection points.
template <typename T>
struct describe {
    static void apply(type_builder<T>& builder) {
        if constexpr (requires { T::describe(builder); }) {
            T::describe(builder);
        }
    }
};

// ---------------------------------------------------------------
// type_builder: fluent front end producing a type_descriptor
// ---------------------------------------------------------------

template <typename T>
class type_builder {
public:
    type_builder()
        : desc_(std::type_index(typeid(T)), internal::demangle(typeid(T)),
                std::is_abstract_v<T>)
    {
        if constexpr (!std::is_abstract_v<T> && std::is_default_constructible_v<T>) {
            desc_.set_fallback_factory([](std::span<value>) -> erased_ptr {
                return make_erased<T>();
            });
        }
    }

    /// Declare the direct base.  Its injection points are inherited.
    template <typename B>
        requires derived_from_base<T, B> && (!std::is_same_v<T, B>)
    type_builder& base() {
        desc_.set_base(reflected_base{
            &type_of<B>(),
            [](void* p) -> void* { return static_cast<B*>(static_cast<T*>(p)); }
        });
        return *this;
    }

    template <typename... Args>
    type_builder& constructor(std::vector<param> params = {},
                              annotations attrs = {},
                              visibility access = visibility::public_access) {
        static_assert(!std::is_abstract_v<T>,
            "constructor<Args...>: abstract types cannot be constructed");
        static_assert(std::is_constructible_v<T, Args...>,
            "constructor<Args...>: T is not constructible from Args...");

        reflected_constructor ctor;
        ctor.parameters = make_parameters<storage_of_t<Args>...>(
            params, desc_.name() + " constructor");
        ctor.access = access;
        ctor.attributes = std::move(attrs);
        ctor.invoke = [](std::span<value> args) -> erased_ptr {
            return construct<Args...>(args, std::index_sequence_for<Args...>{});
        };
        desc_.add_constructor(std::move(ctor));
        return *this;
    }

    template <auto Member>
        requires std::is_member_object_pointer_v<decltype(Member)>
    type_builder& field(std::string name, annotations attrs = {}) {
        using traits = field_traits<decltype(Member)>;
        using C = typename traits::class_type;
        using F = typename traits::field_type;
        static_assert(derived_from_base<T, C>, "field<&C::m>: C must be T or a base of T");

        reflected_field f;
        f.name = std::move(name);
        f.type = type_ref::of<F>();
        f.attributes = std::move(attrs);
        f.set = [](void* self, value v) {
            static_cast<C*>(static_cast<T*>(self))->*Member = std::any_cast<F>(std::move(v));
        };
        if constexpr (std::is_copy_constructible_v<F>) {
            f.get = [](const void* self) -> value {
                return static_cast<const C*>(static_cast<const T*>(self))->*Member;
            };
        }
        desc_.add_field(std::move(f));
        return *this;
    }

    /// A property is a getter plus an optional setter.  Without a setter
    /// the property is read-only and never injected.  The accessors are
    /// also recorded as methods flagged `is_accessor`.
    template <auto Getter, auto Setter = nullptr>
        requires std::is_member_function_pointer_v<decltype(Getter)>
    type_builder& property(std::string name, annotations attrs = {}) {
        using getter_traits = method_traits<decltype(Getter)>;
        using G = typename getter_traits::class_type;
        using V = storage_of_t<typename getter_traits::return_type>;
        static_assert(getter_traits::arity == 0, "property: getter must take no arguments");
        static_assert(derived_from_base<T, G>, "property: getter must belong to T or a base of T");

        reflected_property p;
        p.name = name;
        p.type = type_ref::of<V>();
        p.attributes = attrs;
        p.get = [](const void* self) -> value {
            auto* obj = static_cast<G*>(static_cast<T*>(const_cast<void*>(self)));
            return value(V((obj->*Getter)()));
        };

        reflected_method getter;
        getter.name = "get_" + name;
        getter.attributes = attrs;
        getter.is_accessor = true;
        getter.invoke = [](void* self, std::span<value>) {
            (static_cast<G*>(static_cast<T*>(self))->*Getter)();
        };
        desc_.add_method(std::move(getter));

        if constexpr (!std::is_same_v<decltype(Setter), std::nullptr_t>) {
            using setter_traits = method_traits<decltype(Setter)>;
            using S = typename setter_traits::class_type;
            static_assert(setter_traits::arity == 1, "property: setter must take one argument");
            static_assert(derived_from_base<T, S>, "property: setter must belong to T or a base of T");
            using A = method_arg_t<decltype(Setter), 0>;

            p.set = [](void* self, value v) {
                (static_cast<S*>(static_cast<T*>(self))->*Setter)(std::any_cast<A>(std::move(v)));
            };

            reflected_method setter;
            setter.name = "set_" + name;
            setter.parameters.push_back(reflected_parameter{"value", type_ref::of<A>(), {}, std::nullopt});
            setter.attributes = attrs;
            setter.is_accessor = true;
            setter.invoke = [](void* self, std::span<value> args) {
                (static_cast<S*>(static_cast<T*>(self))->*Setter)(std::any_cast<A>(std::move(args[0])));
            };
            desc_.add_method(std::move(setter));
        }

        desc_.add_property(std::move(p));
        return *this;
    }

    template <auto Method>
        requires std::is_member_function_pointer_v<decltype(Method)>
    type_builder& method(std::string name, std::vector<param> params = {},
                         annotations attrs = {}) {
        using M = decltype(Method);
        using traits = method_traits<M>;
        static_assert(derived_from_base<T, typename traits::class_type>,
            "method<&C::fn>: C must be T or a base of T");

        reflected_method m;
        m.parameters = method_parameters<M>(params, desc_.name() + "::" + name,
                                            std::make_index_sequence<traits::arity>{});
        m.name = std::move(name);
        m.attributes = std::move(attrs);
        m.invoke = [](void* self, std::span<value> args) {
            call<Method>(self, args, std::make_index_sequence<traits::arity>{});
        };
        desc_.add_method(std::move(m));
        return *this;
    }

    type_descriptor build() && { return std::move(desc_); }

private:
    type_descriptor desc_;

    template <typename A>
    static reflected_parameter make_parameter(std::size_t index,
                                              const std::vector<param>& params,
                                              const std::string& owner) {
        reflected_parameter p;
        p.type = type_ref::of<A>();
        if (index >= params.size()) {
            p.name = "arg" + std::to_string(index);
            return p;
        }

        const auto& given = params[index];
        p.name = given.name();
        p.attributes = given.attributes();
        if (const auto& def = given.declared_default()) {
            if (def->type() != typeid(A)) {
                throw di_error("Default value for parameter '" + p.name + "' of "
                               + owner + " must have type " + p.type.name());
            }
            p.default_value = *def;
        }
        return p;
    }

    template <typename... A>
    static std::vector<reflected_parameter> make_parameters(const std::vector<param>& params,
                                                            const std::string& owner) {
        if (params.size() > sizeof...(A)) {
            throw di_error("Too many parameter descriptions for " + owner + ": "
                           + std::to_string(params.size()) + " given, "
                           + std::to_string(sizeof...(A)) + " declared");
        }
        std::vector<reflected_parameter> out;
        out.reserve(sizeof...(A));
        std::size_t i = 0;
        ([&] { out.push_back(make_parameter<A>(i++, params, owner)); }(), ...);
        return out;
    }

    template <typename M, std::size_t... I>
    static std::vector<reflected_parameter> method_parameters(const std::vector<param>& params,
                                                              const std::string& owner,
                                                              std::index_sequence<I...>) {
        return make_parameters<method_arg_t<M, I>...>(params, owner);
    }

    template <typename... Args, std::size_t... I>
    static erased_ptr construct([[maybe_unused]] std::span<value> args, std::index_sequence<I...>) {
        if (args.size() < sizeof...(Args)) {
            throw std::invalid_argument("argument buffer smaller than constructor arity");
        }
        return make_erased<T>(std::any_cast<storage_of_t<Args>>(std::move(args[I]))...);
    }

    template <auto Method, std::size_t... I>
    static void call(void* self, [[maybe_unused]] std::span<value> args, std::index_sequence<I...>) {
        using M = decltype(Method);
        using C = typename method_traits<M>::class_type;
        if (args.size() < sizeof...(I)) {
            throw std::invalid_argument("argument buffer smaller than method arity");
        }
        (static_cast<C*>(static_cast<T*>(self))->*Method)(
            std::any_cast<method_arg_t<M, I>>(std::move(args[I]))...);
    }
};

// ---------------------------------------------------------------
// type_of: the one descriptor per type
// ---------------------------------------------------------------

template <typename T>
const type_descriptor& type_of() {
    static const type_descriptor descriptor = [] {
        type_builder<T> builder;
        describe<T>::apply(builder);
        return std::move(builder).build();
    }();
    return descriptor;
}

} // namespace libinject
