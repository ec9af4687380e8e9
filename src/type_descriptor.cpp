#include "libinject/type_descriptor.hpp"
#include "libinject/exceptions.hpp"

#include <utility>

namespace libinject {

std::string type_ref::name() const {
    return internal::demangle(storage);
}

type_descriptor::type_descriptor(std::type_index id, std::string name, bool is_abstract)
    : id_(id)
    , name_(std::move(name))
    , is_abstract_(is_abstract)
{}

void type_descriptor::set_base(reflected_base base) {
    if (base_) {
        throw di_error("Type " + name_ + " already declares base "
                       + base_->type->name());
    }
    if (base.type == nullptr || base.upcast == nullptr) {
        throw argument_error("base");
    }
    base_ = base;
}

void type_descriptor::set_fallback_factory(constructor_fn factory) {
    fallback_ = std::move(factory);
}

void type_descriptor::add_constructor(reflected_constructor ctor) {
    if (is_abstract_) {
        throw not_constructible(name_, "abstract types cannot declare constructors");
    }
    constructors_.push_back(std::move(ctor));
}

void type_descriptor::add_field(reflected_field field) {
    fields_.push_back(std::move(field));
}

void type_descriptor::add_property(reflected_property property) {
    properties_.push_back(std::move(property));
}

void type_descriptor::add_method(reflected_method method) {
    methods_.push_back(std::move(method));
}

} // namespace libinject
