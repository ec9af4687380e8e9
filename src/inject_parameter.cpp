#include "libinject/inject_parameter.hpp"
#include "libinject/object_resolver.hpp"

#include <utility>

namespace libinject {

named_parameter::named_parameter(std::string name, value v)
    : name_(std::move(name))
    , value_(std::move(v))
{}

named_parameter::named_parameter(std::string name, value_factory factory)
    : name_(std::move(name))
    , factory_(std::move(factory))
{}

bool named_parameter::can_supply(const type_ref& /*type*/, std::string_view name) const {
    return name == name_;
}

value named_parameter::get_value(object_resolver& resolver) const {
    return factory_ ? factory_(resolver) : value_;
}

typed_parameter::typed_parameter(std::type_index service, value v)
    : service_(service)
    , value_(std::move(v))
{}

typed_parameter::typed_parameter(std::type_index service, value_factory factory)
    : service_(service)
    , factory_(std::move(factory))
{}

bool typed_parameter::can_supply(const type_ref& type, std::string_view /*name*/) const {
    return type.service == service_;
}

value typed_parameter::get_value(object_resolver& resolver) const {
    return factory_ ? factory_(resolver) : value_;
}

} // namespace libinject
