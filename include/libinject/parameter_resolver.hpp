#pragma once

#include "export.hpp"
#include "inject_parameter.hpp"
#include "metadata.hpp"
#include "object_resolver.hpp"
#include "value.hpp"

namespace libinject {

/// Resolve one dependency.  Strategies are tried in this order and the
/// first that applies wins:
///
///   1. an override in `overrides` that can supply (type, name);
///   2. from-parent: the parent resolver (keyed when a key is set);
///   3. keyed: a keyed lookup on `resolver`;
///   4. an ordinary lookup on `resolver`;
///   5. the default or zero value of an optional dependency.
///
/// Throws no_parent_container or not_found when no strategy applies.
/// Failures inside the parent lookup propagate even for optional
/// dependencies.
LIBINJECT_EXPORT value resolve_value(const parameter_info& param,
                                     object_resolver& resolver,
                                     override_list overrides = {});

} // namespace libinject
