#pragma once

#include "libinject/export.hpp"
#include "libinject/fwd.hpp"
#include "libinject/erased_ptr.hpp"
#include "libinject/exceptions.hpp"
#include "libinject/type_traits.hpp"
#include "libinject/value.hpp"
#include "libinject/type_descriptor.hpp"
#include "libinject/type_builder.hpp"
#include "libinject/metadata.hpp"
#include "libinject/metadata_cache.hpp"
#include "libinject/argument_pool.hpp"
#include "libinject/options.hpp"
#include "libinject/inject_parameter.hpp"
#include "libinject/object_resolver.hpp"
#include "libinject/parameter_resolver.hpp"
#include "libinject/injectors.hpp"
#include "libinject/injector.hpp"
#include "libinject/logging.hpp"
#include "libinject/descriptor.hpp"
#include "libinject/registry.hpp"
#include "libinject/resolver.hpp"
