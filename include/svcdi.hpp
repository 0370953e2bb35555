#pragma once

#include "svcdi/export.hpp"
#include "svcdi/fwd.hpp"
#include "svcdi/lifetime.hpp"
#include "svcdi/service_key.hpp"
#include "svcdi/descriptor.hpp"
#include "svcdi/exceptions.hpp"
#include "svcdi/type_traits.hpp"
#include "svcdi/logging.hpp"
#include "svcdi/registration_store.hpp"
#include "svcdi/scope.hpp"
#include "svcdi/resolver.hpp"
#include "svcdi/registry.hpp"
#include "svcdi/service_provider.hpp"
