#pragma once

/// @file fwd.hpp
/// Forward declarations for all public svcdi symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

#include <cstddef>
#include <cstdint>

namespace svcdi {

// lifetime.hpp
enum class lifetime_kind;

// service_key.hpp
struct service_key;

// descriptor.hpp
struct build_options;
struct dependency_info;
struct constructor_injection;
struct prebuilt_instance;
struct factory_call;
struct descriptor;

// exceptions.hpp
class di_error;
class not_found;
class cyclic_dependency;
class scope_required;
class scope_already_active;
class no_active_scope;
class lifetime_mismatch;
class invalid_registration;
class resolution_error;
class not_configured;
class already_configured;

// registration_store.hpp
class registration_store;

// resolver.hpp
class resolver;

// scope.hpp
enum class scope_token : std::uint64_t;
class scope;

// registry.hpp
template <typename... Deps>
struct deps_tag;
class registry;

// service_provider.hpp
class service_provider;

} // namespace svcdi
