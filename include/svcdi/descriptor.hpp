#pragma once

#include "export.hpp"
#include "lifetime.hpp"
#include "service_key.hpp"

#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <typeindex>
#include <variant>
#include <vector>

namespace svcdi {

class resolver;

// ---------------------------------------------------------------
// build_options: configuration for registry::build()
// ---------------------------------------------------------------

struct build_options {
    bool validate_on_build  = true;
    bool validate_lifetimes = true;
    bool detect_cycles      = true;
    bool eager_singletons   = false;
};

/// Type-erased construction callback.  Receives the resolver so that
/// declared dependencies are resolved through the same dispatch path.
using factory_fn = std::function<std::shared_ptr<void>(resolver&)>;

// ---------------------------------------------------------------
// dependency_info: metadata for a single declared dependency
// ---------------------------------------------------------------

struct dependency_info {
    std::type_index type;
    std::string     key;               // empty = non-keyed
    bool is_collection = false;
    bool is_optional   = false;

    bool operator==(const dependency_info&) const = default;
};

// ---------------------------------------------------------------
// Build strategies: exactly one per descriptor
// ---------------------------------------------------------------

/// Instantiate `impl_type` with its declared dependencies.
struct constructor_injection {
    std::type_index impl_type;
    factory_fn      construct;
};

/// Hand back a value supplied at registration time.
struct prebuilt_instance {
    std::shared_ptr<void> instance;
};

/// Invoke a user callable with its declared dependencies.
struct factory_call {
    factory_fn invoke;
};

using build_strategy = std::variant<constructor_injection, prebuilt_instance, factory_call>;

inline std::string_view strategy_name(const build_strategy& s) noexcept {
    constexpr std::string_view names[] = {"constructor", "instance", "factory"};
    return names[s.index()];
}

// ---------------------------------------------------------------
// descriptor: one component registration record
// ---------------------------------------------------------------

/// Immutable once stored.  Re-registration replaces the whole record.
struct descriptor {
    std::type_index component_type = std::type_index(typeid(void));
    std::string     key;               // empty = non-keyed
    lifetime_kind   lifetime       = lifetime_kind::transient;
    build_strategy  strategy       = prebuilt_instance{};
    std::vector<dependency_info> dependencies;

    /// Assigned by registration_store::put; 0 until stored.
    std::uint64_t registration_id = 0;

    // Diagnostics
    std::source_location registration_location{};
    std::any             registration_stacktrace;
    std::string          api_name;

    service_key slot() const { return service_key{component_type, key}; }

    /// Concrete type built by constructor injection, if any.
    std::optional<std::type_index> impl_type() const {
        if (auto* ci = std::get_if<constructor_injection>(&strategy)) {
            return ci->impl_type;
        }
        return std::nullopt;
    }
};

namespace internal {
/// Capture the current call stack when stacktrace support is compiled in.
SVCDI_EXPORT std::any capture_stacktrace();
} // namespace internal

} // namespace svcdi
