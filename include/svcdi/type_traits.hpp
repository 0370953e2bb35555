#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string_view>
#include <type_traits>
#include <vector>

namespace svcdi {

// ---------------------------------------------------------------
// Core concepts
// ---------------------------------------------------------------

/// TDerived derives from TBase (or TDerived == TBase for self-registration).
template <typename TDerived, typename TBase>
concept derived_from_base = std::is_base_of_v<TBase, TDerived>;

/// T is default-constructible (for zero-dependency registrations).
template <typename T>
concept default_constructible = std::is_default_constructible_v<T>;

// ---------------------------------------------------------------
// fixed_string: string literal usable as a template argument
// ---------------------------------------------------------------

template <std::size_t N>
struct fixed_string {
    char value[N]{};

    constexpr fixed_string(const char (&s)[N]) {
        std::copy_n(s, N, value);
    }

    constexpr std::string_view view() const noexcept { return {value, N - 1}; }
};

// ---------------------------------------------------------------
// Dependency wrapper tag types
// ---------------------------------------------------------------

/// Dependency that may be absent.  Constructor receives a null
/// `std::shared_ptr<T>` when T has no unkeyed registration.
template <typename T>
struct optional_of { using type = T; };

/// Every registration of T across all keys → `std::vector<std::shared_ptr<T>>`.
template <typename T>
struct collection { using type = T; };

/// The registration of T under `Key`.
///   `keyed<IDatabase, "primary">`
template <typename T, fixed_string Key>
struct keyed {
    using type = T;
    static constexpr std::string_view key = Key.view();
};

// ---------------------------------------------------------------
// dep_traits: extract injection metadata from a dep declaration
// ---------------------------------------------------------------

/// Primary: bare `T` → required, inject as `std::shared_ptr<T>`.
template <typename D>
struct dep_traits {
    using interface_type = D;
    using inject_type    = std::shared_ptr<D>;
    static constexpr bool is_collection = false;
    static constexpr bool is_optional   = false;
    static constexpr std::string_view key{};
};

template <typename T>
struct dep_traits<optional_of<T>> {
    using interface_type = T;
    using inject_type    = std::shared_ptr<T>;
    static constexpr bool is_collection = false;
    static constexpr bool is_optional   = true;
    static constexpr std::string_view key{};
};

template <typename T>
struct dep_traits<collection<T>> {
    using interface_type = T;
    using inject_type    = std::vector<std::shared_ptr<T>>;
    static constexpr bool is_collection = true;
    static constexpr bool is_optional   = false;
    static constexpr std::string_view key{};
};

template <typename T, fixed_string Key>
struct dep_traits<keyed<T, Key>> {
    using interface_type = T;
    using inject_type    = std::shared_ptr<T>;
    static constexpr bool is_collection = false;
    static constexpr bool is_optional   = false;
    static constexpr std::string_view key = Key.view();
};

/// Helper alias.
template <typename D>
using inject_type_t = typename dep_traits<D>::inject_type;

// ---------------------------------------------------------------
// Constructibility concepts
// ---------------------------------------------------------------

/// TImpl must be constructible from the injection types of all declared deps.
template <typename TImpl, typename... Deps>
concept constructible_from_deps =
    std::is_constructible_v<TImpl, inject_type_t<Deps>...>;

/// TFactory invoked with the injection types must yield something a
/// `std::shared_ptr<TInterface>` can be built from.
template <typename TFactory, typename TInterface, typename... Deps>
concept factory_for =
    std::is_invocable_v<TFactory&, inject_type_t<Deps>...>
    && std::is_constructible_v<std::shared_ptr<TInterface>,
                               std::invoke_result_t<TFactory&, inject_type_t<Deps>...>>;

} // namespace svcdi
