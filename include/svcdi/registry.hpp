#pragma once

#include "export.hpp"
#include "descriptor.hpp"
#include "registration_store.hpp"
#include "resolver.hpp"
#include "exceptions.hpp"
#include "type_traits.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <tuple>
#include <typeindex>
#include <type_traits>
#include <utility>
#include <vector>

namespace svcdi {

/// A zero-size tag type that carries a compile-time dependency type list.
template <typename... Deps>
struct deps_tag {
    using type_list = std::tuple<Deps...>;
    static constexpr std::size_t count = sizeof...(Deps);
};

template <typename... Deps>
inline constexpr deps_tag<Deps...> deps{};

// ---------------------------------------------------------------
// Helpers: resolve declared deps at construction time
// ---------------------------------------------------------------
namespace detail {

template <typename D>
auto resolve_dep(resolver& r) -> inject_type_t<D> {
    using traits = dep_traits<D>;
    using I = typename traits::interface_type;

    if constexpr (traits::is_collection) {
        return r.get_all<I>();
    } else if constexpr (traits::is_optional) {
        return r.try_resolve<I>();
    } else if constexpr (!traits::key.empty()) {
        return r.resolve<I>(traits::key);
    } else {
        return r.resolve<I>();
    }
}

/// Resolve every dep in declaration order.  Braced initialisation
/// sequences the calls left to right.
template <typename... Deps>
std::tuple<inject_type_t<Deps>...> resolve_deps(resolver& r) {
    return std::tuple<inject_type_t<Deps>...>{resolve_dep<Deps>(r)...};
}

template <typename TInterface, typename TImpl, typename... Deps>
std::shared_ptr<void> construct(resolver& r) {
    return std::apply([](auto&&... args) -> std::shared_ptr<void> {
        std::shared_ptr<TInterface> p =
            std::make_shared<TImpl>(std::forward<decltype(args)>(args)...);
        return p;
    }, resolve_deps<Deps...>(r));
}

template <typename TInterface, typename TFactory, typename... Deps>
factory_fn wrap_factory(TFactory factory) {
    return [factory = std::move(factory)](resolver& r) mutable -> std::shared_ptr<void> {
        std::shared_ptr<TInterface> p = std::apply([&](auto&&... args) {
            return std::shared_ptr<TInterface>(
                std::invoke(factory, std::forward<decltype(args)>(args)...));
        }, resolve_deps<Deps...>(r));
        return p;
    };
}

/// Build a vector<dependency_info> from deps type list.
template <typename... Deps>
std::vector<dependency_info> make_dep_infos() {
    return { dependency_info{
        std::type_index(typeid(typename dep_traits<Deps>::interface_type)),
        std::string(dep_traits<Deps>::key),
        dep_traits<Deps>::is_collection,
        dep_traits<Deps>::is_optional
    }... };
}

} // namespace detail

// ---------------------------------------------------------------
// registry
// ---------------------------------------------------------------

/// Registration front-end.  Every add_* call builds a descriptor with the
/// dependencies declared through deps<...> and stores it, overwriting any
/// earlier registration of the same (interface, key).
class SVCDI_EXPORT registry {
public:
    registry();
    ~registry();

    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;
    registry(registry&&) noexcept;
    registry& operator=(registry&&) noexcept;

    // ===============================================================
    // Constructor injection, lifetime chosen at run time
    // ===============================================================

    template <typename TInterface, typename TImpl = TInterface>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    registry& add(lifetime_kind lifetime, std::source_location loc = std::source_location::current()) {
        return add_constructed<TInterface, TImpl>(lifetime, std::nullopt, loc, "add");
    }

    template <typename TInterface, typename TImpl = TInterface, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    registry& add(lifetime_kind lifetime, deps_tag<Deps...>, std::source_location loc = std::source_location::current()) {
        return add_constructed<TInterface, TImpl, Deps...>(lifetime, std::nullopt, loc, "add");
    }

    template <typename TInterface, typename TImpl = TInterface>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    registry& add(std::string_view key, lifetime_kind lifetime, std::source_location loc = std::source_location::current()) {
        return add_constructed<TInterface, TImpl>(lifetime, key, loc, "add");
    }

    template <typename TInterface, typename TImpl = TInterface, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    registry& add(std::string_view key, lifetime_kind lifetime, deps_tag<Deps...>, std::source_location loc = std::source_location::current()) {
        return add_constructed<TInterface, TImpl, Deps...>(lifetime, key, loc, "add");
    }

    // ===============================================================
    // Singleton
    // ===============================================================

    /// Zero-dep singleton
    template <typename TInterface, typename TImpl = TInterface>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    registry& add_singleton(std::source_location loc = std::source_location::current()) {
        return add_constructed<TInterface, TImpl>(lifetime_kind::singleton, std::nullopt, loc, "add_singleton");
    }

    /// Singleton with deps
    template <typename TInterface, typename TImpl = TInterface, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    registry& add_singleton(deps_tag<Deps...>, std::source_location loc = std::source_location::current()) {
        return add_constructed<TInterface, TImpl, Deps...>(lifetime_kind::singleton, std::nullopt, loc, "add_singleton");
    }

    /// Keyed zero-dep singleton
    template <typename TInterface, typename TImpl = TInterface>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    registry& add_singleton(std::string_view key, std::source_location loc = std::source_location::current()) {
        return add_constructed<TInterface, TImpl>(lifetime_kind::singleton, key, loc, "add_singleton");
    }

    /// Keyed singleton with deps
    template <typename TInterface, typename TImpl = TInterface, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    registry& add_singleton(std::string_view key, deps_tag<Deps...>, std::source_location loc = std::source_location::current()) {
        return add_constructed<TInterface, TImpl, Deps...>(lifetime_kind::singleton, key, loc, "add_singleton");
    }

    // ===============================================================
    // Scoped
    // ===============================================================

    template <typename TInterface, typename TImpl = TInterface>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    registry& add_scoped(std::source_location loc = std::source_location::current()) {
        return add_constructed<TInterface, TImpl>(lifetime_kind::scoped, std::nullopt, loc, "add_scoped");
    }

    template <typename TInterface, typename TImpl = TInterface, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    registry& add_scoped(deps_tag<Deps...>, std::source_location loc = std::source_location::current()) {
        return add_constructed<TInterface, TImpl, Deps...>(lifetime_kind::scoped, std::nullopt, loc, "add_scoped");
    }

    template <typename TInterface, typename TImpl = TInterface>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    registry& add_scoped(std::string_view key, std::source_location loc = std::source_location::current()) {
        return add_constructed<TInterface, TImpl>(lifetime_kind::scoped, key, loc, "add_scoped");
    }

    template <typename TInterface, typename TImpl = TInterface, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    registry& add_scoped(std::string_view key, deps_tag<Deps...>, std::source_location loc = std::source_location::current()) {
        return add_constructed<TInterface, TImpl, Deps...>(lifetime_kind::scoped, key, loc, "add_scoped");
    }

    // ===============================================================
    // Transient
    // ===============================================================

    template <typename TInterface, typename TImpl = TInterface>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    registry& add_transient(std::source_location loc = std::source_location::current()) {
        return add_constructed<TInterface, TImpl>(lifetime_kind::transient, std::nullopt, loc, "add_transient");
    }

    template <typename TInterface, typename TImpl = TInterface, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    registry& add_transient(deps_tag<Deps...>, std::source_location loc = std::source_location::current()) {
        return add_constructed<TInterface, TImpl, Deps...>(lifetime_kind::transient, std::nullopt, loc, "add_transient");
    }

    template <typename TInterface, typename TImpl = TInterface>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    registry& add_transient(std::string_view key, std::source_location loc = std::source_location::current()) {
        return add_constructed<TInterface, TImpl>(lifetime_kind::transient, key, loc, "add_transient");
    }

    template <typename TInterface, typename TImpl = TInterface, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    registry& add_transient(std::string_view key, deps_tag<Deps...>, std::source_location loc = std::source_location::current()) {
        return add_constructed<TInterface, TImpl, Deps...>(lifetime_kind::transient, key, loc, "add_transient");
    }

    // ===============================================================
    // Prebuilt instances
    // ===============================================================

    /// Register an existing object.  It is handed back as-is whatever the
    /// lifetime, so even a transient instance registration always yields
    /// the same object.
    template <typename TInterface>
    registry& add_instance(std::shared_ptr<TInterface> instance,
                           lifetime_kind lifetime = lifetime_kind::singleton,
                           std::source_location loc = std::source_location::current()) {
        return register_component(typeid(TInterface), std::nullopt, lifetime,
                                  make_instance_strategy<TInterface>(std::move(instance)),
                                  {}, loc, "add_instance");
    }

    template <typename TInterface>
    registry& add_instance(std::string_view key, std::shared_ptr<TInterface> instance,
                           lifetime_kind lifetime = lifetime_kind::singleton,
                           std::source_location loc = std::source_location::current()) {
        return register_component(typeid(TInterface), key, lifetime,
                                  make_instance_strategy<TInterface>(std::move(instance)),
                                  {}, loc, "add_instance");
    }

    // ===============================================================
    // Factories
    // ===============================================================

    /// Zero-dep factory: `factory()` returns something convertible to
    /// `std::shared_ptr<TInterface>`.
    template <typename TInterface, typename TFactory>
        requires factory_for<TFactory, TInterface>
    registry& add_factory(lifetime_kind lifetime, TFactory factory,
                          std::source_location loc = std::source_location::current()) {
        return register_component(typeid(TInterface), std::nullopt, lifetime,
                                  factory_call{detail::wrap_factory<TInterface, TFactory>(std::move(factory))},
                                  {}, loc, "add_factory");
    }

    /// Factory with deps: `factory(inject_type_t<Deps>...)`.
    template <typename TInterface, typename... Deps, typename TFactory>
        requires factory_for<TFactory, TInterface, Deps...>
    registry& add_factory(lifetime_kind lifetime, deps_tag<Deps...>, TFactory factory,
                          std::source_location loc = std::source_location::current()) {
        return register_component(typeid(TInterface), std::nullopt, lifetime,
                                  factory_call{detail::wrap_factory<TInterface, TFactory, Deps...>(std::move(factory))},
                                  detail::make_dep_infos<Deps...>(), loc, "add_factory");
    }

    template <typename TInterface, typename TFactory>
        requires factory_for<TFactory, TInterface>
    registry& add_factory(std::string_view key, lifetime_kind lifetime, TFactory factory,
                          std::source_location loc = std::source_location::current()) {
        return register_component(typeid(TInterface), key, lifetime,
                                  factory_call{detail::wrap_factory<TInterface, TFactory>(std::move(factory))},
                                  {}, loc, "add_factory");
    }

    template <typename TInterface, typename... Deps, typename TFactory>
        requires factory_for<TFactory, TInterface, Deps...>
    registry& add_factory(std::string_view key, lifetime_kind lifetime, deps_tag<Deps...>, TFactory factory,
                          std::source_location loc = std::source_location::current()) {
        return register_component(typeid(TInterface), key, lifetime,
                                  factory_call{detail::wrap_factory<TInterface, TFactory, Deps...>(std::move(factory))},
                                  detail::make_dep_infos<Deps...>(), loc, "add_factory");
    }

    // ===============================================================
    // Queries
    // ===============================================================

    template <typename T>
    bool is_registered(std::string_view key = {}) const {
        return store_->is_registered(typeid(T), key);
    }

    /// Current registrations, in insertion order.
    std::vector<registration_store::descriptor_ptr> descriptors() const;

    registration_store& store() noexcept { return *store_; }

    /// Drop every registration.  Resolvers built from this registry see
    /// the empty store.
    void clear();

    // ===============================================================
    // Build
    // ===============================================================

    /// Create a resolver over this registry's store.  The store stays live:
    /// registrations made after build() are visible to the resolver.
    std::shared_ptr<resolver> build(build_options options = {},
                                    std::source_location loc = std::source_location::current());

private:
    template <typename TInterface, typename TImpl, typename... Deps>
    registry& add_constructed(lifetime_kind lifetime, std::optional<std::string_view> key,
                              std::source_location loc, const char* api_name) {
        return register_component(
            typeid(TInterface), key, lifetime,
            constructor_injection{std::type_index(typeid(TImpl)),
                                  &detail::construct<TInterface, TImpl, Deps...>},
            detail::make_dep_infos<Deps...>(), loc, api_name);
    }

    template <typename TInterface>
    static prebuilt_instance make_instance_strategy(std::shared_ptr<TInterface> instance) {
        if (!instance) {
            throw invalid_registration(typeid(TInterface), "instance must not be null");
        }
        return prebuilt_instance{std::static_pointer_cast<void>(std::move(instance))};
    }

    // Non-template registration core.  `key` is nullopt for the unkeyed
    // slot; an explicit key must not be empty.
    registry& register_component(std::type_index type,
                                 std::optional<std::string_view> key,
                                 lifetime_kind lifetime,
                                 build_strategy strategy,
                                 std::vector<dependency_info> deps,
                                 std::source_location loc,
                                 const char* api_name);

    std::shared_ptr<registration_store> store_;
};

} // namespace svcdi
