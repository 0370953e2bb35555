#pragma once

#include "export.hpp"
#include "descriptor.hpp"
#include "exceptions.hpp"
#include "scope.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

namespace svcdi {

class registration_store;

/// Builds object graphs from a live registration_store.
///
/// Singleton instances are shared by every thread.  The active scope and
/// the resolution stack used for cycle detection are per thread: each
/// thread may have at most one active scope per resolver, and scoped
/// instances are only visible to the thread that began the scope.
///
/// Singleton construction runs under one resolver-wide recursive lock.  A
/// singleton constructor or factory must not block on another thread that
/// resolves a singleton from the same resolver; that thread waits for the
/// lock and the two deadlock.
class SVCDI_EXPORT resolver : public std::enable_shared_from_this<resolver> {
public:
    ~resolver();

    resolver(const resolver&) = delete;
    resolver& operator=(const resolver&) = delete;

    // ---------------------------------------------------------------
    // Single-instance resolution
    // ---------------------------------------------------------------

    /// Resolve T.  Throws not_found if not registered.
    template <typename T>
    std::shared_ptr<T> resolve() {
        return std::static_pointer_cast<T>(resolve_impl(typeid(T), {}, false));
    }

    /// Resolve the registration of T under `key`.
    template <typename T>
    std::shared_ptr<T> resolve(std::string_view key) {
        return std::static_pointer_cast<T>(resolve_impl(typeid(T), key, false));
    }

    /// Resolve T; returns nullptr if T itself is not registered.
    /// Errors raised while building T (missing nested dependencies,
    /// cycles, missing scope) still propagate.
    template <typename T>
    std::shared_ptr<T> try_resolve() {
        return std::static_pointer_cast<T>(resolve_impl(typeid(T), {}, true));
    }

    template <typename T>
    std::shared_ptr<T> try_resolve(std::string_view key) {
        return std::static_pointer_cast<T>(resolve_impl(typeid(T), key, true));
    }

    // ---------------------------------------------------------------
    // Multi-instance resolution
    // ---------------------------------------------------------------

    /// One instance per registered key of T (unkeyed included), in
    /// registration order.  Each entry follows its own lifetime.
    template <typename T>
    std::vector<std::shared_ptr<T>> get_all() {
        auto raw = get_all_impl(typeid(T));
        std::vector<std::shared_ptr<T>> result;
        result.reserve(raw.size());
        for (auto& p : raw) result.push_back(std::static_pointer_cast<T>(std::move(p)));
        return result;
    }

    template <typename T>
    bool is_registered(std::string_view key = {}) const {
        return is_registered(typeid(T), key);
    }

    bool is_registered(std::type_index type, std::string_view key = {}) const;

    // ---------------------------------------------------------------
    // Scopes
    // ---------------------------------------------------------------

    /// Begin a scope on the calling thread.
    /// Throws scope_already_active if this thread already has one.
    scope_token begin_scope();

    /// End the calling thread's scope, releasing its scoped instances.
    /// Throws no_active_scope if none is active.
    void end_scope();

    std::optional<scope_token> active_scope() const;

    /// begin_scope() wrapped in an RAII guard that ends it on destruction.
    std::unique_ptr<scope> create_scope();

    // ---------------------------------------------------------------
    // Maintenance
    // ---------------------------------------------------------------

    /// Drop every cached singleton.  Scoped caches are left to their scopes.
    void clear_cache();

    registration_store& store() noexcept;

private:
    friend class registry;
    friend class scope;

    struct impl;

    static std::shared_ptr<resolver> create(std::shared_ptr<registration_store> store);

    explicit resolver(std::unique_ptr<impl> impl);

    // Non-template core implementations
    std::shared_ptr<void> resolve_impl(std::type_index type, std::string_view key,
                                       bool optional);
    std::vector<std::shared_ptr<void>> get_all_impl(std::type_index type);

    /// Resolve every singleton registration (build_options::eager_singletons).
    void instantiate_singletons();

    /// End a specific scope from its guard, whichever thread runs it.
    void end_scope_token(scope_token token) noexcept;

    std::unique_ptr<impl> impl_;
};

} // namespace svcdi
