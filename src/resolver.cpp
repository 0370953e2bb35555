#include "svcdi/resolver.hpp"
#include "svcdi/registration_store.hpp"
#include "svcdi/exceptions.hpp"
#include "log_utils.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <unordered_map>
#include <vector>
#include <typeindex>
#include <string>
#include <utility>

namespace svcdi {

namespace {

std::uint64_t next_resolver_id() {
    static std::atomic<std::uint64_t> counter{0};
    return ++counter;
}

std::uint64_t next_scope_token() {
    static std::atomic<std::uint64_t> counter{0};
    return ++counter;
}

// ---------------------------------------------------------------
// Lifetime caches
// ---------------------------------------------------------------

/// A cached instance remembers the registration it was built from; once
/// that slot is re-registered the entry is stale and gets rebuilt.
struct cache_entry {
    std::uint64_t registration_id = 0;
    std::shared_ptr<void> instance;
};

using instance_cache = std::unordered_map<service_key, cache_entry, service_key_hash>;

struct scope_state {
    explicit scope_state(scope_token t) : token(t) {}

    scope_token token;
    instance_cache instances;      // touched only by the owning thread
    std::atomic<bool> ended{false};
};

// ---------------------------------------------------------------
// Per-thread state
// ---------------------------------------------------------------

struct thread_state {
    std::shared_ptr<scope_state> active;
    std::vector<service_key> stack;   // resolution stack for cycle detection

    bool has_scope() const noexcept { return active && !active->ended; }
};

// Set once this thread's state map has been destroyed.  A resolver that
// outlives it (e.g. one held by a static) must not touch the map.
thread_local bool t_states_gone = false;

struct thread_state_map : std::unordered_map<std::uint64_t, thread_state> {
    ~thread_state_map() { t_states_gone = true; }
};

// One entry per resolver this thread is currently using, keyed by resolver id.
thread_local thread_state_map t_states;

/// Pushes one slot onto the resolution stack for the lifetime of the frame.
/// Throws cyclic_dependency (with the full stack plus the repeated slot) if
/// the slot is already being built further up.
class resolution_frame {
public:
    resolution_frame(std::vector<service_key>& stack, service_key key)
        : stack_(stack)
    {
        if (std::find(stack_.begin(), stack_.end(), key) != stack_.end()) {
            std::vector<service_key> cycle(stack_.begin(), stack_.end());
            cycle.push_back(std::move(key));
            throw cyclic_dependency(std::move(cycle));
        }
        stack_.push_back(std::move(key));
    }

    ~resolution_frame() { stack_.pop_back(); }

    resolution_frame(const resolution_frame&) = delete;
    resolution_frame& operator=(const resolution_frame&) = delete;

private:
    std::vector<service_key>& stack_;
};

} // namespace

// ---------------------------------------------------------------
// Impl: shared resolver state
// ---------------------------------------------------------------

struct resolver::impl {
    std::shared_ptr<registration_store> store;
    std::uint64_t id;

    // Singleton cache.  Recursive: a singleton's constructor may resolve
    // further singletons on the same thread.
    std::recursive_mutex singleton_mutex;
    instance_cache singletons;

    // Live scopes by token, so a scope guard can end its scope from any thread.
    std::mutex scopes_mutex;
    std::unordered_map<std::uint64_t, std::weak_ptr<scope_state>> scopes;

    explicit impl(std::shared_ptr<registration_store> s)
        : store(std::move(s))
        , id(next_resolver_id())
    {}

    thread_state& local() { return t_states[id]; }

    thread_state* find_local() {
        auto it = t_states.find(id);
        return it == t_states.end() ? nullptr : &it->second;
    }

    /// Forget this thread's entry once nothing is in flight.
    void release_local_if_idle() noexcept {
        auto it = t_states.find(id);
        if (it != t_states.end() && !it->second.active && it->second.stack.empty()) {
            t_states.erase(it);
        }
    }

    /// Drops the thread's entry when a top-level call returns with nothing
    /// left in flight.
    struct idle_release {
        impl* owner;
        ~idle_release() { owner->release_local_if_idle(); }
    };

    void retire(scope_state& state) noexcept {
        {
            std::lock_guard lock(scopes_mutex);
            scopes.erase(static_cast<std::uint64_t>(state.token));
        }
        state.ended = true;
        // Destroy instances after detaching them, in case a destructor
        // re-enters the resolver.
        instance_cache doomed;
        doomed.swap(state.instances);
        internal::log(spdlog::level::debug, "svcdi: scope {} ended, releasing {} instance(s)",
                      static_cast<std::uint64_t>(state.token), doomed.size());
    }

    std::shared_ptr<void> dispatch(resolver& r, const descriptor& d, thread_state& ts);
    std::shared_ptr<void> construct(resolver& r, const descriptor& d);
    std::string slot_hint(std::type_index type, std::string_view key) const;
};

// ---------------------------------------------------------------
// Lifetime dispatch
// ---------------------------------------------------------------

std::shared_ptr<void> resolver::impl::dispatch(resolver& r, const descriptor& d,
                                               thread_state& ts) {
    const auto slot = d.slot();

    switch (d.lifetime) {
        case lifetime_kind::singleton: {
            // Check, construct and store under one lock so no singleton is
            // ever built twice.
            std::lock_guard lock(singleton_mutex);
            auto it = singletons.find(slot);
            if (it != singletons.end() && it->second.registration_id == d.registration_id) {
                return it->second.instance;
            }
            auto instance = construct(r, d);
            singletons.insert_or_assign(slot, cache_entry{d.registration_id, instance});
            return instance;
        }

        case lifetime_kind::scoped: {
            // Hold the state: construction may end the scope underneath us.
            auto state = ts.active;
            if (!state || state->ended) {
                throw scope_required(d.component_type, d.key);
            }
            auto it = state->instances.find(slot);
            if (it != state->instances.end() && it->second.registration_id == d.registration_id) {
                return it->second.instance;
            }
            auto instance = construct(r, d);
            if (!state->ended) {
                state->instances.insert_or_assign(slot, cache_entry{d.registration_id, instance});
            }
            return instance;
        }

        case lifetime_kind::transient:
            return construct(r, d);
    }

    throw di_error("Invalid lifetime_kind");
}

std::shared_ptr<void> resolver::impl::construct(resolver& r, const descriptor& d) {
    if (const auto* pre = std::get_if<prebuilt_instance>(&d.strategy)) {
        return pre->instance;
    }

    if (internal::should_log(spdlog::level::trace)) {
        internal::log(spdlog::level::trace, "svcdi: constructing {} ({}, {})",
                      internal::describe_descriptor(d), to_string(d.lifetime),
                      strategy_name(d.strategy));
    }

    try {
        std::shared_ptr<void> instance;
        if (const auto* ci = std::get_if<constructor_injection>(&d.strategy)) {
            instance = ci->construct(r);
        } else {
            instance = std::get<factory_call>(d.strategy).invoke(r);
        }
        if (!instance) {
            throw di_error("factory returned null");
        }
        return instance;
    } catch (di_error& e) {
        // Annotate with resolution context so nested failures show the
        // full chain: "... (while resolving B -> A)". Caught by non-const
        // reference so the exception can be enriched before rethrowing.
        e.append_resolution_context(internal::describe_descriptor(d));
        if (e.diagnostic_detail().empty()) {
            auto trace = internal::format_registration_trace(d);
            if (!trace.empty()) e.set_diagnostic_detail(trace);
        }
        throw;
    } catch (const std::exception& e) {
        auto ex = resolution_error(d.component_type, e,
                                   d.registration_location,
                                   std::source_location::current());
        ex.set_diagnostic_detail(internal::format_registration_trace(d));
        throw ex;
    }
}

// ---------------------------------------------------------------
// Diagnostic: which keys exist when the requested one does not
// ---------------------------------------------------------------

std::string resolver::impl::slot_hint(std::type_index type, std::string_view key) const {
    auto registered = store->all_for(type);
    if (registered.empty()) return {};

    std::string keys;
    for (const auto& d : registered) {
        if (!keys.empty()) keys += ", ";
        keys += d->key.empty() ? std::string("<unkeyed>") : "\"" + d->key + "\"";
    }
    return std::string("type is registered under ") + keys
           + " but was requested " + (key.empty() ? std::string("unkeyed")
                                                  : "with key \"" + std::string(key) + "\"");
}

// ---------------------------------------------------------------
// Constructors / Destructor
// ---------------------------------------------------------------

resolver::resolver(std::unique_ptr<impl> p_impl)
    : impl_(std::move(p_impl))
{}

resolver::~resolver() {
    if (!t_states_gone) {
        t_states.erase(impl_->id);
    }
}

std::shared_ptr<resolver> resolver::create(std::shared_ptr<registration_store> store) {
    auto uni = std::make_unique<impl>(std::move(store));
    return std::shared_ptr<resolver>(new resolver(std::move(uni)));
}

// ---------------------------------------------------------------
// Non-template core: resolve
// ---------------------------------------------------------------

std::shared_ptr<void> resolver::resolve_impl(std::type_index type, std::string_view key,
                                             bool optional) {
    auto& ts = impl_->local();
    impl::idle_release release{impl_.get()};
    resolution_frame frame(ts.stack, service_key{type, std::string(key)});

    auto desc = impl_->store->lookup(type, key);
    if (!desc) {
        if (optional) return nullptr;
        throw not_found(type, key, impl_->slot_hint(type, key));
    }
    return impl_->dispatch(*this, *desc, ts);
}

std::vector<std::shared_ptr<void>> resolver::get_all_impl(std::type_index type) {
    auto descs = impl_->store->all_for(type);

    auto& ts = impl_->local();
    impl::idle_release release{impl_.get()};

    std::vector<std::shared_ptr<void>> result;
    result.reserve(descs.size());
    for (const auto& d : descs) {
        resolution_frame frame(ts.stack, d->slot());
        result.push_back(impl_->dispatch(*this, *d, ts));
    }
    return result;
}

bool resolver::is_registered(std::type_index type, std::string_view key) const {
    return impl_->store->is_registered(type, key);
}

void resolver::instantiate_singletons() {
    for (const auto& d : impl_->store->snapshot()) {
        if (d->lifetime == lifetime_kind::singleton) {
            resolve_impl(d->component_type, d->key, false);
        }
    }
}

// ---------------------------------------------------------------
// Scopes
// ---------------------------------------------------------------

scope_token resolver::begin_scope() {
    auto& ts = impl_->local();
    if (ts.has_scope()) {
        throw scope_already_active(static_cast<std::uint64_t>(ts.active->token));
    }

    auto token = scope_token{next_scope_token()};
    auto state = std::make_shared<scope_state>(token);
    {
        std::lock_guard lock(impl_->scopes_mutex);
        impl_->scopes[static_cast<std::uint64_t>(token)] = state;
    }
    ts.active = std::move(state);

    internal::log(spdlog::level::debug, "svcdi: scope {} begun",
                  static_cast<std::uint64_t>(token));
    return token;
}

void resolver::end_scope() {
    auto* ts = impl_->find_local();
    if (!ts || !ts->has_scope()) {
        if (ts) {
            ts->active.reset();
            impl_->release_local_if_idle();
        }
        throw no_active_scope();
    }

    auto state = std::move(ts->active);
    impl_->retire(*state);
    impl_->release_local_if_idle();
}

void resolver::end_scope_token(scope_token token) noexcept {
    auto* ts = impl_->find_local();
    if (ts && ts->active && ts->active->token == token) {
        auto state = std::move(ts->active);
        if (!state->ended) impl_->retire(*state);
        impl_->release_local_if_idle();
        return;
    }

    // Guard destroyed on another thread than the one that began the scope.
    // The instance map belongs to the owning thread, so only mark the scope
    // ended here; its instances go when that thread drops the state.
    std::shared_ptr<scope_state> state;
    {
        std::lock_guard lock(impl_->scopes_mutex);
        auto it = impl_->scopes.find(static_cast<std::uint64_t>(token));
        if (it != impl_->scopes.end()) {
            state = it->second.lock();
            impl_->scopes.erase(it);
        }
    }
    if (state && !state->ended.exchange(true)) {
        internal::log(spdlog::level::debug, "svcdi: scope {} ended from another thread",
                      static_cast<std::uint64_t>(token));
    }
}

std::optional<scope_token> resolver::active_scope() const {
    auto* ts = impl_->find_local();
    if (!ts || !ts->has_scope()) return std::nullopt;
    return ts->active->token;
}

std::unique_ptr<scope> resolver::create_scope() {
    auto self = shared_from_this();
    auto token = begin_scope();
    return std::unique_ptr<scope>(new scope(std::move(self), token));
}

// ---------------------------------------------------------------
// Maintenance
// ---------------------------------------------------------------

void resolver::clear_cache() {
    instance_cache doomed;
    {
        std::lock_guard lock(impl_->singleton_mutex);
        doomed.swap(impl_->singletons);
    }
    internal::log(spdlog::level::debug, "svcdi: cleared {} cached singleton(s)", doomed.size());
}

registration_store& resolver::store() noexcept {
    return *impl_->store;
}

} // namespace svcdi
