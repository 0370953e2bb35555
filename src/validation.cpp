#include "svcdi/descriptor.hpp"
#include "svcdi/exceptions.hpp"
#include "svcdi/registration_store.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <map>
#include <source_location>
#include <string>
#include <vector>

namespace svcdi {

namespace {

using descriptor_ptr = registration_store::descriptor_ptr;
using slot_index = std::map<service_key, const descriptor*>;

slot_index build_slot_index(const std::vector<descriptor_ptr>& descriptors) {
    slot_index idx;
    for (const auto& d : descriptors) {
        idx.emplace(d->slot(), d.get());
    }
    return idx;
}

std::string consumer_hint(const descriptor& desc) {
    std::string hint = "required by " + internal::describe_descriptor(desc)
                       + " (" + std::string(to_string(desc.lifetime)) + ")";
    if (desc.registration_location.file_name()[0]) {
        hint += " registered at "
            + std::string(desc.registration_location.file_name())
            + ":" + std::to_string(desc.registration_location.line());
    }
    return hint;
}

// ------------------------------------------------------------------
// Check that every required dependency has a registration
// ------------------------------------------------------------------
void check_missing_dependencies(const std::vector<descriptor_ptr>& descriptors,
                                const slot_index& slots,
                                std::source_location loc) {
    for (const auto& desc : descriptors) {
        for (const auto& dep : desc->dependencies) {
            // Collections may be empty and optional deps may be absent.
            if (dep.is_collection || dep.is_optional) continue;

            if (!slots.contains(service_key{dep.type, dep.key})) {
                auto ex = not_found(dep.type, dep.key, consumer_hint(*desc), loc);
                ex.set_diagnostic_detail(
                    internal::format_registration_trace(*desc));
                throw ex;
            }
        }
    }
}

// ------------------------------------------------------------------
// Lifetime validation (captive dependency check)
// ------------------------------------------------------------------
void check_lifetime_rules(const std::vector<descriptor_ptr>& descriptors,
                          const slot_index& slots,
                          std::source_location loc) {
    auto throw_mismatch = [&](const descriptor& consumer, std::type_index dep_type) {
        auto ex = lifetime_mismatch(consumer.component_type, "singleton",
                                    dep_type, "scoped",
                                    consumer.impl_type(), loc);
        ex.set_diagnostic_detail(internal::format_registration_trace(consumer));
        throw ex;
    };

    for (const auto& desc : descriptors) {
        if (desc->lifetime != lifetime_kind::singleton) continue;
        if (std::holds_alternative<prebuilt_instance>(desc->strategy)) continue;

        for (const auto& dep : desc->dependencies) {
            // A singleton holding a scoped instance would keep it alive
            // past the end of the scope that created it.
            if (dep.is_collection) {
                for (const auto& other : descriptors) {
                    if (other->component_type == dep.type
                        && other->lifetime == lifetime_kind::scoped) {
                        throw_mismatch(*desc, dep.type);
                    }
                }
                continue;
            }
            auto it = slots.find(service_key{dep.type, dep.key});
            if (it != slots.end() && it->second->lifetime == lifetime_kind::scoped) {
                throw_mismatch(*desc, dep.type);
            }
        }
    }
}

// ------------------------------------------------------------------
// Cycle detection (DFS on the (type, key) dependency graph)
// ------------------------------------------------------------------
enum class visit_state { unvisited, in_progress, done };

struct cycle_search {
    const std::vector<descriptor_ptr>& descriptors;
    const slot_index& slots;
    std::source_location loc;
    std::map<service_key, visit_state> states;
    std::vector<service_key> path;

    void visit(const descriptor& desc) {
        auto node = desc.slot();
        auto& state = states[node];
        if (state == visit_state::done) return;
        if (state == visit_state::in_progress) {
            // Build cycle path from where the node first appears
            auto it = std::find(path.begin(), path.end(), node);
            std::vector<service_key> cycle(it, path.end());
            cycle.push_back(node);
            report(std::move(cycle));
        }

        state = visit_state::in_progress;
        path.push_back(node);

        if (!std::holds_alternative<prebuilt_instance>(desc.strategy)) {
            for (const auto& dep : desc.dependencies) {
                if (dep.is_collection) {
                    for (const auto& other : descriptors) {
                        if (other->component_type == dep.type) visit(*other);
                    }
                    continue;
                }
                auto it = slots.find(service_key{dep.type, dep.key});
                if (it != slots.end()) visit(*it->second);
            }
        }

        path.pop_back();
        states[node] = visit_state::done;
    }

    [[noreturn]] void report(std::vector<service_key> cycle) {
        // Attach registration stacktraces for all slots in the cycle
        std::string detail;
        for (std::size_t i = 0; i + 1 < cycle.size(); ++i) {
            auto it = slots.find(cycle[i]);
            if (it == slots.end()) continue;
            std::string trace = internal::format_registration_trace(*it->second);
            if (!trace.empty()) {
                if (!detail.empty()) detail += "\n";
                detail += trace;
            }
        }
        auto ex = cyclic_dependency(std::move(cycle), loc);
        if (!detail.empty()) ex.set_diagnostic_detail(detail);
        throw ex;
    }
};

void check_cycles(const std::vector<descriptor_ptr>& descriptors,
                  const slot_index& slots,
                  std::source_location loc) {
    cycle_search search{descriptors, slots, loc, {}, {}};
    for (const auto& desc : descriptors) {
        search.visit(*desc);
    }
}

} // anonymous namespace

// ------------------------------------------------------------------
// Entry point called by registry::build
// ------------------------------------------------------------------
void validate_descriptors(const std::vector<descriptor_ptr>& descriptors,
                          const build_options& options,
                          std::source_location loc) {
    auto slots = build_slot_index(descriptors);

    check_missing_dependencies(descriptors, slots, loc);

    if (options.validate_lifetimes) {
        check_lifetime_rules(descriptors, slots, loc);
    }

    if (options.detect_cycles) {
        check_cycles(descriptors, slots, loc);
    }
}

} // namespace svcdi
