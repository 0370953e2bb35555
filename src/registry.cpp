#include "svcdi/registry.hpp"
#include "svcdi/resolver.hpp"
#include "log_utils.hpp"
#include "stacktrace_utils.hpp"

#include <optional>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace svcdi {

void validate_descriptors(const std::vector<registration_store::descriptor_ptr>& descriptors,
                          const build_options& options,
                          std::source_location loc);

// ---------------------------------------------------------------
// Constructors / Destructor / Move
// ---------------------------------------------------------------

registry::registry()
    : store_(std::make_shared<registration_store>())
{}

registry::~registry() = default;

registry::registry(registry&&) noexcept = default;
registry& registry::operator=(registry&&) noexcept = default;

// ---------------------------------------------------------------
// Non-template registration core
// ---------------------------------------------------------------

registry& registry::register_component(
        std::type_index type,
        std::optional<std::string_view> key,
        lifetime_kind lifetime,
        build_strategy strategy,
        std::vector<dependency_info> deps,
        std::source_location loc,
        const char* api_name) {
    if (key.has_value() && key->empty()) {
        throw invalid_registration(type, "registration key must not be empty", loc);
    }
    if (const auto* ci = std::get_if<constructor_injection>(&strategy); ci && !ci->construct) {
        throw invalid_registration(type, "constructor callback cannot be empty", loc);
    }
    if (const auto* fc = std::get_if<factory_call>(&strategy); fc && !fc->invoke) {
        throw invalid_registration(type, "factory cannot be empty", loc);
    }

    descriptor desc;
    desc.component_type = type;
    desc.key = key.has_value() ? std::string(*key) : std::string{};
    desc.lifetime = lifetime;
    desc.strategy = std::move(strategy);
    desc.dependencies = std::move(deps);
    desc.registration_location = loc;
    desc.registration_stacktrace = internal::capture_stacktrace();
    desc.api_name = api_name;

    auto [stored, replaced] = store_->put(std::move(desc));

    if (internal::should_log(spdlog::level::debug)) {
        internal::log(spdlog::level::debug, "svcdi: {} {} as {} ({}) via {}",
                      replaced ? "overwrote" : "registered",
                      internal::describe_descriptor(*stored),
                      to_string(stored->lifetime),
                      strategy_name(stored->strategy),
                      stored->api_name);
    }
    return *this;
}

std::vector<registration_store::descriptor_ptr> registry::descriptors() const {
    return store_->snapshot();
}

void registry::clear() {
    store_->clear();
    internal::log(spdlog::level::debug, "svcdi: registry cleared");
}

// ---------------------------------------------------------------
// build
// ---------------------------------------------------------------

std::shared_ptr<resolver> registry::build(build_options options, std::source_location loc) {
    if (options.validate_on_build) {
        validate_descriptors(store_->snapshot(), options, loc);
    }

    auto r = resolver::create(store_);

    if (options.eager_singletons) {
        r->instantiate_singletons();
    }

    internal::log(spdlog::level::debug, "svcdi: built resolver over {} registration(s)",
                  store_->size());
    return r;
}

} // namespace svcdi
