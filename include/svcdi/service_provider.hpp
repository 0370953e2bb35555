#pragma once

#include "export.hpp"
#include "descriptor.hpp"
#include "registry.hpp"
#include "resolver.hpp"

#include <functional>
#include <memory>
#include <string_view>

namespace svcdi {

/// Process-wide resolver with an explicit lifecycle.
///
/// Nothing is created implicitly: configure() must run before get(), and
/// reset() tears the instance down again (typically between tests).
/// Resolvers already handed out by get() stay valid after reset().
class SVCDI_EXPORT service_provider {
public:
    using configure_fn = std::function<void(registry&)>;

    service_provider() = delete;

    /// Populate a fresh registry through `setup` and build the global
    /// resolver.  Throws already_configured if called twice without reset().
    /// If `setup` or build() throws, the provider stays unconfigured.
    /// No lock is held while `setup` and build() run; calls to get() from
    /// inside them throw not_configured.
    static void configure(const configure_fn& setup, build_options options = {});

    /// Throws not_configured before configure().
    static std::shared_ptr<resolver> get();

    static bool is_configured() noexcept;

    static void reset() noexcept;
};

template <typename T>
std::shared_ptr<T> get_service() {
    return service_provider::get()->resolve<T>();
}

template <typename T>
std::shared_ptr<T> get_keyed_service(std::string_view key) {
    return service_provider::get()->resolve<T>(key);
}

template <typename T>
std::shared_ptr<T> try_get_service() {
    return service_provider::get()->try_resolve<T>();
}

} // namespace svcdi
