#include "svcdi/service_provider.hpp"
#include "svcdi/exceptions.hpp"
#include "log_utils.hpp"

#include <mutex>
#include <utility>

namespace svcdi {

namespace {

struct provider_state {
    std::mutex mutex;
    std::shared_ptr<resolver> root;
};

provider_state& state() {
    static provider_state s;
    return s;
}

} // namespace

void service_provider::configure(const configure_fn& setup, build_options options) {
    if (is_configured()) {
        throw already_configured();
    }

    // Setup and build run unlocked: eager singletons may call back into
    // the provider, which reports not_configured until the root is published.
    registry reg;
    if (setup) {
        setup(reg);
    }
    auto root = reg.build(options);

    auto& s = state();
    {
        std::lock_guard lock(s.mutex);
        if (s.root) {
            throw already_configured();
        }
        s.root = std::move(root);
    }
    internal::log(spdlog::level::debug, "svcdi: service_provider configured");
}

std::shared_ptr<resolver> service_provider::get() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (!s.root) {
        throw not_configured();
    }
    return s.root;
}

bool service_provider::is_configured() noexcept {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.root != nullptr;
}

void service_provider::reset() noexcept {
    std::shared_ptr<resolver> old;
    {
        auto& s = state();
        std::lock_guard lock(s.mutex);
        old = std::move(s.root);
    }
    if (old) {
        internal::log(spdlog::level::debug, "svcdi: service_provider reset");
    }
}

} // namespace svcdi
