/// basic_usage.cpp: svcdi introductory example.
///
/// Demonstrates the core registration → build → resolve workflow:
///   1. Define interfaces and implementations (no framework base classes).
///   2. Register with lifetime, dependencies declared via deps<>.
///   3. Call build() to validate the dependency graph.
///   4. Resolve services by interface; use scopes for scoped components.

#include <svcdi.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace svcdi;

// -----------------------------------------------------------------------
// Domain interfaces
// -----------------------------------------------------------------------

struct i_logger {
    virtual ~i_logger() = default;
    virtual void log(const std::string& message) = 0;
};

struct i_user_service {
    virtual ~i_user_service() = default;
    virtual std::string describe(const std::string& user) = 0;
};

struct i_request_context {
    virtual ~i_request_context() = default;
    virtual std::string request_id() const = 0;
};

struct i_notifier {
    virtual ~i_notifier() = default;
    virtual std::string channel() const = 0;
};

// -----------------------------------------------------------------------
// Implementations
// -----------------------------------------------------------------------

struct console_logger : i_logger {
    void log(const std::string& message) override {
        std::cout << "[LOG] " << message << '\n';
    }
};

struct user_service : i_user_service {
    explicit user_service(std::shared_ptr<i_logger> logger)
        : logger_(std::move(logger)) {}

    std::string describe(const std::string& user) override {
        const auto msg = "user " + user;
        logger_->log(msg);
        return msg;
    }

private:
    std::shared_ptr<i_logger> logger_;
};

struct request_context : i_request_context {
    inline static int counter = 0;
    int id_;

    request_context() : id_(++counter) {}

    std::string request_id() const override {
        return "req-" + std::to_string(id_);
    }
};

struct email_notifier : i_notifier {
    std::string channel() const override { return "email"; }
};

struct sms_notifier : i_notifier {
    std::string channel() const override { return "sms"; }
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    spdlog::set_level(spdlog::level::debug);

    // ── Registration phase ────────────────────────────────────────────
    registry reg;

    // console_logger: singleton: one instance for the whole application.
    reg.add_singleton<i_logger, console_logger>();

    // user_service: transient, depends on i_logger.
    reg.add_transient<i_user_service, user_service>(deps<i_logger>);

    // request_context: scoped: one instance per scope (e.g. per request).
    reg.add_scoped<i_request_context, request_context>();

    // Two keyed notifiers side by side.
    reg.add_singleton<i_notifier, email_notifier>("email");
    reg.add_singleton<i_notifier, sms_notifier>("sms");

    // ── Build phase (validates dependency graph) ──────────────────────
    std::shared_ptr<resolver> root;
    try {
        root = reg.build();
    } catch (const di_error& e) {
        std::cerr << e.full_diagnostic() << '\n';
        return 1;
    }

    // ── Resolution phase ──────────────────────────────────────────────
    try {
        // Transients are fresh each time but share the singleton logger.
        const auto u1 = root->resolve<i_user_service>();
        const auto u2 = root->resolve<i_user_service>();
        std::cout << u1->describe("alice") << " / " << u2->describe("bob")
                  << (u1 != u2 ? " (distinct services)" : "") << '\n';

        std::cout << "SMS notifier: " << root->resolve<i_notifier>("sms")->channel() << '\n';
        for (const auto& n : root->get_all<i_notifier>()) {
            std::cout << "Notifier: " << n->channel() << '\n';
        }

        // Scoped components require a scope on the calling thread.
        for (int request = 0; request < 2; ++request) {
            auto scope = root->create_scope();
            const auto a = root->resolve<i_request_context>();
            const auto b = root->resolve<i_request_context>();
            std::cout << "Request " << a->request_id()
                      << (a == b ? " (shared within scope)" : "") << '\n';
        }
        // Scopes released here; all scoped instances destroyed.

        root->resolve<i_request_context>();
    } catch (const scope_required& e) {
        std::cout << "Expected: " << e.what() << '\n';
    } catch (const di_error& e) {
        std::cerr << e.full_diagnostic() << '\n';
        return 1;
    }

    std::cout << "Done.\n";
    return 0;
}
