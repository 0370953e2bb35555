#pragma once

#include "export.hpp"

#include <cstdint>
#include <memory>

namespace svcdi {

class resolver;

/// Unique identity of one scope.  Tokens are never reused within a process.
enum class scope_token : std::uint64_t {};

/// RAII scope object.  Begins a scope on the creating thread; when destroyed
/// (or when end() is called) the scope ends and all scoped components
/// resolved within it are released.
class SVCDI_EXPORT scope {
public:
    ~scope();

    scope(const scope&) = delete;
    scope& operator=(const scope&) = delete;
    scope(scope&&) noexcept;
    scope& operator=(scope&&) noexcept;

    scope_token token() const noexcept { return token_; }

    /// False once ended (explicitly or by moving from this object).
    bool active() const noexcept { return resolver_ != nullptr && !ended_; }

    /// End the scope now.  Safe to call more than once.
    void end();

    /// Get the resolver this scope belongs to.  Invalid on a moved-from scope.
    resolver& get_resolver() noexcept;

private:
    friend class resolver;
    scope(std::shared_ptr<resolver> owner, scope_token token);

    std::shared_ptr<resolver> resolver_;
    scope_token token_{};
    bool ended_ = false;
};

} // namespace svcdi
