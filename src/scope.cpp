#include "svcdi/scope.hpp"
#include "svcdi/resolver.hpp"

#include <utility>

namespace svcdi {

scope::scope(std::shared_ptr<resolver> owner, scope_token token)
    : resolver_(std::move(owner))
    , token_(token)
{}

scope::~scope() {
    end();
}

scope::scope(scope&& o) noexcept
    : resolver_(std::move(o.resolver_))
    , token_(o.token_)
    , ended_(o.ended_)
{
    o.ended_ = true;
}

scope& scope::operator=(scope&& o) noexcept {
    if (this != &o) {
        end();
        resolver_ = std::move(o.resolver_);
        token_ = o.token_;
        ended_ = o.ended_;
        o.ended_ = true;
    }
    return *this;
}

void scope::end() {
    if (!active()) return;
    ended_ = true;
    resolver_->end_scope_token(token_);
}

resolver& scope::get_resolver() noexcept {
    return *resolver_;
}

} // namespace svcdi
