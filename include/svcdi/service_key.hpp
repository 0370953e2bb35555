#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <typeindex>

namespace svcdi {

/// (identity, key) pair naming one registration slot.
/// An empty key denotes the unkeyed slot.
struct service_key {
    std::type_index type = std::type_index(typeid(void));
    std::string     key;

    bool keyed() const noexcept { return !key.empty(); }

    bool operator==(const service_key&) const = default;
    auto operator<=>(const service_key& o) const {
        if (auto c = type <=> o.type; c != 0) return c;
        return key <=> o.key;
    }
};

struct service_key_hash {
    std::size_t operator()(const service_key& k) const noexcept {
        std::size_t h = std::hash<std::type_index>{}(k.type);
        return h ^ (std::hash<std::string>{}(k.key) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

} // namespace svcdi
