#pragma once

#include "export.hpp"
#include "descriptor.hpp"

#include <cstddef>
#include <memory>
#include <string_view>
#include <typeindex>
#include <utility>
#include <vector>

namespace svcdi {

/// Thread-safe table of descriptors keyed by (identity, key).
///
/// Registration is last-write-wins: storing a descriptor for an occupied
/// slot replaces it in place, so insertion order (and therefore the order
/// returned by all_for / snapshot) stays stable across overrides.
/// Stored descriptors are immutable and shared; callers may keep them
/// while the store keeps changing.
class SVCDI_EXPORT registration_store {
public:
    using descriptor_ptr = std::shared_ptr<const descriptor>;

    registration_store();
    ~registration_store();

    registration_store(const registration_store&) = delete;
    registration_store& operator=(const registration_store&) = delete;

    /// Store (or overwrite) a descriptor.  Assigns a fresh registration_id.
    /// Returns the stored record and whether an existing one was replaced.
    std::pair<descriptor_ptr, bool> put(descriptor desc);

    /// nullptr when nothing is registered under (type, key).
    descriptor_ptr lookup(std::type_index type, std::string_view key = {}) const;

    bool is_registered(std::type_index type, std::string_view key = {}) const;

    /// Every registration of `type` across all keys, in insertion order.
    std::vector<descriptor_ptr> all_for(std::type_index type) const;

    /// Every registration, in insertion order.
    std::vector<descriptor_ptr> snapshot() const;

    std::size_t size() const;

    void clear();

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

} // namespace svcdi
