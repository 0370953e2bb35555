#include "svcdi/registration_store.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>

namespace svcdi {

namespace {

std::uint64_t next_registration_id() {
    static std::atomic<std::uint64_t> counter{0};
    return ++counter;
}

} // namespace

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct registration_store::impl {
    mutable std::shared_mutex mutex;

    // Insertion-ordered records; index maps each slot to its position.
    std::vector<descriptor_ptr> entries;
    std::map<service_key, std::size_t> index;
};

registration_store::registration_store()
    : impl_(std::make_unique<impl>())
{}

registration_store::~registration_store() = default;

std::pair<registration_store::descriptor_ptr, bool>
registration_store::put(descriptor desc) {
    desc.registration_id = next_registration_id();
    auto slot = desc.slot();
    auto stored = std::make_shared<const descriptor>(std::move(desc));

    std::unique_lock lock(impl_->mutex);
    auto it = impl_->index.find(slot);
    if (it != impl_->index.end()) {
        impl_->entries[it->second] = stored;
        return {stored, true};
    }
    impl_->index.emplace(std::move(slot), impl_->entries.size());
    impl_->entries.push_back(stored);
    return {stored, false};
}

registration_store::descriptor_ptr
registration_store::lookup(std::type_index type, std::string_view key) const {
    service_key slot{type, std::string(key)};
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->index.find(slot);
    if (it == impl_->index.end()) return nullptr;
    return impl_->entries[it->second];
}

bool registration_store::is_registered(std::type_index type, std::string_view key) const {
    service_key slot{type, std::string(key)};
    std::shared_lock lock(impl_->mutex);
    return impl_->index.contains(slot);
}

std::vector<registration_store::descriptor_ptr>
registration_store::all_for(std::type_index type) const {
    std::vector<descriptor_ptr> result;
    std::shared_lock lock(impl_->mutex);
    for (const auto& d : impl_->entries) {
        if (d->component_type == type) result.push_back(d);
    }
    return result;
}

std::vector<registration_store::descriptor_ptr> registration_store::snapshot() const {
    std::shared_lock lock(impl_->mutex);
    return impl_->entries;
}

std::size_t registration_store::size() const {
    std::shared_lock lock(impl_->mutex);
    return impl_->entries.size();
}

void registration_store::clear() {
    std::unique_lock lock(impl_->mutex);
    impl_->entries.clear();
    impl_->index.clear();
}

} // namespace svcdi
