#pragma once

#include "export.hpp"
#include "lifetime.hpp"
#include "service_key.hpp"

#include <cstdint>
#include <stdexcept>
#include <optional>
#include <string>
#include <string_view>
#include <source_location>
#include <typeindex>
#include <vector>

namespace svcdi {

namespace internal {
/// Demangle a type_index to human-readable name (GCC/Clang ABI-based).
SVCDI_EXPORT std::string demangle(std::type_index type);

/// "Type" or "Type (key=\"k\")".
SVCDI_EXPORT std::string describe(const service_key& k);
} // namespace internal

class SVCDI_EXPORT di_error : public std::runtime_error {
public:
    explicit di_error(const std::string& message,
                      std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. registration stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    std::string full_diagnostic() const;

    /// Append resolution context to this exception.  When a constructor or
    /// factory throws during dependency resolution, each enclosing resolve
    /// layer appends its component info so that the final what() message
    /// shows the full resolution chain, e.g.:
    ///   "... (while resolving B [impl: BImpl] -> A [impl: AImpl])"
    void append_resolution_context(const std::string& component_info);

    /// Override to append resolution context (if any) to the base message.
    const char* what() const noexcept override;

private:
    std::source_location location_;
    std::string diagnostic_detail_;
    std::string resolution_context_;
    mutable std::string cached_what_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

/// Requested (identity, key) has no registration.
class SVCDI_EXPORT not_found : public di_error {
public:
    explicit not_found(std::type_index type,
                       std::source_location loc = std::source_location::current());

    not_found(std::type_index type, std::string_view key,
              std::source_location loc = std::source_location::current());

    /// Construct with an additional diagnostic hint (appended to the message).
    not_found(std::type_index type, std::string_view key,
              std::string_view hint,
              std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }
    const std::string& key() const noexcept { return key_; }

private:
    std::type_index component_type_;
    std::string key_;
};

class SVCDI_EXPORT cyclic_dependency : public di_error {
public:
    explicit cyclic_dependency(std::vector<service_key> cycle,
                               std::source_location loc = std::source_location::current());

    /// Closed path: first and last entries name the same slot.
    const std::vector<service_key>& cycle() const noexcept { return cycle_; }

private:
    std::vector<service_key> cycle_;
    static std::string build_message(const std::vector<service_key>& cycle);
};

/// A scoped service was requested with no active scope.
class SVCDI_EXPORT scope_required : public di_error {
public:
    scope_required(std::type_index type, std::string_view key,
                   std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

class SVCDI_EXPORT scope_already_active : public di_error {
public:
    explicit scope_already_active(std::uint64_t active_token,
                                  std::source_location loc = std::source_location::current());

    std::uint64_t active_token() const noexcept { return active_token_; }

private:
    std::uint64_t active_token_;
};

class SVCDI_EXPORT no_active_scope : public di_error {
public:
    explicit no_active_scope(std::source_location loc = std::source_location::current());
};

class SVCDI_EXPORT lifetime_mismatch : public di_error {
public:
    lifetime_mismatch(std::type_index consumer, std::string_view consumer_lifetime,
                      std::type_index dependency, std::string_view dependency_lifetime,
                      std::optional<std::type_index> consumer_impl = std::nullopt,
                      std::source_location loc = std::source_location::current());

    std::type_index consumer() const noexcept { return consumer_; }
    std::type_index dependency() const noexcept { return dependency_; }

private:
    std::type_index consumer_;
    std::type_index dependency_;

    static std::string build_message(std::type_index consumer, std::string_view consumer_lt,
                                     std::type_index dependency, std::string_view dep_lt,
                                     std::optional<std::type_index> consumer_impl);
};

class SVCDI_EXPORT invalid_registration : public di_error {
public:
    invalid_registration(std::type_index type, std::string_view reason,
                         std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

class SVCDI_EXPORT resolution_error : public di_error {
public:
    resolution_error(std::type_index type, const std::exception& inner,
                     std::source_location loc = std::source_location::current());

    /// Overload that includes the registration location of the failing component.
    resolution_error(std::type_index type, const std::exception& inner,
                     std::source_location registration_loc,
                     std::source_location loc);

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

class SVCDI_EXPORT not_configured : public di_error {
public:
    explicit not_configured(std::source_location loc = std::source_location::current());
};

class SVCDI_EXPORT already_configured : public di_error {
public:
    explicit already_configured(std::source_location loc = std::source_location::current());
};

} // namespace svcdi
