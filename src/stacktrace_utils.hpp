#pragma once

// Internal helper for stacktrace capture and formatting.
// This header is NOT installed: it is only used by the library's .cpp files.

#include "svcdi/descriptor.hpp"
#include "svcdi/exceptions.hpp"

#include <any>
#include <string>
#include <sstream>

#ifdef SVCDI_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace svcdi::internal {

// capture_stacktrace() is declared in descriptor.hpp (public header)
// and implemented in stacktrace_capture.cpp.

/// Format a stacktrace stored in a std::any into a human-readable string.
/// Returns an empty string if the any is empty or stacktrace support is
/// disabled.
inline std::string format_stacktrace(const std::any& st) {
#ifdef SVCDI_HAS_STACKTRACE
    if (const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st)) {
        if (trace->size() > 0) {
            std::ostringstream oss;
            oss << *trace;
            return oss.str();
        }
    }
#else
    (void)st;
#endif
    return {};
}

/// "Type [impl: Impl] (key=\"k\")" for messages and resolution context.
inline std::string describe_descriptor(const descriptor& desc) {
    std::string s = demangle(desc.component_type);
    if (auto impl = desc.impl_type()) {
        s += " [impl: " + demangle(*impl) + "]";
    }
    if (!desc.key.empty()) {
        s += " (key=\"" + desc.key + "\")";
    }
    return s;
}

/// Format one descriptor's registration trace for diagnostic output.
/// Returns a block like:
///   "Registration stacktrace for MyType [impl: Impl] (called via add_singleton):\n  #0 ...\n"
/// or an empty string if no stacktrace is available.
inline std::string format_registration_trace(const descriptor& desc) {
    std::string trace = format_stacktrace(desc.registration_stacktrace);
    if (trace.empty()) return {};

    std::string header = "Registration stacktrace for " + describe_descriptor(desc);
    if (!desc.api_name.empty()) {
        header += " (called via " + desc.api_name + ")";
    }
    return header + ":\n" + trace;
}

} // namespace svcdi::internal
