#include "svcdi/descriptor.hpp"

#include <any>

#ifdef SVCDI_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace svcdi::internal {

std::any capture_stacktrace() {
#ifdef SVCDI_HAS_STACKTRACE
    return std::any(boost::stacktrace::stacktrace());
#else
    return {};
#endif
}

} // namespace svcdi::internal
