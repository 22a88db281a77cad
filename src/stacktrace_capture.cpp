#include "stacktrace_utils.hpp"

#include <any>

namespace svcreg::internal {

std::any capture_stacktrace() {
#ifdef SVCREG_HAS_STACKTRACE
    return std::any(boost::stacktrace::stacktrace());
#else
    return {};
#endif
}

} // namespace svcreg::internal
