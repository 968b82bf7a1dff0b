#include <rcat/entry.hpp>

namespace rcat {

const char* skip_reason_name(SkipReason reason) {
    switch (reason) {
        case SkipReason::Hidden:    return "hidden";
        case SkipReason::Ignored:   return "gitignored";
        case SkipReason::Excluded:  return "excluded";
        case SkipReason::Oversized: return "oversized";
        case SkipReason::Binary:    return "binary";
        case SkipReason::ReadError: return "read-error";
        case SkipReason::Budget:    return "over-budget";
        case SkipReason::Duplicate: return "duplicate";
        case SkipReason::Symlink:   return "symlink";
    }
    return "unknown";
}

} // namespace rcat
