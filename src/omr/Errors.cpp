#include "omr/Errors.hpp"

namespace omr {

const char* toString(FailureReason reason) {
    switch (reason) {
        case FailureReason::AlignmentFailed:         return "alignment-failed";
        case FailureReason::AmbiguousBubble:         return "ambiguous-bubble";
        case FailureReason::DuplicateNonReplacement: return "duplicate-non-replacement";
        case FailureReason::MissingLayoutEntry:      return "missing-layout-entry";
        case FailureReason::UnreadableImage:         return "unreadable-image";
    }
    return "unknown";
}

}
