#include "FaceTypes.hpp"

namespace presence {

const char* to_string(DegradeReason reason) {
    switch (reason) {
        case DegradeReason::NONE:               return "none";
        case DegradeReason::MISSING_LANDMARKS:  return "missing_landmarks";
        case DegradeReason::POSE_SOLVE_FAILURE: return "pose_solve_failure";
        case DegradeReason::INTERNAL_ERROR:     return "internal_error";
    }
    return "unknown";
}

} // namespace presence
