#include "errors.hpp"

std::string to_string(GapError error) {
    switch (error) {
        case GapError::OutOfOrderInput: return "out_of_order_input";
        case GapError::DuplicateGap: return "duplicate_gap";
        case GapError::InsufficientData: return "insufficient_data";
        case GapError::UnknownGap: return "unknown_gap";
        case GapError::InvalidObservation: return "invalid_observation";
    }
    return "unknown";
}
