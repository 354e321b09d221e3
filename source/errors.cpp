#include "ms2pred/errors.hpp"

namespace ms2pred {

std::string_view to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidResidue: return "InvalidResidue";
        case ErrorKind::InvalidModification: return "InvalidModification";
        case ErrorKind::Length: return "Length";
        case ErrorKind::InvalidCharge: return "InvalidCharge";
        case ErrorKind::UnsupportedMethod: return "UnsupportedMethod";
        case ErrorKind::ModelNotFound: return "ModelNotFound";
        case ErrorKind::ModelMismatch: return "ModelMismatch";
        case ErrorKind::ModelLoad: return "ModelLoad";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::Internal: return "Internal";
    }
    return "Unknown";
}

} // namespace ms2pred
