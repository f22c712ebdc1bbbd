#include "core/types/ScanError.hpp"

namespace portsweep::core {

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::InvalidTargetSpec:
        return "InvalidTargetSpec";
    case ErrorCode::EmptyTargetSpec:
        return "EmptyTargetSpec";
    case ErrorCode::InvalidPortSpec:
        return "InvalidPortSpec";
    case ErrorCode::EmptyPortSpec:
        return "EmptyPortSpec";
    case ErrorCode::UnsupportedOutputFormat:
        return "UnsupportedOutputFormat";
    case ErrorCode::OutputWriteFailed:
        return "OutputWriteFailed";
    case ErrorCode::InvalidArgument:
        return "InvalidArgument";
    }
    return "Unknown";
}

ScanError::ScanError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

int ScanError::exitStatus() const noexcept {
    return code_ == ErrorCode::InvalidArgument ? 2 : 1;
}

} // namespace portsweep::core
