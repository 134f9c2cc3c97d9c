// BlockFlowError.cpp
#include "BlockFlowError.hpp"
#include <fmt/core.h>

namespace BlockFlow {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::UnsupportedVersion: return "UNSUPPORTED_VERSION";
        case ErrorCode::InvalidSnapshot:    return "INVALID_SNAPSHOT";
        case ErrorCode::DanglingEdge:       return "DANGLING_EDGE";
        case ErrorCode::CycleDetected:      return "CYCLE_DETECTED";
        case ErrorCode::UnknownBlock:       return "UNKNOWN_BLOCK";
        case ErrorCode::DuplicateNode:      return "DUPLICATE_NODE";
        case ErrorCode::FanInViolation:     return "FAN_IN_VIOLATION";
        case ErrorCode::DuplicateBlock:     return "DUPLICATE_BLOCK";
        case ErrorCode::InvalidBlock:       return "INVALID_BLOCK";
    }
    return "UNKNOWN";
}

EngineError::EngineError(ErrorCode code, const std::string& message)
    : std::runtime_error(fmt::format("[{}] {}", errorCodeName(code), message)),
      code_(code),
      detail_(message) {}

const char* diagLevelName(DiagLevel level) {
    switch (level) {
        case DiagLevel::Info:    return "info";
        case DiagLevel::Warning: return "warning";
        case DiagLevel::Error:   return "error";
    }
    return "?";
}

} // namespace BlockFlow
