// BlockFlowError.hpp
//
// Engine error codes, the EngineError exception thrown for structural
// failures outside a pass, and Diagnostic records for non-fatal findings.
#pragma once
#include <optional>
#include <stdexcept>
#include <string>

namespace BlockFlow {

using NodeId = std::string;

enum class ErrorCode {
    UnsupportedVersion,
    InvalidSnapshot,
    DanglingEdge,
    CycleDetected,
    UnknownBlock,
    DuplicateNode,
    FanInViolation,
    DuplicateBlock,
    InvalidBlock
};

// Machine-readable name, e.g. "CYCLE_DETECTED".
const char* errorCodeName(ErrorCode code);

class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    ErrorCode code_;
    std::string detail_;
};

enum class DiagLevel { Info, Warning, Error };

const char* diagLevelName(DiagLevel level);

struct Diagnostic {
    std::optional<NodeId> nodeId;
    DiagLevel level = DiagLevel::Error;
    ErrorCode code = ErrorCode::InvalidSnapshot;
    std::string message;
};

} // namespace BlockFlow
