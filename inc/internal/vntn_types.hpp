#ifndef VNTN_TYPES_HPP
#define VNTN_TYPES_HPP

#include <string>

namespace vntn {

// =============================================================================
// Error Code (错误码)
// =============================================================================

enum class ErrorCode {
    OK = 0,

    // 配置错误 (1xx)
    INVALID_CONFIG = 100,
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:             return "OK";
        case ErrorCode::INVALID_CONFIG: return "INVALID_CONFIG";
        default:                        return "UNKNOWN";
    }
}

// =============================================================================
// Error Info (错误信息)
// =============================================================================

struct ErrorInfo {
    ErrorCode code;
    std::string message;
    std::string detail;  // 详细信息(调试用)

    bool isOk() const { return code == ErrorCode::OK; }

    static ErrorInfo ok() {
        return {ErrorCode::OK, "", ""};
    }

    static ErrorInfo error(ErrorCode code, const std::string& msg, const std::string& detail = "") {
        return {code, msg, detail};
    }
};

}  // namespace vntn

#endif  // VNTN_TYPES_HPP
