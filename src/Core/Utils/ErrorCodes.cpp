/**
 * @file ErrorCodes.cpp
 * @brief Human-readable messages for error codes and categories
 * @author CsrfGuard Team
 * @version 1.0.0
 * @date 2024
 *
 * @copyright Copyright (c) 2024 CsrfGuard. All rights reserved.
 */

#include <CsrfGuard/Core/ErrorCodes.hpp>

namespace CsrfGuard {

std::string_view getErrorMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:                return "success";

        case ErrorCode::RandomGenerationFailed: return "random source failure";

        case ErrorCode::ConfigInvalid:          return "invalid configuration value";
        case ErrorCode::ConfigParseFailed:      return "configuration parse error";

        case ErrorCode::IOError:                return "I/O error";
        case ErrorCode::FileNotFound:           return "file not found";
        case ErrorCode::FileTooLarge:           return "file too large";
        case ErrorCode::InvalidPath:            return "invalid path";
        case ErrorCode::AccessDenied:           return "access denied";

        case ErrorCode::InvalidBase64:          return "invalid base64 input";
        case ErrorCode::InvalidTokenLength:     return "unexpected decoded length";

        case ErrorCode::InternalError:          return "internal error";
        case ErrorCode::InvalidArgument:        return "invalid argument";
    }

    return "unknown error";
}

std::string_view getCategoryName(ErrorCategory category) noexcept {
    switch (category) {
        case ErrorCategory::None:     return "None";
        case ErrorCategory::Crypto:   return "Crypto";
        case ErrorCategory::Config:   return "Config";
        case ErrorCategory::IO:       return "IO";
        case ErrorCategory::Parse:    return "Parse";
        case ErrorCategory::Internal: return "Internal";
    }

    return "Unknown";
}

} // namespace CsrfGuard
