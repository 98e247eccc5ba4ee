#pragma once

#include "error_framework.hpp"

namespace console_progress {
namespace common {

enum class RenderErrorCode {
    TERMINAL_WRITE_FAILED = 100,
    TERMINAL_CLOSED = 101,

    CURSOR_QUERY_FAILED = 200,
    CURSOR_QUERY_TIMEOUT = 201,

    CONFIG_PARSE_FAILED = 300,
    CONFIG_INVALID_VALUE = 301,
    CONFIG_UNKNOWN_ANIMATION = 302,
    CONFIG_UNKNOWN_COLOR = 303
};

using RenderErrorCodeHelper = ErrorRegistry<RenderErrorCode>;

template<>
inline const ErrorInfo<RenderErrorCode>* ErrorRegistry<RenderErrorCode>::lookup(RenderErrorCode code) {
    static const ErrorInfo<RenderErrorCode> table[] = {
        {RenderErrorCode::TERMINAL_WRITE_FAILED, "TERMINAL_WRITE_FAILED", "Terminal write failed"},
        {RenderErrorCode::TERMINAL_CLOSED, "TERMINAL_CLOSED", "Terminal output closed"},
        {RenderErrorCode::CURSOR_QUERY_FAILED, "CURSOR_QUERY_FAILED", "Cursor position query failed"},
        {RenderErrorCode::CURSOR_QUERY_TIMEOUT, "CURSOR_QUERY_TIMEOUT", "Cursor position query timed out"},
        {RenderErrorCode::CONFIG_PARSE_FAILED, "CONFIG_PARSE_FAILED", "Configuration file could not be parsed"},
        {RenderErrorCode::CONFIG_INVALID_VALUE, "CONFIG_INVALID_VALUE", "Configuration value out of range"},
        {RenderErrorCode::CONFIG_UNKNOWN_ANIMATION, "CONFIG_UNKNOWN_ANIMATION", "Unknown animation preset"},
        {RenderErrorCode::CONFIG_UNKNOWN_COLOR, "CONFIG_UNKNOWN_COLOR", "Unknown color name"}
    };

    for (const auto& entry : table) {
        if (entry.code == code) {
            return &entry;
        }
    }
    return nullptr;
}

// Raised by Terminal implementations; caught at the render tick boundary.
class TerminalError : public CodedError<RenderErrorCode> {
public:
    using CodedError<RenderErrorCode>::CodedError;
};

}}
