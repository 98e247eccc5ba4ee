#pragma once

#include <string>
#include <map>
#include <stdexcept>
#include <utility>

namespace console_progress {
namespace common {

template<typename EnumType>
struct ErrorInfo {
    EnumType code;
    const char* code_str;
    const char* default_message;
};

struct ErrorContext {
    std::string component;
    std::map<std::string, std::string> details;

    // "key=value | key=value" in key order; empty without details.
    std::string detailString() const {
        std::string result;
        for (const auto& [key, value] : details) {
            if (!result.empty()) {
                result += " | ";
            }
            result += key + "=" + value;
        }
        return result;
    }
};

// Code strings and default messages for an error enum. Each enum supplies
// its table by specializing lookup().
template<typename EnumType>
class ErrorRegistry {
public:
    static bool isRegistered(EnumType code) {
        return lookup(code) != nullptr;
    }

    static const char* toString(EnumType code) {
        const auto* info = lookup(code);
        return info ? info->code_str : "UNKNOWN";
    }

    static const char* getMessage(EnumType code) {
        const auto* info = lookup(code);
        return info ? info->default_message : "Unknown error";
    }

private:
    static const ErrorInfo<EnumType>* lookup(EnumType code);
};

// Exception carrying a registered error code. The message is
// "[component] default message | details".
template<typename EnumType>
class CodedError : public std::runtime_error {
public:
    CodedError(EnumType code, ErrorContext context)
        : std::runtime_error(buildMessage(code, context)),
          code_(code),
          context_(std::move(context)) {}

    EnumType code() const { return code_; }
    const ErrorContext& context() const { return context_; }
    const char* codeString() const { return ErrorRegistry<EnumType>::toString(code_); }

private:
    EnumType code_;
    ErrorContext context_;

    static std::string buildMessage(EnumType code, const ErrorContext& context) {
        std::string message = ErrorRegistry<EnumType>::getMessage(code);
        if (!context.component.empty()) {
            message = "[" + context.component + "] " + message;
        }
        std::string details = context.detailString();
        if (!details.empty()) {
            message += " | " + details;
        }
        return message;
    }
};

}}
