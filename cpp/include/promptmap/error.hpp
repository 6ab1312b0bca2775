#pragma once

#include <stdexcept>
#include <string>

namespace promptmap {

/**
 * Structured error reporting with context and recovery suggestions.
 *
 * Background requests convert these into terminal error events; the
 * synchronous APIs (transform, registry lookups) let them propagate.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Markup errors
    PARSE_FAILED = 100,

    // Tokenizer errors
    UNKNOWN_MODEL = 200,
    TOKENIZER_UNAVAILABLE = 201,

    // I/O errors
    FILE_NOT_FOUND = 300,

    INTERNAL_ERROR = 500
};

class PromptmapException : public std::runtime_error {
public:
    explicit PromptmapException(ErrorCode code, const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "promptmap error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public PromptmapException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : PromptmapException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Markup that is not well-formed. line/column are 0 when unknown.
class ParseError : public PromptmapException {
public:
    explicit ParseError(const std::string& message, int line = 0, int column = 0)
        : PromptmapException(ErrorCode::PARSE_FAILED, message)
        , line_(line)
        , column_(column) {}

    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }

private:
    int line_;
    int column_;
};

class UnknownModelError : public PromptmapException {
public:
    explicit UnknownModelError(const std::string& model_id)
        : PromptmapException(ErrorCode::UNKNOWN_MODEL,
                             "No tokenizer adapter for model '" + model_id + "'",
                             "", "Run 'promptmap models' for the list of known models")
        , model_id_(model_id) {}

    const std::string& model_id() const noexcept { return model_id_; }

private:
    std::string model_id_;
};

class TokenizerUnavailableError : public PromptmapException {
public:
    explicit TokenizerUnavailableError(const std::string& message,
                                       const std::string& context = "",
                                       const std::string& suggestion = "")
        : PromptmapException(ErrorCode::TOKENIZER_UNAVAILABLE, message, context, suggestion) {}
};

class IOError : public PromptmapException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : PromptmapException(ErrorCode::FILE_NOT_FOUND, message, context, suggestion) {}
};

class ErrorHandler {
public:
    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

#define PROMPTMAP_CHECK_ARGUMENT(condition, message) \
    promptmap::ErrorHandler::check_argument(condition, message, __func__)

#define PROMPTMAP_THROW(code, message) \
    throw promptmap::PromptmapException(code, message, __func__)

} // namespace promptmap
