#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace motya {

class Document;

/**
 * @brief Error categories for configuration parsing
 */
enum class ErrorCategory {
    NONE,
    STRUCTURAL_ERROR,
    MISSING_REQUIRED,
    UNKNOWN_DIRECTIVE,
    UNKNOWN_KEY,
    TYPE_MISMATCH,
    FORMAT_ERROR,
    MUTUAL_EXCLUSION,
    DUPLICATE_DEFINITION,
    SYNTAX_ERROR,
    IO_ERROR
};

[[nodiscard]] const char* error_category_to_string(ErrorCategory category);

/**
 * @brief Byte range into a document's source text
 */
struct Span {
    size_t offset = 0;
    size_t length = 0;

    [[nodiscard]] size_t end() const { return offset + length; }

    bool operator==(const Span&) const = default;
};

/**
 * @brief A single labeled error anchored to a span of one source
 *
 * The rendered help text is computed when the diagnostic is built, so the
 * diagnostic stays valid after the document it points into is destroyed.
 */
class Diagnostic {
public:
    Diagnostic() = default;

    /**
     * @brief Build a diagnostic pointing into a document
     * @param category Error kind
     * @param message Human-readable message
     * @param doc Document whose source text the span refers to
     * @param span Location of the error
     * @param source_name Label of the source (file path or "test")
     */
    [[nodiscard]] static Diagnostic at(ErrorCategory category,
                                       std::string message,
                                       const Document& doc,
                                       Span span,
                                       std::string_view source_name);

    /**
     * @brief Build a diagnostic against raw source text (used by the reader)
     */
    [[nodiscard]] static Diagnostic in_text(ErrorCategory category,
                                            std::string message,
                                            std::string_view text,
                                            Span span,
                                            std::string_view source_name);

    /**
     * @brief Build a diagnostic that has no source location (I/O failures)
     */
    [[nodiscard]] static Diagnostic detached(ErrorCategory category,
                                             std::string message,
                                             std::string_view source_name);

    [[nodiscard]] ErrorCategory category() const { return category_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const std::optional<Span>& span() const { return span_; }
    [[nodiscard]] const std::string& source_name() const { return source_name_; }
    [[nodiscard]] size_t line() const { return line_; }
    [[nodiscard]] size_t column() const { return column_; }

    /// Message plus a pointer at the offending source text.
    [[nodiscard]] const std::string& help() const { return help_; }

private:
    ErrorCategory category_ = ErrorCategory::NONE;
    std::string message_;
    std::optional<Span> span_;
    std::string source_name_;
    size_t line_ = 0;
    size_t column_ = 0;
    std::string help_;
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(Diagnostic diagnostic) {
        Result r;
        r.success_ = false;
        r.diagnostic_ = std::move(diagnostic);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const Diagnostic& diagnostic() const { return diagnostic_; }
    ErrorCategory error_category() const { return diagnostic_.category(); }
    const std::string& error_message() const { return diagnostic_.message(); }

private:
    bool success_ = false;
    std::optional<T> value_;
    Diagnostic diagnostic_;
};

template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
        return r;
    }

    static Result error(Diagnostic diagnostic) {
        Result r;
        r.success_ = false;
        r.diagnostic_ = std::move(diagnostic);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const Diagnostic& diagnostic() const { return diagnostic_; }
    ErrorCategory error_category() const { return diagnostic_.category(); }
    const std::string& error_message() const { return diagnostic_.message(); }

private:
    bool success_ = false;
    Diagnostic diagnostic_;
};

} // namespace motya
