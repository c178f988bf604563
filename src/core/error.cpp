#include "core/error.hpp"
#include "document/document.hpp"

#include <algorithm>
#include <format>

namespace motya {

const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                 return "none";
        case ErrorCategory::STRUCTURAL_ERROR:     return "structural error";
        case ErrorCategory::MISSING_REQUIRED:     return "missing required";
        case ErrorCategory::UNKNOWN_DIRECTIVE:    return "unknown directive";
        case ErrorCategory::UNKNOWN_KEY:          return "unknown key";
        case ErrorCategory::TYPE_MISMATCH:        return "type mismatch";
        case ErrorCategory::FORMAT_ERROR:         return "format error";
        case ErrorCategory::MUTUAL_EXCLUSION:     return "mutual exclusion";
        case ErrorCategory::DUPLICATE_DEFINITION: return "duplicate definition";
        case ErrorCategory::SYNTAX_ERROR:         return "syntax error";
        case ErrorCategory::IO_ERROR:             return "i/o error";
    }
    return "unknown";
}

namespace {

struct LineInfo {
    size_t line = 1;        // 1-based
    size_t column = 1;      // 1-based, in bytes
    size_t line_start = 0;
    size_t line_end = 0;
};

LineInfo locate(std::string_view text, size_t offset) {
    LineInfo info;
    offset = std::min(offset, text.size());
    for (size_t i = 0; i < offset; ++i) {
        if (text[i] == '\n') {
            ++info.line;
            info.line_start = i + 1;
        }
    }
    info.column = offset - info.line_start + 1;
    info.line_end = text.find('\n', info.line_start);
    if (info.line_end == std::string_view::npos) info.line_end = text.size();
    return info;
}

std::string render_help(std::string_view message, std::string_view text,
                        Span span, std::string_view source_name, const LineInfo& at) {
    std::string_view line_text = text.substr(at.line_start, at.line_end - at.line_start);
    if (!line_text.empty() && line_text.back() == '\r') line_text.remove_suffix(1);

    const std::string gutter_num = std::to_string(at.line);
    const std::string pad(gutter_num.size(), ' ');

    const size_t col0 = at.column - 1;
    const size_t avail = line_text.size() > col0 ? line_text.size() - col0 : 0;
    const size_t carets = std::max<size_t>(1, std::min(span.length, avail));

    std::string underline(col0, ' ');
    // Keep tabs so the caret lines up with the quoted source
    for (size_t i = 0; i < col0 && i < line_text.size(); ++i) {
        if (line_text[i] == '\t') underline[i] = '\t';
    }
    underline.append(carets, '^');

    return std::format("error: {}\n{} --> {}:{}:{}\n{} |\n{} | {}\n{} | {}",
        message, pad, source_name, at.line, at.column,
        pad, gutter_num, line_text, pad, underline);
}

} // anonymous namespace

Diagnostic Diagnostic::at(ErrorCategory category, std::string message,
                          const Document& doc, Span span, std::string_view source_name) {
    return in_text(category, std::move(message), doc.text(), span, source_name);
}

Diagnostic Diagnostic::in_text(ErrorCategory category, std::string message,
                               std::string_view text, Span span,
                               std::string_view source_name) {
    Diagnostic d;
    d.category_ = category;
    d.source_name_ = std::string(source_name);
    d.span_ = span;

    const auto info = locate(text, span.offset);
    d.line_ = info.line;
    d.column_ = info.column;
    d.help_ = render_help(message, text, span, source_name, info);
    d.message_ = std::move(message);
    return d;
}

Diagnostic Diagnostic::detached(ErrorCategory category, std::string message,
                                std::string_view source_name) {
    Diagnostic d;
    d.category_ = category;
    d.source_name_ = std::string(source_name);
    d.help_ = std::format("error: {}\n --> {}", message, source_name);
    d.message_ = std::move(message);
    return d;
}

} // namespace motya
