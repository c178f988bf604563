#include "parser/typed_value.hpp"

#include <format>

namespace motya {

Result<std::string> TypedValue::as_str() const {
    if (const auto* s = entry_->value.as_string()) {
        return Result<std::string>::ok(*s);
    }
    return Result<std::string>::error(ctx_.error_with_span(
        std::format("Expected a string value, found {}", entry_->value.describe()),
        entry_->span, ErrorCategory::TYPE_MISMATCH));
}

Result<size_t> TypedValue::as_usize() const {
    const auto i = entry_->value.as_integer();
    if (i && *i >= 0) {
        return Result<size_t>::ok(static_cast<size_t>(*i));
    }
    return Result<size_t>::error(ctx_.error_with_span(
        std::format("Expected a positive integer, found {}", entry_->value.describe()),
        entry_->span, ErrorCategory::TYPE_MISMATCH));
}

Result<bool> TypedValue::as_bool() const {
    if (const auto b = entry_->value.as_bool()) {
        return Result<bool>::ok(*b);
    }
    return Result<bool>::error(ctx_.error_with_span(
        std::format("Expected a boolean, found {}", entry_->value.describe()),
        entry_->span, ErrorCategory::TYPE_MISMATCH));
}

Result<std::string> TypedValue::as_string_lossy() const {
    if (auto text = entry_->value.to_text()) {
        return Result<std::string>::ok(std::move(*text));
    }
    return Result<std::string>::error(ctx_.error_with_span(
        "Cannot parse 'null' as a string or number",
        entry_->span, ErrorCategory::TYPE_MISMATCH));
}

// ============================================================================
// Optional-value helpers
// ============================================================================

Result<std::optional<std::string>> as_str(const std::optional<TypedValue>& v) {
    if (!v) return Result<std::optional<std::string>>::ok(std::nullopt);
    auto s = v->as_str();
    if (!s.is_ok()) return Result<std::optional<std::string>>::error(s.diagnostic());
    return Result<std::optional<std::string>>::ok(std::move(s.value()));
}

Result<std::optional<bool>> as_bool(const std::optional<TypedValue>& v) {
    if (!v) return Result<std::optional<bool>>::ok(std::nullopt);
    auto b = v->as_bool();
    if (!b.is_ok()) return Result<std::optional<bool>>::error(b.diagnostic());
    return Result<std::optional<bool>>::ok(b.value());
}

Result<std::optional<size_t>> as_usize(const std::optional<TypedValue>& v) {
    if (!v) return Result<std::optional<size_t>>::ok(std::nullopt);
    auto n = v->as_usize();
    if (!n.is_ok()) return Result<std::optional<size_t>>::error(n.diagnostic());
    return Result<std::optional<size_t>>::ok(n.value());
}

} // namespace motya
