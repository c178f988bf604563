#pragma once

#include "core/error.hpp"
#include "core/from_text.hpp"
#include "document/document.hpp"
#include "parser/parse_context.hpp"

#include <cstddef>
#include <format>
#include <optional>
#include <string>

namespace motya {

/**
 * @brief One entry of a node, with the context that produced it
 *
 * Coercions report failures anchored at the entry's own span rather than
 * the whole node.
 */
class TypedValue {
public:
    TypedValue(ParseContext ctx, const Entry& entry)
        : ctx_(ctx), entry_(&entry) {}

    [[nodiscard]] const Entry& entry() const { return *entry_; }
    [[nodiscard]] const Value& raw() const { return entry_->value; }
    [[nodiscard]] Span span() const { return entry_->span; }

    [[nodiscard]] Result<std::string> as_str() const;
    [[nodiscard]] Result<size_t> as_usize() const;
    [[nodiscard]] Result<bool> as_bool() const;

    /// String, integer, float or boolean as text; null is rejected.
    [[nodiscard]] Result<std::string> as_string_lossy() const;

    /**
     * @brief Build a T from the value's textual form
     *
     * Failure message: "Invalid <type_name> '<text>'. Reason: <reason>"
     */
    template<TextParsable T>
    [[nodiscard]] Result<T> parse_as() const {
        auto text = as_string_lossy();
        if (!text.is_ok()) return Result<T>::error(text.diagnostic());

        T out{};
        std::string reason;
        if (!FromText<T>::parse(text.value(), out, reason)) {
            return Result<T>::error(ctx_.error_with_span(
                std::format("Invalid {} '{}'. Reason: {}",
                            FromText<T>::type_name, text.value(), reason),
                entry_->span, ErrorCategory::FORMAT_ERROR));
        }
        return Result<T>::ok(std::move(out));
    }

private:
    ParseContext ctx_;
    const Entry* entry_;
};

// ============================================================================
// Optional-value helpers: absent stays absent, present values are coerced
// ============================================================================

[[nodiscard]] Result<std::optional<std::string>> as_str(const std::optional<TypedValue>& v);
[[nodiscard]] Result<std::optional<bool>> as_bool(const std::optional<TypedValue>& v);
[[nodiscard]] Result<std::optional<size_t>> as_usize(const std::optional<TypedValue>& v);

template<TextParsable T>
[[nodiscard]] Result<std::optional<T>> parse_as(const std::optional<TypedValue>& v) {
    if (!v) return Result<std::optional<T>>::ok(std::nullopt);
    auto parsed = v->parse_as<T>();
    if (!parsed.is_ok()) return Result<std::optional<T>>::error(parsed.diagnostic());
    return Result<std::optional<T>>::ok(std::move(parsed.value()));
}

} // namespace motya
