#pragma once

#include "core/error.hpp"
#include "document/document.hpp"
#include "parser/rules.hpp"

#include <concepts>
#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace motya {

class TypedValue;

/**
 * @brief Sub-range of a node's entry list, mirroring a..b / a.. / ..b / ..
 */
struct ArgRange {
    size_t begin = 0;
    std::optional<size_t> end;

    static ArgRange all() { return ArgRange{}; }
    static ArgRange from(size_t b) { return ArgRange{b, std::nullopt}; }
    static ArgRange to(size_t e) { return ArgRange{0, e}; }
    static ArgRange between(size_t b, size_t e) { return ArgRange{b, e}; }
};

using ArgsMap = std::map<std::string, std::string>;

/**
 * @brief Read-only cursor over a Document
 *
 * Focus is either a node list (the document root, or a children block that
 * was entered) or a single node. Copying a context copies two pointers and
 * an id; tree data is never duplicated. The document and the source name
 * must outlive every context derived from them.
 */
class ParseContext {
public:
    enum class Focus {
        DOCUMENT,
        NODE
    };

    /// Context at the document root.
    ParseContext(const Document& doc, std::string_view source_name);

    // Contexts keep pointers into the document and a view of the name,
    // so neither may be a temporary.
    ParseContext(Document&& doc, std::string_view source_name) = delete;
    template<typename S>
        requires std::same_as<S, std::string>
    ParseContext(const Document& doc, S&& source_name) = delete;

    [[nodiscard]] Focus focus() const { return focus_; }
    [[nodiscard]] bool is_document() const { return focus_ == Focus::DOCUMENT; }
    [[nodiscard]] const Document& document() const { return *doc_; }
    [[nodiscard]] std::string_view source_name() const { return source_name_; }

    /// Node-focused context only; nullptr for a document focus.
    [[nodiscard]] const Node* current_node() const;

    /// Enter the children block of the focused node.
    [[nodiscard]] Result<ParseContext> enter_block() const;

    /// Context focused on `id`, sharing this context's document and source name.
    [[nodiscard]] ParseContext for_node(NodeId id) const;

    [[nodiscard]] Result<std::string_view> name() const;
    [[nodiscard]] Result<void> expect_name(std::string_view expected) const;

    /// One context per immediate child, in source order.
    [[nodiscard]] Result<std::vector<ParseContext>> nodes() const;

    /// As nodes(), but an empty block is an error.
    [[nodiscard]] Result<std::vector<ParseContext>> req_nodes() const;

    [[nodiscard]] Result<bool> has_children_block() const;

    [[nodiscard]] Result<std::span<const Entry>> args() const;

    /**
     * @brief Collect named entries of a sub-range as key -> text
     *
     * Positional entries are skipped. Non-string scalars are rendered in
     * their textual form; a null value is a type mismatch. A repeated key
     * keeps its first value.
     */
    [[nodiscard]] Result<ArgsMap> args_map(ArgRange range) const;

    /// args_map() followed by a check that every key is in `allowed`.
    [[nodiscard]] Result<ArgsMap> args_map_with_only_keys(
        ArgRange range, std::span<const std::string_view> allowed) const;

    [[nodiscard]] Result<TypedValue> first() const;
    [[nodiscard]] Result<TypedValue> arg(size_t index) const;

    /// The one and only positional argument; more than one is an error.
    [[nodiscard]] Result<TypedValue> single_arg() const;
    [[nodiscard]] Result<TypedValue> prop(std::string_view key) const;
    [[nodiscard]] Result<std::optional<TypedValue>> opt_prop(std::string_view key) const;

    /// Evaluate rules in order; the first violation is returned.
    [[nodiscard]] Result<void> validate(std::span<const Rule> rules) const;

    /// Diagnostic anchored at the focused node (or the whole block).
    [[nodiscard]] Diagnostic error(std::string message,
                                   ErrorCategory category = ErrorCategory::STRUCTURAL_ERROR) const;

    /// Diagnostic anchored at an arbitrary span, e.g. one entry.
    [[nodiscard]] Diagnostic error_with_span(std::string message, Span span,
                                             ErrorCategory category = ErrorCategory::STRUCTURAL_ERROR) const;

    [[nodiscard]] Span current_span() const;

private:
    ParseContext(const Document* doc, std::string_view source_name,
                 Focus focus, const std::vector<NodeId>* block,
                 Span block_span, NodeId node);

    [[nodiscard]] Diagnostic not_a_node() const;

    const Document* doc_;
    std::string_view source_name_;
    Focus focus_;
    const std::vector<NodeId>* block_ = nullptr;  // DOCUMENT focus
    Span block_span_;
    NodeId node_ = 0;                             // NODE focus
};

} // namespace motya
