#include "parser/parse_context.hpp"
#include "parser/typed_value.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace motya {

ParseContext::ParseContext(const Document& doc, std::string_view source_name)
    : doc_(&doc),
      source_name_(source_name),
      focus_(Focus::DOCUMENT),
      block_(&doc.roots()),
      block_span_(doc.span()) {}

ParseContext::ParseContext(const Document* doc, std::string_view source_name,
                           Focus focus, const std::vector<NodeId>* block,
                           Span block_span, NodeId node)
    : doc_(doc),
      source_name_(source_name),
      focus_(focus),
      block_(block),
      block_span_(block_span),
      node_(node) {}

const Node* ParseContext::current_node() const {
    if (focus_ != Focus::NODE) return nullptr;
    return &doc_->node(node_);
}

Diagnostic ParseContext::not_a_node() const {
    return error("Expected node, but current is a document");
}

// ---- Navigation ------------------------------------------------------------

Result<ParseContext> ParseContext::enter_block() const {
    if (focus_ == Focus::DOCUMENT) {
        return Result<ParseContext>::error(
            error("Cannot enter block: current context is already a document root"));
    }
    const Node& n = doc_->node(node_);
    if (!n.children) {
        return Result<ParseContext>::error(
            error("Expected a children block { ... }, but none found"));
    }
    return Result<ParseContext>::ok(ParseContext(
        doc_, source_name_, Focus::DOCUMENT, &*n.children, n.children_span, 0));
}

ParseContext ParseContext::for_node(NodeId id) const {
    return ParseContext(doc_, source_name_, Focus::NODE, nullptr, Span{}, id);
}

Result<std::string_view> ParseContext::name() const {
    if (focus_ == Focus::DOCUMENT) return Result<std::string_view>::error(not_a_node());
    return Result<std::string_view>::ok(doc_->node(node_).name);
}

Result<void> ParseContext::expect_name(std::string_view expected) const {
    if (focus_ == Focus::DOCUMENT) {
        return Result<void>::error(error(
            std::format("Expected node '{}', but current is a document", expected)));
    }
    const auto& actual = doc_->node(node_).name;
    if (actual != expected) {
        return Result<void>::error(error(
            std::format("Expected '{}', found '{}'", expected, actual)));
    }
    return Result<void>::ok();
}

Result<std::vector<ParseContext>> ParseContext::nodes() const {
    const std::vector<NodeId>* ids = block_;
    if (focus_ == Focus::NODE) {
        const Node& n = doc_->node(node_);
        if (!n.children) {
            return Result<std::vector<ParseContext>>::error(error("Expected children block"));
        }
        ids = &*n.children;
    }

    std::vector<ParseContext> out;
    out.reserve(ids->size());
    for (const NodeId id : *ids) {
        out.push_back(for_node(id));
    }
    return Result<std::vector<ParseContext>>::ok(std::move(out));
}

Result<std::vector<ParseContext>> ParseContext::req_nodes() const {
    auto children = nodes();
    if (!children.is_ok()) return children;
    if (children.value().empty()) {
        const std::string label = focus_ == Focus::NODE ? doc_->node(node_).name : "document";
        return Result<std::vector<ParseContext>>::error(
            error(std::format("Block '{}' cannot be empty", label)));
    }
    return children;
}

Result<bool> ParseContext::has_children_block() const {
    if (focus_ == Focus::DOCUMENT) return Result<bool>::error(not_a_node());
    return Result<bool>::ok(doc_->node(node_).children.has_value());
}

// ---- Entries ---------------------------------------------------------------

Result<std::span<const Entry>> ParseContext::args() const {
    if (focus_ == Focus::DOCUMENT) return Result<std::span<const Entry>>::error(not_a_node());
    return Result<std::span<const Entry>>::ok(std::span<const Entry>(doc_->node(node_).entries));
}

Result<ArgsMap> ParseContext::args_map(ArgRange range) const {
    auto entries = args();
    if (!entries.is_ok()) return Result<ArgsMap>::error(entries.diagnostic());

    const auto all = entries.value();
    const size_t end = range.end.value_or(all.size());
    if (range.begin > end || end > all.size()) {
        return Result<ArgsMap>::error(error("Range out of bounds"));
    }

    ArgsMap map;
    for (const auto& entry : all.subspan(range.begin, end - range.begin)) {
        if (!entry.name) continue;
        auto text = entry.value.to_text();
        if (!text) {
            return Result<ArgsMap>::error(error_with_span(
                std::format("Property '{}' cannot be null", *entry.name),
                entry.span, ErrorCategory::TYPE_MISMATCH));
        }
        map.emplace(*entry.name, std::move(*text));
    }
    return Result<ArgsMap>::ok(std::move(map));
}

Result<ArgsMap> ParseContext::args_map_with_only_keys(
        ArgRange range, std::span<const std::string_view> allowed) const {
    auto map = args_map(range);
    if (!map.is_ok()) return map;

    // Report in source order so the first offending entry is named
    const auto entries = args().value();
    const size_t end = range.end.value_or(entries.size());
    for (const auto& entry : entries.subspan(range.begin, end - range.begin)) {
        if (!entry.name) continue;
        if (std::find(allowed.begin(), allowed.end(), *entry.name) == allowed.end()) {
            return Result<ArgsMap>::error(error(
                std::format("Unknown configuration key: '{}'. Allowed keys are: {}",
                            *entry.name, utils::quoted_list(allowed)),
                ErrorCategory::UNKNOWN_KEY));
        }
    }
    return map;
}

Result<TypedValue> ParseContext::first() const {
    auto entries = args();
    if (!entries.is_ok()) return Result<TypedValue>::error(entries.diagnostic());
    if (entries.value().empty()) {
        return Result<TypedValue>::error(
            error("Missing required first argument", ErrorCategory::MISSING_REQUIRED));
    }
    return Result<TypedValue>::ok(TypedValue(*this, entries.value().front()));
}

Result<TypedValue> ParseContext::arg(size_t index) const {
    auto entries = args();
    if (!entries.is_ok()) return Result<TypedValue>::error(entries.diagnostic());

    size_t seen = 0;
    for (const auto& entry : entries.value()) {
        if (!entry.is_positional()) continue;
        if (seen++ == index) return Result<TypedValue>::ok(TypedValue(*this, entry));
    }
    return Result<TypedValue>::error(error(
        std::format("Missing required argument at position {}", index + 1),
        ErrorCategory::MISSING_REQUIRED));
}

Result<TypedValue> ParseContext::single_arg() const {
    auto value = arg(0);
    if (!value.is_ok()) return value;

    const auto entries = args().value();
    const auto positional = std::count_if(entries.begin(), entries.end(),
        [](const Entry& e) { return e.is_positional(); });
    if (positional > 1) {
        return Result<TypedValue>::error(error(std::format(
            "Directive '{}' takes exactly one positional argument, found {}",
            doc_->node(node_).name, positional)));
    }
    return value;
}

Result<TypedValue> ParseContext::prop(std::string_view key) const {
    auto found = opt_prop(key);
    if (!found.is_ok()) return Result<TypedValue>::error(found.diagnostic());
    if (!found.value()) {
        return Result<TypedValue>::error(error(
            std::format("Missing required property '{}'", key),
            ErrorCategory::MISSING_REQUIRED));
    }
    return Result<TypedValue>::ok(*found.value());
}

Result<std::optional<TypedValue>> ParseContext::opt_prop(std::string_view key) const {
    auto entries = args();
    if (!entries.is_ok()) return Result<std::optional<TypedValue>>::error(entries.diagnostic());

    for (const auto& entry : entries.value()) {
        if (entry.name && *entry.name == key) {
            return Result<std::optional<TypedValue>>::ok(TypedValue(*this, entry));
        }
    }
    return Result<std::optional<TypedValue>>::ok(std::nullopt);
}

// ---- Diagnostics -----------------------------------------------------------

Span ParseContext::current_span() const {
    if (focus_ == Focus::DOCUMENT) return block_span_;
    return doc_->node(node_).span;
}

Diagnostic ParseContext::error(std::string message, ErrorCategory category) const {
    return Diagnostic::at(category, std::move(message), *doc_, current_span(), source_name_);
}

Diagnostic ParseContext::error_with_span(std::string message, Span span,
                                         ErrorCategory category) const {
    return Diagnostic::at(category, std::move(message), *doc_, span, source_name_);
}

} // namespace motya
