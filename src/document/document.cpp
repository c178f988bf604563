#include "document/document.hpp"

#include <algorithm>
#include <format>

namespace motya {

const char* value_kind_to_string(ValueKind kind) {
    switch (kind) {
        case ValueKind::STRING:     return "String";
        case ValueKind::INTEGER:    return "Integer";
        case ValueKind::FLOAT:      return "Float";
        case ValueKind::BOOLEAN:    return "Boolean";
        case ValueKind::NULL_VALUE: return "Null";
    }
    return "Unknown";
}

// ============================================================================
// Value
// ============================================================================

Value Value::string(std::string s) {
    Value v;
    v.kind_ = ValueKind::STRING;
    v.string_ = std::move(s);
    return v;
}

Value Value::integer(int64_t i) {
    Value v;
    v.kind_ = ValueKind::INTEGER;
    v.integer_ = i;
    return v;
}

Value Value::floating(double d) {
    Value v;
    v.kind_ = ValueKind::FLOAT;
    v.float_ = d;
    return v;
}

Value Value::boolean(bool b) {
    Value v;
    v.kind_ = ValueKind::BOOLEAN;
    v.bool_ = b;
    return v;
}

Value Value::null() {
    return Value{};
}

std::optional<int64_t> Value::as_integer() const {
    if (kind_ != ValueKind::INTEGER) return std::nullopt;
    return integer_;
}

std::optional<double> Value::as_float() const {
    if (kind_ != ValueKind::FLOAT) return std::nullopt;
    return float_;
}

std::optional<bool> Value::as_bool() const {
    if (kind_ != ValueKind::BOOLEAN) return std::nullopt;
    return bool_;
}

std::optional<std::string> Value::to_text() const {
    switch (kind_) {
        case ValueKind::STRING:     return string_;
        case ValueKind::INTEGER:    return std::to_string(integer_);
        case ValueKind::FLOAT:      return std::format("{}", float_);
        case ValueKind::BOOLEAN:    return std::string(bool_ ? "true" : "false");
        case ValueKind::NULL_VALUE: return std::nullopt;
    }
    return std::nullopt;
}

std::string Value::describe() const {
    switch (kind_) {
        case ValueKind::STRING:     return std::format("String(\"{}\")", string_);
        case ValueKind::INTEGER:    return std::format("Integer({})", integer_);
        case ValueKind::FLOAT:      return std::format("Float({})", float_);
        case ValueKind::BOOLEAN:    return std::format("Boolean({})", bool_ ? "true" : "false");
        case ValueKind::NULL_VALUE: return "Null";
    }
    return "Unknown";
}

// ============================================================================
// Document
// ============================================================================

Document::Document(std::string source_text)
    : text_(std::move(source_text)) {}

NodeId Document::add_node(Node node) {
    nodes_.emplace_back(std::move(node));
    return nodes_.size() - 1;
}

void Document::add_root(NodeId id) {
    roots_.push_back(id);
}

size_t Document::erase_roots(std::string_view name) {
    const auto before = roots_.size();
    std::erase_if(roots_, [&](NodeId id) { return nodes_[id].name == name; });
    return before - roots_.size();
}

} // namespace motya
