#pragma once

#include "core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace motya {

using NodeId = size_t;

/**
 * @brief Scalar kinds an entry value may hold
 */
enum class ValueKind {
    STRING,
    INTEGER,
    FLOAT,
    BOOLEAN,
    NULL_VALUE
};

/// "String", "Integer", "Float", "Boolean", "Null"
[[nodiscard]] const char* value_kind_to_string(ValueKind kind);

/**
 * @brief One scalar value of a document entry
 */
class Value {
public:
    Value() = default;

    static Value string(std::string s);
    static Value integer(int64_t i);
    static Value floating(double d);
    static Value boolean(bool b);
    static Value null();

    [[nodiscard]] ValueKind kind() const { return kind_; }
    [[nodiscard]] bool is_string() const { return kind_ == ValueKind::STRING; }
    [[nodiscard]] bool is_integer() const { return kind_ == ValueKind::INTEGER; }
    [[nodiscard]] bool is_float() const { return kind_ == ValueKind::FLOAT; }
    [[nodiscard]] bool is_bool() const { return kind_ == ValueKind::BOOLEAN; }
    [[nodiscard]] bool is_null() const { return kind_ == ValueKind::NULL_VALUE; }

    [[nodiscard]] const std::string* as_string() const {
        return kind_ == ValueKind::STRING ? &string_ : nullptr;
    }
    [[nodiscard]] std::optional<int64_t> as_integer() const;
    [[nodiscard]] std::optional<double> as_float() const;
    [[nodiscard]] std::optional<bool> as_bool() const;

    /// Textual form of a non-null scalar ("42", "1.5", "true"), nullopt for null.
    [[nodiscard]] std::optional<std::string> to_text() const;

    /// Debug rendering used in type-mismatch messages: String("x"), Integer(42), Null
    [[nodiscard]] std::string describe() const;

    bool operator==(const Value&) const = default;

private:
    ValueKind kind_ = ValueKind::NULL_VALUE;
    std::string string_;
    int64_t integer_ = 0;
    double float_ = 0.0;
    bool bool_ = false;
};

/**
 * @brief A positional (unnamed) or named (key=value) argument of a node
 */
struct Entry {
    std::optional<std::string> name;
    Value value;
    Span span;

    [[nodiscard]] bool is_positional() const { return !name.has_value(); }
};

/**
 * @brief One directive: name, entries and an optional children block
 */
struct Node {
    std::string name;
    Span name_span;
    Span span;
    std::vector<Entry> entries;
    std::optional<std::vector<NodeId>> children;
    Span children_span;
};

/**
 * @brief Arena holding a fully materialized configuration document
 *
 * Nodes are stored flat and referenced by NodeId; contexts carry ids
 * instead of pointers into the tree. The document owns the source text
 * so diagnostics can quote it.
 */
class Document {
public:
    Document() = default;
    explicit Document(std::string source_text);

    /// Append a node to the arena and return its id. Does not attach it anywhere.
    NodeId add_node(Node node);

    /// Attach an existing node as the last root.
    void add_root(NodeId id);

    /// Remove every root node named `name`; returns how many were removed.
    size_t erase_roots(std::string_view name);

    [[nodiscard]] const Node& node(NodeId id) const { return nodes_.at(id); }
    [[nodiscard]] Node& node(NodeId id) { return nodes_.at(id); }
    [[nodiscard]] const std::vector<NodeId>& roots() const { return roots_; }
    [[nodiscard]] size_t node_count() const { return nodes_.size(); }

    [[nodiscard]] const std::string& text() const { return text_; }
    [[nodiscard]] Span span() const { return Span{0, text_.size()}; }

private:
    std::string text_;
    std::vector<Node> nodes_;
    std::vector<NodeId> roots_;
};

} // namespace motya
