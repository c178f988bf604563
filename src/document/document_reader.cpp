#include "document/document_reader.hpp"

#include <kdl/kdl.h>

#include <algorithm>
#include <format>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace motya {

namespace {

struct ParserDeleter {
    void operator()(kdl_parser* p) const { if (p) kdl_destroy_parser(p); }
};
using ParserPtr = std::unique_ptr<kdl_parser, ParserDeleter>;

struct TokenizerDeleter {
    void operator()(kdl_tokenizer* t) const { if (t) kdl_destroy_tokenizer(t); }
};
using TokenizerPtr = std::unique_ptr<kdl_tokenizer, TokenizerDeleter>;

std::string to_string(kdl_str s) {
    return s.data != nullptr ? std::string(s.data, s.len) : std::string();
}

// ============================================================================
// Span recovery over ckdl tokens
// ============================================================================

enum class TokenKind {
    SPACE,          // whitespace, block comments, line continuations
    TERMINATOR,     // newline, ';', line comment
    SLASHDASH,
    OPEN_TYPE,
    CLOSE_TYPE,
    EQUALS,
    OPEN_BLOCK,
    CLOSE_BLOCK,
    VALUE           // identifiers, strings, numbers, keywords
};

struct Token {
    TokenKind kind;
    Span span;
};

TokenKind classify(kdl_token_type type) {
    switch (type) {
        case KDL_TOKEN_WHITESPACE:
        case KDL_TOKEN_MULTI_LINE_COMMENT:
        case KDL_TOKEN_LINE_CONTINUATION:   return TokenKind::SPACE;
        case KDL_TOKEN_NEWLINE:
        case KDL_TOKEN_SEMICOLON:
        case KDL_TOKEN_SINGLE_LINE_COMMENT: return TokenKind::TERMINATOR;
        case KDL_TOKEN_SLASHDASH:           return TokenKind::SLASHDASH;
        case KDL_TOKEN_START_TYPE:          return TokenKind::OPEN_TYPE;
        case KDL_TOKEN_END_TYPE:            return TokenKind::CLOSE_TYPE;
        case KDL_TOKEN_EQUALS:              return TokenKind::EQUALS;
        case KDL_TOKEN_START_CHILDREN:      return TokenKind::OPEN_BLOCK;
        case KDL_TOKEN_END_CHILDREN:        return TokenKind::CLOSE_BLOCK;
        default:                            return TokenKind::VALUE;
    }
}

// Tokens up to the first tokenizer error. Token values are slices of `text`.
std::vector<Token> tokenize(std::string_view text) {
    std::vector<Token> tokens;
    TokenizerPtr tokenizer(kdl_create_string_tokenizer(kdl_str{text.data(), text.size()}));
    if (!tokenizer) return tokens;

    const char* const begin = text.data();
    const char* const end = begin + text.size();
    kdl_token token;
    while (kdl_pop_token(tokenizer.get(), &token) == KDL_TOKENIZER_OK) {
        if (token.value.data < begin || token.value.data + token.value.len > end) break;
        tokens.push_back(Token{classify(token.type),
                               Span{static_cast<size_t>(token.value.data - begin), token.value.len}});
    }
    return tokens;
}

struct NodeLayout {
    Span name;
    Span span;
    std::vector<Span> entries;
    std::optional<Span> children;
};

/**
 * @brief Walks the token stream in the same pre-order ckdl emits nodes in
 *
 * Slashdashed nodes, entries and blocks are skipped so the n-th layout
 * matches the n-th START_NODE event and each entry span matches the
 * ARGUMENT/PROPERTY event at the same position. The walk is iterative, so
 * nesting depth costs heap, not stack.
 */
class SpanLocator {
public:
    explicit SpanLocator(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    std::vector<NodeLayout> run() {
        size_t i = 0;
        std::optional<size_t> current;
        std::vector<size_t> open_blocks;

        while (i < tokens_.size()) {
            const Token& tok = tokens_[i];

            if (!current) {
                switch (tok.kind) {
                    case TokenKind::SLASHDASH:
                        i = skip_node(i + 1);
                        break;
                    case TokenKind::CLOSE_BLOCK:
                        if (!open_blocks.empty()) {
                            const size_t parent = open_blocks.back();
                            open_blocks.pop_back();
                            auto& block = *layouts_[parent].children;
                            block.length = tok.span.end() - block.offset;
                            extend(parent, tok.span);
                            current = parent;
                        }
                        ++i;
                        break;
                    case TokenKind::OPEN_TYPE:
                    case TokenKind::VALUE:
                        current = begin_node(i);
                        break;
                    default:
                        ++i;
                        break;
                }
                continue;
            }

            switch (tok.kind) {
                case TokenKind::TERMINATOR:
                    current.reset();
                    ++i;
                    break;
                case TokenKind::CLOSE_BLOCK:
                    // Ends this node; the enclosing block is closed on the next pass
                    current.reset();
                    break;
                case TokenKind::OPEN_BLOCK:
                    layouts_[*current].children = tok.span;
                    open_blocks.push_back(*current);
                    current.reset();
                    ++i;
                    break;
                case TokenKind::SLASHDASH:
                    i = skip_entry_or_block(i + 1);
                    break;
                case TokenKind::OPEN_TYPE:
                case TokenKind::VALUE:
                    i = read_entry(*current, i);
                    break;
                default:
                    ++i;
                    break;
            }
        }
        return std::move(layouts_);
    }

private:
    std::vector<Token> tokens_;
    std::vector<NodeLayout> layouts_;

    [[nodiscard]] bool is(size_t i, TokenKind kind) const {
        return i < tokens_.size() && tokens_[i].kind == kind;
    }

    [[nodiscard]] size_t skip_space(size_t i) const {
        while (is(i, TokenKind::SPACE)) ++i;
        return i;
    }

    // Index past a "(type)" annotation at i, or i itself when there is none
    [[nodiscard]] size_t skip_annotation(size_t i) const {
        if (!is(i, TokenKind::OPEN_TYPE)) return i;
        while (i < tokens_.size() && tokens_[i].kind != TokenKind::CLOSE_TYPE) ++i;
        return skip_space(std::min(i + 1, tokens_.size()));
    }

    // j is the first value token of an entry; returns the index past the entry
    [[nodiscard]] size_t past_entry(size_t j, size_t& end_offset) const {
        end_offset = tokens_[j].span.end();
        const size_t eq = skip_space(j + 1);
        if (!is(eq, TokenKind::EQUALS)) return j + 1;
        const size_t v = skip_annotation(skip_space(eq + 1));
        if (!is(v, TokenKind::VALUE)) return v;
        end_offset = tokens_[v].span.end();
        return v + 1;
    }

    [[nodiscard]] size_t skip_block(size_t i) const {
        size_t depth = 0;
        for (; i < tokens_.size(); ++i) {
            if (tokens_[i].kind == TokenKind::OPEN_BLOCK) {
                ++depth;
            } else if (tokens_[i].kind == TokenKind::CLOSE_BLOCK && --depth == 0) {
                return i + 1;
            }
        }
        return i;
    }

    [[nodiscard]] size_t skip_node(size_t i) const {
        while (is(i, TokenKind::SPACE) || is(i, TokenKind::TERMINATOR)) ++i;
        i = skip_annotation(i);
        if (is(i, TokenKind::VALUE)) ++i;

        size_t depth = 0;
        for (; i < tokens_.size(); ++i) {
            switch (tokens_[i].kind) {
                case TokenKind::OPEN_BLOCK:
                    ++depth;
                    break;
                case TokenKind::CLOSE_BLOCK:
                    if (depth == 0) return i;
                    --depth;
                    break;
                case TokenKind::TERMINATOR:
                    if (depth == 0) return i + 1;
                    break;
                default:
                    break;
            }
        }
        return i;
    }

    [[nodiscard]] size_t skip_entry_or_block(size_t i) const {
        i = skip_space(i);
        if (is(i, TokenKind::OPEN_BLOCK)) return skip_block(i);
        const size_t j = skip_annotation(i);
        if (!is(j, TokenKind::VALUE)) return j;
        size_t unused = 0;
        return past_entry(j, unused);
    }

    size_t begin_node(size_t& i) {
        const size_t start = tokens_[i].span.offset;
        i = skip_annotation(i);

        NodeLayout layout;
        layout.name = Span{start, 0};
        if (is(i, TokenKind::VALUE)) {
            layout.name = tokens_[i].span;
            ++i;
        }
        layout.span = Span{start, layout.name.end() - start};
        layouts_.push_back(std::move(layout));
        return layouts_.size() - 1;
    }

    size_t read_entry(size_t node, size_t i) {
        const size_t start = tokens_[i].span.offset;
        const size_t j = skip_annotation(i);
        if (!is(j, TokenKind::VALUE)) return std::max(j, i + 1);

        size_t end = 0;
        const size_t next = past_entry(j, end);
        const Span span{start, end - start};
        layouts_[node].entries.push_back(span);
        extend(node, span);
        return next;
    }

    void extend(size_t node, Span tail) {
        auto& span = layouts_[node].span;
        if (tail.end() > span.end()) span.length = tail.end() - span.offset;
    }
};

// ============================================================================
// Arena construction from ckdl events
// ============================================================================

class DocumentBuilder {
public:
    DocumentBuilder(Document& doc, std::string_view source_name, std::vector<NodeLayout> layouts)
        : doc_(doc), source_name_(source_name), layouts_(std::move(layouts)) {}

    Result<void> run() {
        const std::string& text = doc_.text();
        ParserPtr parser(kdl_create_string_parser(kdl_str{text.data(), text.size()},
                                                  KDL_DETECT_VERSION));
        if (!parser) {
            return Result<void>::error(fail("Failed to create KDL parser", Span{}));
        }

        while (true) {
            const kdl_event_data* event = kdl_parser_next_event(parser.get());
            if (event == nullptr) {
                return Result<void>::error(fail("KDL parser stopped without an event", error_span()));
            }

            switch (event->event) {
                case KDL_EVENT_EOF:
                    return Result<void>::ok();
                case KDL_EVENT_PARSE_ERROR: {
                    const std::string reason = event->value.type == KDL_TYPE_STRING
                        ? to_string(event->value.string) : std::string("parse error");
                    return Result<void>::error(
                        fail(std::format("Invalid KDL: {}", reason), error_span()));
                }
                case KDL_EVENT_START_NODE: {
                    auto started = start_node(to_string(event->name));
                    if (!started.is_ok()) return started;
                    break;
                }
                case KDL_EVENT_END_NODE:
                    if (!open_.empty()) open_.pop_back();
                    break;
                case KDL_EVENT_ARGUMENT:
                case KDL_EVENT_PROPERTY: {
                    auto added = add_entry(*event);
                    if (!added.is_ok()) return added;
                    break;
                }
                default:
                    break;
            }
        }
    }

private:
    Document& doc_;
    std::string_view source_name_;
    std::vector<NodeLayout> layouts_;
    std::vector<NodeId> open_;

    [[nodiscard]] Diagnostic fail(std::string message, Span span) const {
        return Diagnostic::at(ErrorCategory::SYNTAX_ERROR, std::move(message), doc_, span, source_name_);
    }

    // Innermost open node, else the last node read, else the document start
    [[nodiscard]] Span error_span() const {
        if (!open_.empty()) return doc_.node(open_.back()).span;
        if (doc_.node_count() > 0) return doc_.node(doc_.node_count() - 1).span;
        return Span{};
    }

    Result<void> start_node(std::string name) {
        if (open_.size() >= DocumentReader::kMaxNesting) {
            return Result<void>::error(fail(
                std::format("Nesting too deep, at most {} levels are allowed",
                            DocumentReader::kMaxNesting),
                error_span()));
        }

        Node node;
        node.name = std::move(name);

        // Arena ids follow ckdl's pre-order, the same order as the layouts
        const NodeId id = doc_.node_count();
        if (id < layouts_.size()) {
            const auto& layout = layouts_[id];
            node.name_span = layout.name;
            node.span = layout.span;
            if (layout.children) {
                node.children.emplace();
                node.children_span = *layout.children;
            }
        }
        doc_.add_node(std::move(node));

        if (open_.empty()) {
            doc_.add_root(id);
        } else {
            Node& parent = doc_.node(open_.back());
            if (!parent.children) parent.children.emplace();
            parent.children->push_back(id);
        }
        open_.push_back(id);
        return Result<void>::ok();
    }

    Result<void> add_entry(const kdl_event_data& event) {
        if (open_.empty()) {
            return Result<void>::error(fail("Entry outside of a node", error_span()));
        }
        const NodeId id = open_.back();
        Node& node = doc_.node(id);

        Entry entry;
        if (event.event == KDL_EVENT_PROPERTY) entry.name = to_string(event.name);

        const size_t index = node.entries.size();
        entry.span = (id < layouts_.size() && index < layouts_[id].entries.size())
            ? layouts_[id].entries[index] : node.span;

        auto value = convert(event.value, entry.span);
        if (!value.is_ok()) return Result<void>::error(value.diagnostic());
        entry.value = std::move(value.value());
        node.entries.push_back(std::move(entry));
        return Result<void>::ok();
    }

    [[nodiscard]] Result<Value> convert(const kdl_value& value, Span span) const {
        switch (value.type) {
            case KDL_TYPE_NULL:
                return Result<Value>::ok(Value::null());
            case KDL_TYPE_BOOLEAN:
                return Result<Value>::ok(Value::boolean(value.boolean));
            case KDL_TYPE_STRING:
                return Result<Value>::ok(Value::string(to_string(value.string)));
            case KDL_TYPE_NUMBER:
                switch (value.number.type) {
                    case KDL_NUMBER_TYPE_INTEGER:
                        return Result<Value>::ok(Value::integer(value.number.integer));
                    case KDL_NUMBER_TYPE_FLOATING_POINT:
                        return Result<Value>::ok(Value::floating(value.number.floating_point));
                    case KDL_NUMBER_TYPE_STRING_ENCODED:
                        return Result<Value>::error(fail(std::format(
                            "Number literal '{}' is out of range",
                            to_string(value.number.string)), span));
                }
                break;
        }
        return Result<Value>::error(fail("Unsupported KDL value", span));
    }
};

} // anonymous namespace

Result<Document> DocumentReader::read(std::string text, std::string_view source_name) {
    Document doc(std::move(text));
    DocumentBuilder builder(doc, source_name, SpanLocator(tokenize(doc.text())).run());
    auto built = builder.run();
    if (!built.is_ok()) return Result<Document>::error(built.diagnostic());
    return Result<Document>::ok(std::move(doc));
}

} // namespace motya
