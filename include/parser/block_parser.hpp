#pragma once

#include "core/error.hpp"
#include "parser/parse_context.hpp"

#include <format>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace motya {

namespace detail {

template<typename R>
struct result_value;

template<typename U>
struct result_value<Result<U>> {
    using type = U;
};

template<typename F>
using extract_value_t =
    typename result_value<std::invoke_result_t<F&, const ParseContext&>>::type;

} // namespace detail

/**
 * @brief Closed-world consumer of one block's child directives
 *
 * Every child starts out pending. required()/optional()/repeated() remove
 * matching children by name and run the extractor on each. exhaust() must
 * be called last; any child still pending is reported as an unknown
 * directive, so a typo can never be silently ignored.
 *
 * Usage:
 *   auto block = BlockParser::create(ctx);
 *   auto key = block.value().required("key", extract_key);
 *   auto algo = block.value().optional("algorithm", extract_algorithm);
 *   auto done = block.value().exhaust();
 */
class BlockParser {
public:
    /**
     * @brief Start consuming a block
     *
     * A document-focused context is consumed as-is; a node-focused one is
     * entered first, which fails if the node has no children block.
     */
    [[nodiscard]] static Result<BlockParser> create(const ParseContext& ctx);

    /// Exactly one `name` directive must be present (the first match is taken).
    template<typename F>
    [[nodiscard]] Result<detail::extract_value_t<F>> required(std::string_view name, F&& extract) {
        using U = detail::extract_value_t<F>;
        if (exhausted_) return Result<U>::error(already_exhausted());

        auto child = take_first(name);
        if (!child) {
            return Result<U>::error(block_.error(
                std::format("Missing required directive '{}'", name),
                ErrorCategory::MISSING_REQUIRED));
        }
        return extract(*child);
    }

    /// At most one `name` directive; nullopt when absent.
    template<typename F>
    [[nodiscard]] Result<std::optional<detail::extract_value_t<F>>> optional(std::string_view name,
                                                                           F&& extract) {
        using U = detail::extract_value_t<F>;
        if (exhausted_) return Result<std::optional<U>>::error(already_exhausted());

        auto child = take_first(name);
        if (!child) return Result<std::optional<U>>::ok(std::nullopt);

        auto extracted = extract(*child);
        if (!extracted.is_ok()) return Result<std::optional<U>>::error(extracted.diagnostic());
        return Result<std::optional<U>>::ok(std::move(extracted.value()));
    }

    /// Every `name` directive, in source order; empty when there are none.
    template<typename F>
    [[nodiscard]] Result<std::vector<detail::extract_value_t<F>>> repeated(std::string_view name,
                                                                         F&& extract) {
        using U = detail::extract_value_t<F>;
        if (exhausted_) return Result<std::vector<U>>::error(already_exhausted());

        std::vector<U> out;
        for (const auto& child : take_all(name)) {
            auto extracted = extract(child);
            if (!extracted.is_ok()) return Result<std::vector<U>>::error(extracted.diagnostic());
            out.push_back(std::move(extracted.value()));
        }
        return Result<std::vector<U>>::ok(std::move(out));
    }

    /// Fails with UNKNOWN_DIRECTIVE naming the first child nobody consumed.
    [[nodiscard]] Result<void> exhaust();

    [[nodiscard]] const ParseContext& context() const { return block_; }
    [[nodiscard]] size_t pending_count() const { return pending_.size(); }

private:
    BlockParser(ParseContext block, std::vector<ParseContext> pending)
        : block_(block), pending_(std::move(pending)) {}

    std::optional<ParseContext> take_first(std::string_view name);
    std::vector<ParseContext> take_all(std::string_view name);
    [[nodiscard]] Diagnostic already_exhausted() const;

    ParseContext block_;
    std::vector<ParseContext> pending_;
    bool exhausted_ = false;
};

} // namespace motya
