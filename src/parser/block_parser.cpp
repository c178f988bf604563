#include "parser/block_parser.hpp"

#include <algorithm>
#include <format>

namespace motya {

Result<BlockParser> BlockParser::create(const ParseContext& ctx) {
    ParseContext block = ctx;
    if (!ctx.is_document()) {
        auto entered = ctx.enter_block();
        if (!entered.is_ok()) return Result<BlockParser>::error(entered.diagnostic());
        block = entered.value();
    }

    auto children = block.nodes();
    if (!children.is_ok()) return Result<BlockParser>::error(children.diagnostic());
    return Result<BlockParser>::ok(BlockParser(block, std::move(children.value())));
}

std::optional<ParseContext> BlockParser::take_first(std::string_view name) {
    const auto it = std::find_if(pending_.begin(), pending_.end(),
        [&](const ParseContext& c) { return c.current_node()->name == name; });
    if (it == pending_.end()) return std::nullopt;

    ParseContext found = *it;
    pending_.erase(it);
    return found;
}

std::vector<ParseContext> BlockParser::take_all(std::string_view name) {
    std::vector<ParseContext> taken;
    std::vector<ParseContext> rest;
    rest.reserve(pending_.size());
    for (const auto& c : pending_) {
        if (c.current_node()->name == name) {
            taken.push_back(c);
        } else {
            rest.push_back(c);
        }
    }
    pending_ = std::move(rest);
    return taken;
}

Result<void> BlockParser::exhaust() {
    if (exhausted_) return Result<void>::error(already_exhausted());
    exhausted_ = true;

    if (!pending_.empty()) {
        const auto& leftover = pending_.front();
        return Result<void>::error(leftover.error_with_span(
            std::format("Unknown directive: '{}'", leftover.current_node()->name),
            leftover.current_node()->name_span, ErrorCategory::UNKNOWN_DIRECTIVE));
    }
    return Result<void>::ok();
}

Diagnostic BlockParser::already_exhausted() const {
    return block_.error("Block parser used after exhaust()");
}

} // namespace motya
