#pragma once

#include "config/config_types.hpp"
#include "parser/section_parser.hpp"

namespace motya {

/**
 * @brief Parses a filter chain block
 *
 *   filter name="com.example.auth"
 *   filter name="com.example.logger" level="debug" format="json"
 *
 * Filters keep source order. Every property other than `name` becomes a
 * filter argument.
 */
class ChainParser : public ISectionParser<FilterChain> {
public:
    [[nodiscard]] Result<FilterChain> parse(const ParseContext& ctx) const override;

private:
    static Result<ConfiguredFilter> extract_filter(const ParseContext& ctx);
};

} // namespace motya
