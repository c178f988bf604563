#pragma once

#include "core/error.hpp"
#include "parser/parse_context.hpp"

namespace motya {

/**
 * @brief Abstract parser for one configuration schema
 *
 * Each schema (listeners, connectors, filter chain, key profile, service)
 * has one implementation. Composite parsers hold the parsers they delegate
 * to through this interface, so any of them can be swapped in tests.
 */
template<typename T>
class ISectionParser {
public:
    virtual ~ISectionParser() = default;

    /**
     * @brief Parse the schema rooted at `ctx`
     * @return Typed configuration value or the first diagnostic
     */
    [[nodiscard]] virtual Result<T> parse(const ParseContext& ctx) const = 0;
};

} // namespace motya
