#pragma once

#include "config/config_types.hpp"
#include "parser/section_parser.hpp"

namespace motya {

/**
 * @brief Parses a cache-key profile block
 *
 *   key "${cookie_session}" fallback="${client_ip}:${user_agent}"
 *   algorithm name="xxhash32" seed="idk"
 *   transforms-order {
 *       remove-query-params
 *       lowercase
 *       truncate length="256"
 *   }
 *
 * `key` is required. `algorithm` defaults to xxhash64 without a seed;
 * `transforms-order` defaults to no transforms.
 */
class KeyProfileParser : public ISectionParser<KeyTemplateConfig> {
public:
    [[nodiscard]] Result<KeyTemplateConfig> parse(const ParseContext& ctx) const override;

private:
    struct KeySource {
        std::string source;
        std::optional<std::string> fallback;
    };

    static Result<KeySource> extract_key(const ParseContext& ctx);
    static Result<HashAlgorithm> extract_algorithm(const ParseContext& ctx);
    static Result<std::vector<Transform>> extract_transforms(const ParseContext& ctx);
};

} // namespace motya
