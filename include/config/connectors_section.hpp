#pragma once

#include "config/config_types.hpp"
#include "parser/section_parser.hpp"

namespace motya {

/**
 * @brief Parses a `connectors` block
 *
 *   connectors {
 *       load-balance {
 *           selection "round-robin"
 *           health-check "none"
 *           discovery "static"
 *       }
 *       proxy "127.0.0.1:8000"
 *       proxy "10.0.0.5:443" tls-sni="example.com" proto="h2-or-h1"
 *   }
 *
 * At least one `proxy` is required. HTTP/2 protocols need `tls-sni`.
 */
class ConnectorsSection : public ISectionParser<Connectors> {
public:
    [[nodiscard]] Result<Connectors> parse(const ParseContext& ctx) const override;

private:
    static Result<LoadBalanceConfig> extract_load_balance(const ParseContext& ctx);
    static Result<UpstreamConfig> extract_upstream(const ParseContext& ctx);
};

} // namespace motya
