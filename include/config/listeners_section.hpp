#pragma once

#include "config/config_types.hpp"
#include "parser/section_parser.hpp"

#include <optional>
#include <string>

namespace motya {

/**
 * @brief Parses a `listeners` block; each child is named by its address
 *
 *   listeners {
 *       "127.0.0.1:8080"
 *       "0.0.0.0:4443" cert-path="./assets/test.crt" key-path="./assets/test.key" offer-h2=true
 *   }
 *
 * cert-path and key-path come as a pair and enable TLS. offer-h2 defaults
 * to true with TLS and is rejected without it.
 */
class ListenersSection : public ISectionParser<Listeners> {
public:
    [[nodiscard]] Result<Listeners> parse(const ParseContext& ctx) const override;

    /// Combine the optional listener fields into a listener or a mutual-exclusion error.
    [[nodiscard]] static Result<ListenerConfig> resolve_tcp_listener(
        const ParseContext& ctx,
        SocketAddress address,
        std::optional<std::string> cert_path,
        std::optional<std::string> key_path,
        std::optional<bool> offer_h2);

private:
    static Result<ListenerConfig> extract_listener(const ParseContext& ctx);
};

} // namespace motya
