#pragma once

#include "config/config_types.hpp"

#include <string>
#include <string_view>

namespace motya {

/**
 * @brief Renders configuration values back to KDL
 *
 * Output uses the same directive and key names the section parsers read,
 * so parsing the rendered text yields an equal value. A section value is
 * rendered as the body of its block (what the section parser sees at the
 * document root); a Config is rendered as a complete file.
 */
class ConfigWriter {
public:
    [[nodiscard]] static std::string write(const Config& config);
    [[nodiscard]] static std::string write(const ProxyConfig& service);
    [[nodiscard]] static std::string write(const Listeners& listeners);
    [[nodiscard]] static std::string write(const Connectors& connectors);
    [[nodiscard]] static std::string write(const FilterChain& chain);
    [[nodiscard]] static std::string write(const KeyTemplateConfig& profile);

    /// KDL quoted string with escapes: "a\"b"
    [[nodiscard]] static std::string quote(std::string_view text);

    /// Bare identifier when the reader would read it back unchanged, quoted otherwise.
    [[nodiscard]] static std::string identifier(std::string_view text);
};

} // namespace motya
