#pragma once

#include "config/config_types.hpp"
#include "parser/section_parser.hpp"

#include <string>

namespace motya {

/**
 * @brief Parses one service block into a ProxyConfig
 *
 *   Example1 {
 *       listeners { ... }
 *       connectors { ... }
 *   }
 *
 * The service owns no schema of its own beyond requiring both children;
 * each child is handed to the injected section parser.
 */
class ServiceSection : public ISectionParser<ProxyConfig> {
public:
    ServiceSection(const ISectionParser<Listeners>& listeners,
                   const ISectionParser<Connectors>& connectors,
                   std::string name);

    [[nodiscard]] Result<ProxyConfig> parse(const ParseContext& ctx) const override;

private:
    const ISectionParser<Listeners>& listeners_;
    const ISectionParser<Connectors>& connectors_;
    std::string name_;
};

} // namespace motya
