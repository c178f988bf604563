#include "config/service_section.hpp"
#include "parser/block_parser.hpp"

namespace motya {

ServiceSection::ServiceSection(const ISectionParser<Listeners>& listeners,
                               const ISectionParser<Connectors>& connectors,
                               std::string name)
    : listeners_(listeners),
      connectors_(connectors),
      name_(std::move(name)) {}

Result<ProxyConfig> ServiceSection::parse(const ParseContext& ctx) const {
    auto block = BlockParser::create(ctx);
    if (!block.is_ok()) return Result<ProxyConfig>::error(block.diagnostic());
    auto& b = block.value();

    auto listeners = b.required("listeners",
        [this](const ParseContext& c) { return listeners_.parse(c); });
    if (!listeners.is_ok()) return Result<ProxyConfig>::error(listeners.diagnostic());

    auto connectors = b.required("connectors",
        [this](const ParseContext& c) { return connectors_.parse(c); });
    if (!connectors.is_ok()) return Result<ProxyConfig>::error(connectors.diagnostic());

    const auto done = b.exhaust();
    if (!done.is_ok()) return Result<ProxyConfig>::error(done.diagnostic());

    ProxyConfig cfg;
    cfg.name = name_;
    cfg.listeners = std::move(listeners.value());
    cfg.connectors = std::move(connectors.value());
    return Result<ProxyConfig>::ok(std::move(cfg));
}

} // namespace motya
