#include "config/connectors_section.hpp"
#include "parser/block_parser.hpp"
#include "parser/typed_value.hpp"

namespace motya {

namespace {

// `selection "ketama"`: one positional value parsed into T, nothing else
template<TextParsable T>
Result<T> single_setting(const ParseContext& ctx) {
    static const Rule rules[] = {Rule::no_children(), Rule::only_keys_typed({})};
    const auto valid = ctx.validate(rules);
    if (!valid.is_ok()) return Result<T>::error(valid.diagnostic());

    auto value = ctx.single_arg();
    if (!value.is_ok()) return Result<T>::error(value.diagnostic());
    return value.value().parse_as<T>();
}

} // anonymous namespace

Result<Connectors> ConnectorsSection::parse(const ParseContext& ctx) const {
    if (!ctx.is_document()) {
        const auto named = ctx.expect_name("connectors");
        if (!named.is_ok()) return Result<Connectors>::error(named.diagnostic());
    }

    auto block = BlockParser::create(ctx);
    if (!block.is_ok()) return Result<Connectors>::error(block.diagnostic());
    auto& b = block.value();

    auto load_balance = b.optional("load-balance", extract_load_balance);
    if (!load_balance.is_ok()) return Result<Connectors>::error(load_balance.diagnostic());

    auto upstreams = b.repeated("proxy", extract_upstream);
    if (!upstreams.is_ok()) return Result<Connectors>::error(upstreams.diagnostic());
    if (upstreams.value().empty()) {
        return Result<Connectors>::error(b.context().error(
            "Missing required directive 'proxy'", ErrorCategory::MISSING_REQUIRED));
    }

    const auto done = b.exhaust();
    if (!done.is_ok()) return Result<Connectors>::error(done.diagnostic());

    Connectors out;
    out.load_balance = std::move(load_balance.value());
    out.upstreams = std::move(upstreams.value());
    return Result<Connectors>::ok(std::move(out));
}

Result<LoadBalanceConfig> ConnectorsSection::extract_load_balance(const ParseContext& ctx) {
    auto block = BlockParser::create(ctx);
    if (!block.is_ok()) return Result<LoadBalanceConfig>::error(block.diagnostic());
    auto& b = block.value();

    auto selection = b.optional("selection", single_setting<SelectionKind>);
    if (!selection.is_ok()) return Result<LoadBalanceConfig>::error(selection.diagnostic());
    auto health_check = b.optional("health-check", single_setting<HealthCheckKind>);
    if (!health_check.is_ok()) return Result<LoadBalanceConfig>::error(health_check.diagnostic());
    auto discovery = b.optional("discovery", single_setting<DiscoveryKind>);
    if (!discovery.is_ok()) return Result<LoadBalanceConfig>::error(discovery.diagnostic());

    const auto done = b.exhaust();
    if (!done.is_ok()) return Result<LoadBalanceConfig>::error(done.diagnostic());

    LoadBalanceConfig cfg;
    cfg.selection = selection.value().value_or(SelectionKind::ROUND_ROBIN);
    cfg.health_check = health_check.value().value_or(HealthCheckKind::NONE);
    cfg.discovery = discovery.value().value_or(DiscoveryKind::STATIC);
    return Result<LoadBalanceConfig>::ok(cfg);
}

Result<UpstreamConfig> ConnectorsSection::extract_upstream(const ParseContext& ctx) {
    static const Rule rules[] = {
        Rule::no_children(),
        Rule::only_keys_typed({
            {"tls-sni", ValueKind::STRING},
            {"proto", ValueKind::STRING},
        }),
    };
    const auto valid = ctx.validate(rules);
    if (!valid.is_ok()) return Result<UpstreamConfig>::error(valid.diagnostic());

    auto target = ctx.single_arg();
    if (!target.is_ok()) return Result<UpstreamConfig>::error(target.diagnostic());
    auto address = target.value().parse_as<SocketAddress>();
    if (!address.is_ok()) return Result<UpstreamConfig>::error(address.diagnostic());

    auto sni_value = ctx.opt_prop("tls-sni");
    if (!sni_value.is_ok()) return Result<UpstreamConfig>::error(sni_value.diagnostic());
    auto sni = parse_as<Fqdn>(sni_value.value());
    if (!sni.is_ok()) return Result<UpstreamConfig>::error(sni.diagnostic());

    auto proto_value = ctx.opt_prop("proto");
    if (!proto_value.is_ok()) return Result<UpstreamConfig>::error(proto_value.diagnostic());
    auto proto = parse_as<HttpProto>(proto_value.value());
    if (!proto.is_ok()) return Result<UpstreamConfig>::error(proto.diagnostic());

    UpstreamConfig cfg;
    cfg.address = std::move(address.value());
    cfg.tls_sni = std::move(sni.value());
    cfg.proto = proto.value().value_or(HttpProto::H1_ONLY);

    if (cfg.proto != HttpProto::H1_ONLY && !cfg.tls_sni) {
        return Result<UpstreamConfig>::error(ctx.error(
            "HTTP/2 upstreams require TLS, specify 'tls-sni'",
            ErrorCategory::MUTUAL_EXCLUSION));
    }
    return Result<UpstreamConfig>::ok(std::move(cfg));
}

} // namespace motya
