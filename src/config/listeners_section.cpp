#include "config/listeners_section.hpp"
#include "parser/typed_value.hpp"

#include <format>

namespace motya {

Result<Listeners> ListenersSection::parse(const ParseContext& ctx) const {
    if (!ctx.is_document()) {
        const auto named = ctx.expect_name("listeners");
        if (!named.is_ok()) return Result<Listeners>::error(named.diagnostic());
    }

    auto nodes = ctx.req_nodes();
    if (!nodes.is_ok()) return Result<Listeners>::error(nodes.diagnostic());

    Listeners out;
    out.list_cfgs.reserve(nodes.value().size());
    for (const auto& node_ctx : nodes.value()) {
        auto listener = extract_listener(node_ctx);
        if (!listener.is_ok()) return Result<Listeners>::error(listener.diagnostic());
        out.list_cfgs.push_back(std::move(listener.value()));
    }
    return Result<Listeners>::ok(std::move(out));
}

Result<ListenerConfig> ListenersSection::extract_listener(const ParseContext& ctx) {
    static const Rule rules[] = {
        Rule::no_children(),
        Rule::no_positional_args(),
        Rule::only_keys_typed({
            {"cert-path", ValueKind::STRING},
            {"key-path", ValueKind::STRING},
            {"offer-h2", ValueKind::BOOLEAN},
        }),
        Rule::name(NamePredicate::SOCKET_ADDR),
    };
    const auto valid = ctx.validate(rules);
    if (!valid.is_ok()) return Result<ListenerConfig>::error(valid.diagnostic());

    const auto name = ctx.name().value();
    SocketAddress address;
    std::string reason;
    if (!SocketAddress::parse(name, address, reason)) {
        return Result<ListenerConfig>::error(ctx.error_with_span(
            std::format("Invalid SocketAddr '{}'. Reason: {}", name, reason),
            ctx.current_node()->name_span, ErrorCategory::FORMAT_ERROR));
    }

    auto cert = ctx.opt_prop("cert-path");
    if (!cert.is_ok()) return Result<ListenerConfig>::error(cert.diagnostic());
    auto key = ctx.opt_prop("key-path");
    if (!key.is_ok()) return Result<ListenerConfig>::error(key.diagnostic());
    auto h2 = ctx.opt_prop("offer-h2");
    if (!h2.is_ok()) return Result<ListenerConfig>::error(h2.diagnostic());

    auto cert_path = as_str(cert.value());
    if (!cert_path.is_ok()) return Result<ListenerConfig>::error(cert_path.diagnostic());
    auto key_path = as_str(key.value());
    if (!key_path.is_ok()) return Result<ListenerConfig>::error(key_path.diagnostic());
    auto offer_h2 = as_bool(h2.value());
    if (!offer_h2.is_ok()) return Result<ListenerConfig>::error(offer_h2.diagnostic());

    return resolve_tcp_listener(ctx, std::move(address),
                                std::move(cert_path.value()),
                                std::move(key_path.value()),
                                offer_h2.value());
}

Result<ListenerConfig> ListenersSection::resolve_tcp_listener(
        const ParseContext& ctx,
        SocketAddress address,
        std::optional<std::string> cert_path,
        std::optional<std::string> key_path,
        std::optional<bool> offer_h2) {
    if (cert_path.has_value() != key_path.has_value()) {
        return Result<ListenerConfig>::error(ctx.error(
            "'cert-path' and 'key-path' must either BOTH be present, or NEITHER should be present",
            ErrorCategory::MUTUAL_EXCLUSION));
    }

    ListenerConfig cfg;
    cfg.kind = ListenerKind::TCP;
    cfg.address = std::move(address);

    if (!cert_path) {
        if (offer_h2) {
            return Result<ListenerConfig>::error(ctx.error(
                "'offer-h2' requires TLS, specify 'cert-path' and 'key-path'",
                ErrorCategory::MUTUAL_EXCLUSION));
        }
        cfg.offer_h2 = false;
        return Result<ListenerConfig>::ok(std::move(cfg));
    }

    cfg.tls = TlsConfig{std::move(*cert_path), std::move(*key_path)};
    cfg.offer_h2 = offer_h2.value_or(true);
    return Result<ListenerConfig>::ok(std::move(cfg));
}

} // namespace motya
