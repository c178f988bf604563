#include "config/config_json.hpp"

namespace motya {

using json = nlohmann::json;

void to_json(json& j, const ConfiguredFilter& filter) {
    j = json{{"name", filter.name.str()}, {"args", filter.args}};
}

void to_json(json& j, const FilterChain& chain) {
    j = json{{"filters", chain.filters}};
}

void to_json(json& j, const HashAlgorithm& algorithm) {
    j = json{{"name", algorithm.name}};
    j["seed"] = algorithm.seed ? json(*algorithm.seed) : json(nullptr);
}

void to_json(json& j, const Transform& transform) {
    j = json{{"name", transform.name}, {"params", transform.params}};
}

void to_json(json& j, const KeyTemplateConfig& profile) {
    j = json{
        {"source", profile.source},
        {"algorithm", profile.algorithm},
        {"transforms", profile.transforms},
    };
    j["fallback"] = profile.fallback ? json(*profile.fallback) : json(nullptr);
}

void to_json(json& j, const ListenerConfig& listener) {
    j = json{
        {"kind", "tcp"},
        {"address", listener.address.to_string()},
        {"offer_h2", listener.offer_h2},
    };
    if (listener.tls) {
        j["tls"] = json{
            {"cert_path", listener.tls->cert_path.string()},
            {"key_path", listener.tls->key_path.string()},
        };
    } else {
        j["tls"] = nullptr;
    }
}

void to_json(json& j, const Listeners& listeners) {
    j = listeners.list_cfgs;
}

void to_json(json& j, const LoadBalanceConfig& lb) {
    j = json{
        {"selection", selection_kind_to_string(lb.selection)},
        {"health_check", health_check_kind_to_string(lb.health_check)},
        {"discovery", discovery_kind_to_string(lb.discovery)},
    };
}

void to_json(json& j, const UpstreamConfig& upstream) {
    j = json{
        {"address", upstream.address.to_string()},
        {"proto", http_proto_to_string(upstream.proto)},
    };
    j["tls_sni"] = upstream.tls_sni ? json(upstream.tls_sni->str()) : json(nullptr);
}

void to_json(json& j, const Connectors& connectors) {
    j = json{{"upstreams", connectors.upstreams}};
    j["load_balance"] = connectors.load_balance ? json(*connectors.load_balance) : json(nullptr);
}

void to_json(json& j, const ProxyConfig& service) {
    j = json{
        {"name", service.name},
        {"listeners", service.listeners},
        {"connectors", service.connectors},
    };
}

void to_json(json& j, const Config& config) {
    json chains = json::object();
    for (const auto& named : config.filter_chains) {
        chains[named.name] = named.chain;
    }
    json profiles = json::object();
    for (const auto& named : config.key_profiles) {
        profiles[named.name] = named.profile;
    }
    j = json{
        {"services", config.services},
        {"filter_chains", std::move(chains)},
        {"key_profiles", std::move(profiles)},
    };
}

} // namespace motya
