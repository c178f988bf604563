#include "config/config_writer.hpp"

#include <format>

namespace motya {

namespace {

class Emitter {
public:
    void line(std::string_view text) {
        out_.append(depth_ * 4, ' ');
        out_ += text;
        out_ += '\n';
    }

    void open(std::string_view header) {
        line(std::format("{} {{", header));
        ++depth_;
    }

    void close() {
        --depth_;
        line("}");
    }

    [[nodiscard]] std::string take() { return std::move(out_); }

private:
    std::string out_;
    size_t depth_ = 0;
};

void append_params(std::string& line, const ParamMap& params) {
    for (const auto& [key, value] : params) {
        line += std::format(" {}={}", ConfigWriter::identifier(key), ConfigWriter::quote(value));
    }
}

void emit_chain(Emitter& e, const FilterChain& chain) {
    for (const auto& filter : chain.filters) {
        std::string line = std::format("filter name={}", ConfigWriter::quote(filter.name.str()));
        append_params(line, filter.args);
        e.line(line);
    }
}

void emit_profile(Emitter& e, const KeyTemplateConfig& profile) {
    std::string key = std::format("key {}", ConfigWriter::quote(profile.source));
    if (profile.fallback) key += std::format(" fallback={}", ConfigWriter::quote(*profile.fallback));
    e.line(key);

    std::string algorithm = std::format("algorithm name={}", ConfigWriter::quote(profile.algorithm.name));
    if (profile.algorithm.seed) {
        algorithm += std::format(" seed={}", ConfigWriter::quote(*profile.algorithm.seed));
    }
    e.line(algorithm);

    if (!profile.transforms.empty()) {
        e.open("transforms-order");
        for (const auto& transform : profile.transforms) {
            std::string step = ConfigWriter::identifier(transform.name);
            append_params(step, transform.params);
            e.line(step);
        }
        e.close();
    }
}

void emit_listeners(Emitter& e, const Listeners& listeners) {
    for (const auto& listener : listeners.list_cfgs) {
        std::string line = ConfigWriter::quote(listener.address.to_string());
        if (listener.tls) {
            line += std::format(" cert-path={} key-path={} offer-h2={}",
                                ConfigWriter::quote(listener.tls->cert_path.string()),
                                ConfigWriter::quote(listener.tls->key_path.string()),
                                listener.offer_h2 ? "#true" : "#false");
        }
        e.line(line);
    }
}

void emit_connectors(Emitter& e, const Connectors& connectors) {
    if (connectors.load_balance) {
        const auto& lb = *connectors.load_balance;
        e.open("load-balance");
        e.line(std::format("selection {}", ConfigWriter::quote(selection_kind_to_string(lb.selection))));
        e.line(std::format("health-check {}", ConfigWriter::quote(health_check_kind_to_string(lb.health_check))));
        e.line(std::format("discovery {}", ConfigWriter::quote(discovery_kind_to_string(lb.discovery))));
        e.close();
    }
    for (const auto& upstream : connectors.upstreams) {
        std::string line = std::format("proxy {}", ConfigWriter::quote(upstream.address.to_string()));
        if (upstream.tls_sni) line += std::format(" tls-sni={}", ConfigWriter::quote(upstream.tls_sni->str()));
        line += std::format(" proto={}", ConfigWriter::quote(http_proto_to_string(upstream.proto)));
        e.line(line);
    }
}

void emit_service(Emitter& e, const ProxyConfig& service) {
    e.open("listeners");
    emit_listeners(e, service.listeners);
    e.close();
    e.open("connectors");
    emit_connectors(e, service.connectors);
    e.close();
}

} // anonymous namespace

std::string ConfigWriter::write(const Config& config) {
    Emitter e;
    if (!config.services.empty()) {
        e.open("services");
        for (const auto& service : config.services) {
            e.open(identifier(service.name));
            emit_service(e, service);
            e.close();
        }
        e.close();
    }
    if (!config.filter_chains.empty() || !config.key_profiles.empty()) {
        e.open("definitions");
        for (const auto& named : config.filter_chains) {
            e.open(std::format("filter-chain {}", quote(named.name)));
            emit_chain(e, named.chain);
            e.close();
        }
        for (const auto& named : config.key_profiles) {
            e.open(std::format("key-profile {}", quote(named.name)));
            emit_profile(e, named.profile);
            e.close();
        }
        e.close();
    }
    return e.take();
}

std::string ConfigWriter::write(const ProxyConfig& service) {
    Emitter e;
    emit_service(e, service);
    return e.take();
}

std::string ConfigWriter::write(const Listeners& listeners) {
    Emitter e;
    emit_listeners(e, listeners);
    return e.take();
}

std::string ConfigWriter::write(const Connectors& connectors) {
    Emitter e;
    emit_connectors(e, connectors);
    return e.take();
}

std::string ConfigWriter::write(const FilterChain& chain) {
    Emitter e;
    emit_chain(e, chain);
    return e.take();
}

std::string ConfigWriter::write(const KeyTemplateConfig& profile) {
    Emitter e;
    emit_profile(e, profile);
    return e.take();
}

std::string ConfigWriter::quote(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '"';
    for (const char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += std::format("\\u{{{:x}}}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

std::string ConfigWriter::identifier(std::string_view text) {
    if (text.empty() || text == "true" || text == "false" || text == "null"
        || text == "inf" || text == "nan") return quote(text);

    const auto alpha = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    };
    if (!alpha(text.front())) return quote(text);
    for (const char c : text) {
        if (!alpha(c) && !(c >= '0' && c <= '9') && c != '-' && c != '.') return quote(text);
    }
    return std::string(text);
}

} // namespace motya
