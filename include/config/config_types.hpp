#pragma once

#include "core/from_text.hpp"
#include "core/fqdn.hpp"
#include "core/socket_address.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace motya {

using ParamMap = std::map<std::string, std::string>;

// ============================================================================
// Filter chains
// ============================================================================

struct ConfiguredFilter {
    Fqdn name;
    ParamMap args;

    bool operator==(const ConfiguredFilter&) const = default;
};

struct FilterChain {
    std::vector<ConfiguredFilter> filters;

    bool operator==(const FilterChain&) const = default;
};

// ============================================================================
// Cache-key profiles
// ============================================================================

inline constexpr std::string_view kDefaultHashAlgorithm = "xxhash64";

struct HashAlgorithm {
    std::string name = std::string(kDefaultHashAlgorithm);
    std::optional<std::string> seed;

    bool operator==(const HashAlgorithm&) const = default;
};

struct Transform {
    std::string name;
    ParamMap params;

    bool operator==(const Transform&) const = default;
};

struct KeyTemplateConfig {
    std::string source;
    std::optional<std::string> fallback;
    HashAlgorithm algorithm;
    std::vector<Transform> transforms;

    bool operator==(const KeyTemplateConfig&) const = default;
};

// ============================================================================
// Listeners
// ============================================================================

struct TlsConfig {
    std::filesystem::path cert_path;
    std::filesystem::path key_path;

    bool operator==(const TlsConfig&) const = default;
};

enum class ListenerKind {
    TCP
};

struct ListenerConfig {
    ListenerKind kind = ListenerKind::TCP;
    SocketAddress address;
    std::optional<TlsConfig> tls;
    bool offer_h2 = false;

    bool operator==(const ListenerConfig&) const = default;
};

struct Listeners {
    std::vector<ListenerConfig> list_cfgs;

    bool operator==(const Listeners&) const = default;
};

// ============================================================================
// Connectors
// ============================================================================

enum class SelectionKind {
    ROUND_ROBIN,
    RANDOM,
    FNV_HASH,
    KETAMA
};

enum class HealthCheckKind {
    NONE
};

enum class DiscoveryKind {
    STATIC
};

enum class HttpProto {
    H1_ONLY,
    H2_ONLY,
    H2_OR_H1
};

[[nodiscard]] const char* selection_kind_to_string(SelectionKind kind);
[[nodiscard]] const char* health_check_kind_to_string(HealthCheckKind kind);
[[nodiscard]] const char* discovery_kind_to_string(DiscoveryKind kind);
[[nodiscard]] const char* http_proto_to_string(HttpProto proto);

struct LoadBalanceConfig {
    SelectionKind selection = SelectionKind::ROUND_ROBIN;
    HealthCheckKind health_check = HealthCheckKind::NONE;
    DiscoveryKind discovery = DiscoveryKind::STATIC;

    bool operator==(const LoadBalanceConfig&) const = default;
};

struct UpstreamConfig {
    SocketAddress address;
    std::optional<Fqdn> tls_sni;
    HttpProto proto = HttpProto::H1_ONLY;

    bool operator==(const UpstreamConfig&) const = default;
};

struct Connectors {
    std::optional<LoadBalanceConfig> load_balance;
    std::vector<UpstreamConfig> upstreams;

    bool operator==(const Connectors&) const = default;
};

// ============================================================================
// Services and the complete configuration
// ============================================================================

struct ProxyConfig {
    std::string name;
    Listeners listeners;
    Connectors connectors;

    bool operator==(const ProxyConfig&) const = default;
};

struct NamedFilterChain {
    std::string name;
    FilterChain chain;

    bool operator==(const NamedFilterChain&) const = default;
};

struct NamedKeyProfile {
    std::string name;
    KeyTemplateConfig profile;

    bool operator==(const NamedKeyProfile&) const = default;
};

struct Config {
    std::vector<ProxyConfig> services;
    std::vector<NamedFilterChain> filter_chains;
    std::vector<NamedKeyProfile> key_profiles;

    bool operator==(const Config&) const = default;
};

// ============================================================================
// Text parsing for the enumerations above
// ============================================================================

template<>
struct FromText<SelectionKind> {
    static constexpr std::string_view type_name = "SelectionKind";
    static bool parse(std::string_view text, SelectionKind& out, std::string& reason);
};

template<>
struct FromText<HealthCheckKind> {
    static constexpr std::string_view type_name = "HealthCheck";
    static bool parse(std::string_view text, HealthCheckKind& out, std::string& reason);
};

template<>
struct FromText<DiscoveryKind> {
    static constexpr std::string_view type_name = "Discovery";
    static bool parse(std::string_view text, DiscoveryKind& out, std::string& reason);
};

template<>
struct FromText<HttpProto> {
    static constexpr std::string_view type_name = "HttpProto";
    static bool parse(std::string_view text, HttpProto& out, std::string& reason);
};

} // namespace motya
