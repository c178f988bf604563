#pragma once

#include "config/config_types.hpp"

#include <nlohmann/json.hpp>

namespace motya {

// nlohmann_json serializers, found by ADL: nlohmann::json j = config;

void to_json(nlohmann::json& j, const ConfiguredFilter& filter);
void to_json(nlohmann::json& j, const FilterChain& chain);
void to_json(nlohmann::json& j, const HashAlgorithm& algorithm);
void to_json(nlohmann::json& j, const Transform& transform);
void to_json(nlohmann::json& j, const KeyTemplateConfig& profile);
void to_json(nlohmann::json& j, const ListenerConfig& listener);
void to_json(nlohmann::json& j, const Listeners& listeners);
void to_json(nlohmann::json& j, const LoadBalanceConfig& lb);
void to_json(nlohmann::json& j, const UpstreamConfig& upstream);
void to_json(nlohmann::json& j, const Connectors& connectors);
void to_json(nlohmann::json& j, const ProxyConfig& service);
void to_json(nlohmann::json& j, const Config& config);

} // namespace motya
