#include <catch2/catch_test_macros.hpp>
#include "config/config_json.hpp"
#include "config/config_loader.hpp"

using namespace motya;

TEST_CASE("ConfigJson: services, chains and profiles", "[config][json]") {
    auto cfg = ConfigLoader::load_from_string(R"(
services {
    Example1 {
        listeners {
            "127.0.0.1:8080"
            "0.0.0.0:4443" cert-path="./a.crt" key-path="./a.key"
        }
        connectors {
            load-balance { selection "random"; }
            proxy "10.0.0.1:443" tls-sni="api.example.com" proto="h2-or-h1"
        }
    }
}
definitions {
    filter-chain "auth" { filter name="com.example.logger" level="debug"; }
    key-profile "default" { key "${uri_path}"; }
}
)");
    REQUIRE(cfg.is_ok());

    const nlohmann::json j = cfg.value();

    const auto& service = j.at("services").at(0);
    CHECK(service.at("name") == "Example1");

    const auto& listeners = service.at("listeners");
    REQUIRE(listeners.size() == 2);
    CHECK(listeners.at(0).at("address") == "127.0.0.1:8080");
    CHECK(listeners.at(0).at("tls").is_null());
    CHECK(listeners.at(0).at("offer_h2") == false);
    CHECK(listeners.at(1).at("tls").at("cert_path") == "./a.crt");
    CHECK(listeners.at(1).at("offer_h2") == true);

    const auto& connectors = service.at("connectors");
    CHECK(connectors.at("load_balance").at("selection") == "random");
    CHECK(connectors.at("load_balance").at("discovery") == "static");
    CHECK(connectors.at("upstreams").at(0).at("tls_sni") == "api.example.com");
    CHECK(connectors.at("upstreams").at(0).at("proto") == "h2-or-h1");

    const auto& chain = j.at("filter_chains").at("auth");
    CHECK(chain.at("filters").at(0).at("name") == "com.example.logger");
    CHECK(chain.at("filters").at(0).at("args").at("level") == "debug");

    const auto& profile = j.at("key_profiles").at("default");
    CHECK(profile.at("source") == "${uri_path}");
    CHECK(profile.at("fallback").is_null());
    CHECK(profile.at("algorithm").at("name") == "xxhash64");
    CHECK(profile.at("algorithm").at("seed").is_null());
    CHECK(profile.at("transforms").empty());
}

TEST_CASE("ConfigJson: absent load balancing is null", "[config][json]") {
    Connectors connectors;
    const nlohmann::json j = connectors;
    CHECK(j.at("load_balance").is_null());
    CHECK(j.at("upstreams").empty());
}
