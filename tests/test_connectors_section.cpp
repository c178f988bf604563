#include <catch2/catch_test_macros.hpp>
#include "config/connectors_section.hpp"
#include "kdl_fixture.hpp"

using namespace motya;
using test::KdlFixture;

namespace {

Result<Connectors> parse_connectors(const std::string& body) {
    KdlFixture kdl("connectors {\n" + body + "\n}\n");
    return ConnectorsSection{}.parse(kdl.node());
}

} // namespace

TEST_CASE("ConnectorsSection: single plain upstream", "[config][connectors]") {
    auto connectors = parse_connectors(R"(proxy "127.0.0.1:8000")");
    INFO(connectors.diagnostic().help());
    REQUIRE(connectors.is_ok());

    const auto& cfg = connectors.value();
    CHECK_FALSE(cfg.load_balance.has_value());
    REQUIRE(cfg.upstreams.size() == 1);
    CHECK(cfg.upstreams[0].address.to_string() == "127.0.0.1:8000");
    CHECK_FALSE(cfg.upstreams[0].tls_sni.has_value());
    CHECK(cfg.upstreams[0].proto == HttpProto::H1_ONLY);
}

TEST_CASE("ConnectorsSection: load balancing and TLS upstreams", "[config][connectors]") {
    auto connectors = parse_connectors(R"(
    load-balance {
        selection "ketama"
        health-check "none"
        discovery "static"
    }
    proxy "10.0.0.5:443" tls-sni="example.com" proto="h2-or-h1"
    proxy "10.0.0.6:443" tls-sni="example.com" proto="h2-only"
)");
    INFO(connectors.diagnostic().help());
    REQUIRE(connectors.is_ok());

    const auto& cfg = connectors.value();
    REQUIRE(cfg.load_balance.has_value());
    CHECK(cfg.load_balance->selection == SelectionKind::KETAMA);
    CHECK(cfg.load_balance->health_check == HealthCheckKind::NONE);
    CHECK(cfg.load_balance->discovery == DiscoveryKind::STATIC);

    REQUIRE(cfg.upstreams.size() == 2);
    REQUIRE(cfg.upstreams[0].tls_sni.has_value());
    CHECK(cfg.upstreams[0].tls_sni->str() == "example.com");
    CHECK(cfg.upstreams[0].proto == HttpProto::H2_OR_H1);
    CHECK(cfg.upstreams[1].proto == HttpProto::H2_ONLY);
}

TEST_CASE("ConnectorsSection: load-balance settings default individually", "[config][connectors]") {
    auto connectors = parse_connectors(R"(
    load-balance {
        selection "random"
    }
    proxy "127.0.0.1:8000"
)");
    REQUIRE(connectors.is_ok());
    const auto& lb = *connectors.value().load_balance;
    CHECK(lb.selection == SelectionKind::RANDOM);
    CHECK(lb.health_check == HealthCheckKind::NONE);
    CHECK(lb.discovery == DiscoveryKind::STATIC);
}

TEST_CASE("ConnectorsSection: failures", "[config][connectors]") {
    SECTION("no upstreams") {
        auto connectors = parse_connectors(R"(load-balance { selection "random"; })");
        REQUIRE(connectors.is_error());
        CHECK(connectors.error_category() == ErrorCategory::MISSING_REQUIRED);
        CHECK(connectors.error_message() == "Missing required directive 'proxy'");
    }
    SECTION("unknown selection") {
        auto connectors = parse_connectors(R"(
    load-balance { selection "least-conn"; }
    proxy "127.0.0.1:8000"
)");
        REQUIRE(connectors.is_error());
        CHECK(connectors.error_category() == ErrorCategory::FORMAT_ERROR);
        CHECK(connectors.error_message().starts_with("Invalid SelectionKind 'least-conn'. Reason: "));
    }
    SECTION("unknown load-balance directive") {
        auto connectors = parse_connectors(R"(
    load-balance { weights "1"; }
    proxy "127.0.0.1:8000"
)");
        REQUIRE(connectors.is_error());
        CHECK(connectors.error_category() == ErrorCategory::UNKNOWN_DIRECTIVE);
        CHECK(connectors.error_message() == "Unknown directive: 'weights'");
    }
    SECTION("HTTP/2 without SNI") {
        auto connectors = parse_connectors(R"(proxy "127.0.0.1:8000" proto="h2-only")");
        REQUIRE(connectors.is_error());
        CHECK(connectors.error_category() == ErrorCategory::MUTUAL_EXCLUSION);
        CHECK(connectors.error_message() == "HTTP/2 upstreams require TLS, specify 'tls-sni'");
    }
    SECTION("bad upstream address") {
        auto connectors = parse_connectors(R"(proxy "upstream.local")");
        REQUIRE(connectors.is_error());
        CHECK(connectors.error_category() == ErrorCategory::FORMAT_ERROR);
        CHECK(connectors.error_message().starts_with("Invalid SocketAddr 'upstream.local'"));
    }
    SECTION("bad SNI") {
        auto connectors = parse_connectors(R"(proxy "127.0.0.1:443" tls-sni="bad host")");
        REQUIRE(connectors.is_error());
        CHECK(connectors.error_message().starts_with("Invalid FQDN 'bad host'"));
    }
    SECTION("unknown proxy key") {
        auto connectors = parse_connectors(R"(proxy "127.0.0.1:443" sni="a.b")");
        REQUIRE(connectors.is_error());
        CHECK(connectors.error_category() == ErrorCategory::UNKNOWN_KEY);
    }
    SECTION("proxy with two addresses") {
        auto connectors = parse_connectors(R"(proxy "127.0.0.1:1" "127.0.0.1:2")");
        REQUIRE(connectors.is_error());
        CHECK(connectors.error_category() == ErrorCategory::STRUCTURAL_ERROR);
    }
    SECTION("unknown connectors directive") {
        auto connectors = parse_connectors(R"(
    proxy "127.0.0.1:1"
    upstream "127.0.0.1:2"
)");
        REQUIRE(connectors.is_error());
        CHECK(connectors.error_message() == "Unknown directive: 'upstream'");
    }
}
