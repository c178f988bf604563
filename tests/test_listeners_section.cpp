#include <catch2/catch_test_macros.hpp>
#include "config/listeners_section.hpp"
#include "kdl_fixture.hpp"

using namespace motya;
using test::KdlFixture;

namespace {

Result<Listeners> parse_listeners(const std::string& body) {
    KdlFixture kdl("listeners {\n" + body + "\n}\n");
    return ListenersSection{}.parse(kdl.node());
}

} // namespace

TEST_CASE("ListenersSection: plain TCP listener", "[config][listeners]") {
    auto listeners = parse_listeners(R"("127.0.0.1:8080")");
    INFO(listeners.diagnostic().help());
    REQUIRE(listeners.is_ok());
    REQUIRE(listeners.value().list_cfgs.size() == 1);

    const auto& l = listeners.value().list_cfgs[0];
    CHECK(l.kind == ListenerKind::TCP);
    CHECK(l.address.to_string() == "127.0.0.1:8080");
    CHECK_FALSE(l.tls.has_value());
    CHECK_FALSE(l.offer_h2);
}

TEST_CASE("ListenersSection: TLS defaults offer-h2 to true", "[config][listeners]") {
    auto listeners = parse_listeners(R"("0.0.0.0:4443" cert-path="./a.crt" key-path="./a.key")");
    REQUIRE(listeners.is_ok());
    const auto& l = listeners.value().list_cfgs[0];
    REQUIRE(l.tls.has_value());
    CHECK(l.tls->cert_path == "./a.crt");
    CHECK(l.tls->key_path == "./a.key");
    CHECK(l.offer_h2);
}

TEST_CASE("ListenersSection: TLS with offer-h2 disabled", "[config][listeners]") {
    auto listeners = parse_listeners(
        R"("0.0.0.0:4443" cert-path="./a.crt" key-path="./a.key" offer-h2=#false)");
    REQUIRE(listeners.is_ok());
    const auto& l = listeners.value().list_cfgs[0];
    REQUIRE(l.tls.has_value());
    CHECK_FALSE(l.offer_h2);
}

TEST_CASE("ListenersSection: cert and key must come together", "[config][listeners]") {
    SECTION("cert only") {
        auto listeners = parse_listeners(R"("0.0.0.0:4443" cert-path="./a.crt")");
        REQUIRE(listeners.is_error());
        CHECK(listeners.error_category() == ErrorCategory::MUTUAL_EXCLUSION);
        CHECK(listeners.error_message() ==
              "'cert-path' and 'key-path' must either BOTH be present, or NEITHER should be present");
    }
    SECTION("key only") {
        auto listeners = parse_listeners(R"("0.0.0.0:4443" key-path="./a.key")");
        REQUIRE(listeners.is_error());
        CHECK(listeners.error_category() == ErrorCategory::MUTUAL_EXCLUSION);
    }
}

TEST_CASE("ListenersSection: offer-h2 needs TLS", "[config][listeners]") {
    auto listeners = parse_listeners(R"("0.0.0.0:8080" offer-h2=#true)");
    REQUIRE(listeners.is_error());
    CHECK(listeners.error_category() == ErrorCategory::MUTUAL_EXCLUSION);
    CHECK(listeners.error_message() == "'offer-h2' requires TLS, specify 'cert-path' and 'key-path'");
}

TEST_CASE("ListenersSection: resolve_tcp_listener state table", "[config][listeners]") {
    KdlFixture kdl("\"127.0.0.1:1\"\n");
    const auto ctx = kdl.node();
    SocketAddress addr;
    std::string reason;
    REQUIRE(SocketAddress::parse("127.0.0.1:1", addr, reason));

    auto plain = ListenersSection::resolve_tcp_listener(ctx, addr, std::nullopt, std::nullopt, std::nullopt);
    REQUIRE(plain.is_ok());
    CHECK_FALSE(plain.value().tls.has_value());
    CHECK_FALSE(plain.value().offer_h2);

    auto tls = ListenersSection::resolve_tcp_listener(ctx, addr, "c", "k", std::nullopt);
    REQUIRE(tls.is_ok());
    CHECK(tls.value().offer_h2);

    auto tls_h1 = ListenersSection::resolve_tcp_listener(ctx, addr, "c", "k", false);
    REQUIRE(tls_h1.is_ok());
    CHECK_FALSE(tls_h1.value().offer_h2);

    CHECK(ListenersSection::resolve_tcp_listener(ctx, addr, "c", std::nullopt, std::nullopt)
              .error_category() == ErrorCategory::MUTUAL_EXCLUSION);
    CHECK(ListenersSection::resolve_tcp_listener(ctx, addr, std::nullopt, "k", std::nullopt)
              .error_category() == ErrorCategory::MUTUAL_EXCLUSION);
    CHECK(ListenersSection::resolve_tcp_listener(ctx, addr, std::nullopt, std::nullopt, true)
              .error_category() == ErrorCategory::MUTUAL_EXCLUSION);
}

TEST_CASE("ListenersSection: multiple listeners keep order", "[config][listeners]") {
    auto listeners = parse_listeners(R"(
    "127.0.0.1:8080"
    "[::1]:8443" cert-path="c" key-path="k"
)");
    REQUIRE(listeners.is_ok());
    REQUIRE(listeners.value().list_cfgs.size() == 2);
    CHECK(listeners.value().list_cfgs[0].address.port() == 8080);
    CHECK(listeners.value().list_cfgs[1].address.to_string() == "[::1]:8443");
}

TEST_CASE("ListenersSection: schema failures", "[config][listeners]") {
    SECTION("empty block") {
        auto listeners = parse_listeners("");
        REQUIRE(listeners.is_error());
        CHECK(listeners.error_category() == ErrorCategory::STRUCTURAL_ERROR);
        CHECK(listeners.error_message() == "Block 'listeners' cannot be empty");
    }
    SECTION("bad address") {
        auto listeners = parse_listeners(R"("localhost:80")");
        REQUIRE(listeners.is_error());
        CHECK(listeners.error_category() == ErrorCategory::FORMAT_ERROR);
        CHECK(listeners.error_message() ==
              "Invalid SocketAddr 'localhost:80'. Reason: invalid socket address syntax");
    }
    SECTION("unknown key") {
        auto listeners = parse_listeners(R"("127.0.0.1:80" cert="x")");
        REQUIRE(listeners.is_error());
        CHECK(listeners.error_category() == ErrorCategory::UNKNOWN_KEY);
    }
    SECTION("wrong type") {
        auto listeners = parse_listeners(R"("127.0.0.1:80" offer-h2="yes")");
        REQUIRE(listeners.is_error());
        CHECK(listeners.error_category() == ErrorCategory::TYPE_MISMATCH);
    }
    SECTION("positional argument") {
        auto listeners = parse_listeners(R"("127.0.0.1:80" "extra")");
        REQUIRE(listeners.is_error());
        CHECK(listeners.error_category() == ErrorCategory::STRUCTURAL_ERROR);
    }
    SECTION("wrong section name") {
        KdlFixture kdl("listener { \"127.0.0.1:80\"; }\n");
        auto listeners = ListenersSection{}.parse(kdl.node());
        REQUIRE(listeners.is_error());
        CHECK(listeners.error_message() == "Expected 'listeners', found 'listener'");
    }
}
