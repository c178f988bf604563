#include <catch2/catch_test_macros.hpp>
#include "config/chain_parser.hpp"
#include "config/config_loader.hpp"
#include "config/config_writer.hpp"
#include "config/connectors_section.hpp"
#include "config/key_profile_parser.hpp"
#include "config/listeners_section.hpp"
#include "kdl_fixture.hpp"

using namespace motya;
using test::KdlFixture;

namespace {

// Parse `text` at the document root with a section parser
template<typename Parser>
auto reparse(const std::string& text) {
    KdlFixture kdl(text);
    auto parsed = Parser{}.parse(kdl.root());
    INFO(text);
    INFO(parsed.diagnostic().help());
    REQUIRE(parsed.is_ok());
    return parsed.value();
}

} // namespace

TEST_CASE("ConfigWriter: quote escapes", "[config][writer]") {
    CHECK(ConfigWriter::quote("plain") == "\"plain\"");
    CHECK(ConfigWriter::quote("a\"b\\c") == R"("a\"b\\c")");
    CHECK(ConfigWriter::quote("line\nnext\ttab") == R"("line\nnext\ttab")");
    CHECK(ConfigWriter::quote(std::string(1, '\x01')) == R"("\u{1}")");
}

TEST_CASE("ConfigWriter: identifier stays bare only when safe", "[config][writer]") {
    CHECK(ConfigWriter::identifier("Example1") == "Example1");
    CHECK(ConfigWriter::identifier("remove-query-params") == "remove-query-params");
    CHECK(ConfigWriter::identifier("1st") == "\"1st\"");
    CHECK(ConfigWriter::identifier("with space") == "\"with space\"");
    CHECK(ConfigWriter::identifier("true") == "\"true\"");
    CHECK(ConfigWriter::identifier("") == "\"\"");
}

TEST_CASE("ConfigWriter: filter chain round-trips", "[config][writer]") {
    const auto original = reparse<ChainParser>(R"(
filter name="com.example.auth"
filter name="com.example.logger" level="debug" format="json" note="say \"hi\""
)");
    const auto text = ConfigWriter::write(original);
    CHECK(reparse<ChainParser>(text) == original);
}

TEST_CASE("ConfigWriter: key profile round-trips", "[config][writer]") {
    SECTION("minimal") {
        const auto original = reparse<KeyProfileParser>(R"(key "${uri_path}")");
        CHECK(reparse<KeyProfileParser>(ConfigWriter::write(original)) == original);
    }
    SECTION("full") {
        const auto original = reparse<KeyProfileParser>(R"(
key "${cookie_session}" fallback="${client_ip}:${user_agent}"
algorithm name="xxhash32" seed="idk"
transforms-order {
    remove-query-params
    "odd name" x="1"
    truncate length="256"
}
)");
        const auto text = ConfigWriter::write(original);
        CHECK(reparse<KeyProfileParser>(text) == original);
    }
}

TEST_CASE("ConfigWriter: listeners round-trip", "[config][writer]") {
    const auto original = reparse<ListenersSection>(R"(
"127.0.0.1:8080"
"0.0.0.0:4443" cert-path="./a.crt" key-path="./a.key"
"[::1]:8443" cert-path="c" key-path="k" offer-h2=#false
)");
    CHECK(reparse<ListenersSection>(ConfigWriter::write(original)) == original);
}

TEST_CASE("ConfigWriter: connectors round-trip", "[config][writer]") {
    const auto original = reparse<ConnectorsSection>(R"(
load-balance { selection "ketama"; }
proxy "127.0.0.1:8000"
proxy "10.0.0.5:443" tls-sni="example.com" proto="h2-or-h1"
)");
    CHECK(reparse<ConnectorsSection>(ConfigWriter::write(original)) == original);
}

TEST_CASE("ConfigWriter: full config round-trips", "[config][writer]") {
    auto original = ConfigLoader::load_from_string(R"(
services {
    Example1 {
        listeners { "127.0.0.1:8080"; "0.0.0.0:4443" cert-path="a" key-path="b"; }
        connectors { proxy "127.0.0.1:8000"; }
    }
    "odd service" {
        listeners { "[::1]:1"; }
        connectors { proxy "127.0.0.1:2" tls-sni="x.y" proto="h2-only"; }
    }
}
definitions {
    filter-chain "auth" { filter name="com.example.auth" mode="strict"; }
    filter-chain "empty" { }
    key-profile "default" { key "${uri_path}"; }
}
)");
    REQUIRE(original.is_ok());

    const auto text = ConfigWriter::write(original.value());
    auto again = ConfigLoader::load_from_string(text, "rendered.kdl");
    INFO(text);
    INFO(again.diagnostic().help());
    REQUIRE(again.is_ok());
    CHECK(again.value() == original.value());
}

TEST_CASE("ConfigWriter: empty config renders nothing", "[config][writer]") {
    CHECK(ConfigWriter::write(Config{}).empty());
}
