#include <catch2/catch_test_macros.hpp>
#include "config/connectors_section.hpp"
#include "config/listeners_section.hpp"
#include "config/service_section.hpp"
#include "kdl_fixture.hpp"

using namespace motya;
using test::KdlFixture;

namespace {

// Returns a fixed value and counts how often it was asked to parse
template<typename T>
class FixedSectionParser : public ISectionParser<T> {
public:
    explicit FixedSectionParser(T value) : value_(std::move(value)) {}

    [[nodiscard]] Result<T> parse(const ParseContext&) const override {
        ++calls;
        return Result<T>::ok(value_);
    }

    mutable int calls = 0;

private:
    T value_;
};

const char* kService = R"(
Example1 {
    listeners {
        "127.0.0.1:8080"
        "0.0.0.0:4443" cert-path="./a.crt" key-path="./a.key" offer-h2=#false
    }
    connectors {
        proxy "127.0.0.1:8000"
    }
}
)";

} // namespace

TEST_CASE("ServiceSection: composes listeners and connectors", "[config][service]") {
    KdlFixture kdl(kService);
    const ListenersSection listeners;
    const ConnectorsSection connectors;
    const ServiceSection service(listeners, connectors, "Example1");

    auto cfg = service.parse(kdl.node());
    INFO(cfg.diagnostic().help());
    REQUIRE(cfg.is_ok());
    CHECK(cfg.value().name == "Example1");
    REQUIRE(cfg.value().listeners.list_cfgs.size() == 2);
    CHECK(cfg.value().listeners.list_cfgs[1].tls.has_value());
    CHECK_FALSE(cfg.value().listeners.list_cfgs[1].offer_h2);
    REQUIRE(cfg.value().connectors.upstreams.size() == 1);
}

TEST_CASE("ServiceSection: sub-parsers are injected", "[config][service]") {
    KdlFixture kdl("svc {\n    listeners { anything; }\n    connectors { whatever; }\n}\n");

    Listeners fixed_listeners;
    fixed_listeners.list_cfgs.emplace_back();
    const FixedSectionParser<Listeners> listeners(fixed_listeners);
    const FixedSectionParser<Connectors> connectors(Connectors{});
    const ServiceSection service(listeners, connectors, "svc");

    auto cfg = service.parse(kdl.node());
    REQUIRE(cfg.is_ok());
    CHECK(cfg.value().listeners == fixed_listeners);
    CHECK(listeners.calls == 1);
    CHECK(connectors.calls == 1);
}

TEST_CASE("ServiceSection: failures", "[config][service]") {
    const ListenersSection listeners;
    const ConnectorsSection connectors;
    const ServiceSection service(listeners, connectors, "svc");

    SECTION("missing connectors") {
        KdlFixture kdl("svc {\n    listeners { \"127.0.0.1:80\"; }\n}\n");
        auto cfg = service.parse(kdl.node());
        REQUIRE(cfg.is_error());
        CHECK(cfg.error_category() == ErrorCategory::MISSING_REQUIRED);
        CHECK(cfg.error_message() == "Missing required directive 'connectors'");
    }
    SECTION("unknown directive") {
        KdlFixture kdl(R"(svc {
    listeners { "127.0.0.1:80"; }
    connectors { proxy "127.0.0.1:81"; }
    rate-limit 10
})");
        auto cfg = service.parse(kdl.node());
        REQUIRE(cfg.is_error());
        CHECK(cfg.error_category() == ErrorCategory::UNKNOWN_DIRECTIVE);
        CHECK(cfg.error_message() == "Unknown directive: 'rate-limit'");
    }
    SECTION("first sub-section failure wins") {
        KdlFixture kdl(R"(svc {
    listeners { "127.0.0.1:80" cert-path="a"; }
    connectors { }
})");
        auto cfg = service.parse(kdl.node());
        REQUIRE(cfg.is_error());
        CHECK(cfg.error_category() == ErrorCategory::MUTUAL_EXCLUSION);
    }
    SECTION("service without a block") {
        KdlFixture kdl("svc\n");
        auto cfg = service.parse(kdl.node());
        REQUIRE(cfg.is_error());
        CHECK(cfg.error_category() == ErrorCategory::STRUCTURAL_ERROR);
    }
}
