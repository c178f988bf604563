#include "config/config_types.hpp"
#include "core/utils.hpp"

#include <array>
#include <format>
#include <utility>

namespace motya {

namespace {

template<typename E, size_t N>
bool lookup(const std::array<std::pair<std::string_view, E>, N>& table,
            std::string_view text, E& out, std::string& reason) {
    for (const auto& [name, value] : table) {
        if (name == text) {
            out = value;
            return true;
        }
    }
    std::array<std::string_view, N> names{};
    for (size_t i = 0; i < N; ++i) names[i] = table[i].first;
    reason = std::format("expected one of {}", utils::quoted_list(names));
    return false;
}

template<typename E, size_t N>
const char* name_of(const std::array<std::pair<std::string_view, E>, N>& table, E value) {
    for (const auto& [name, v] : table) {
        if (v == value) return name.data();
    }
    return "unknown";
}

constexpr std::array<std::pair<std::string_view, SelectionKind>, 4> kSelections{{
    {"round-robin", SelectionKind::ROUND_ROBIN},
    {"random",      SelectionKind::RANDOM},
    {"fnv-hash",    SelectionKind::FNV_HASH},
    {"ketama",      SelectionKind::KETAMA},
}};

constexpr std::array<std::pair<std::string_view, HealthCheckKind>, 1> kHealthChecks{{
    {"none", HealthCheckKind::NONE},
}};

constexpr std::array<std::pair<std::string_view, DiscoveryKind>, 1> kDiscoveries{{
    {"static", DiscoveryKind::STATIC},
}};

constexpr std::array<std::pair<std::string_view, HttpProto>, 3> kProtos{{
    {"h1-only",  HttpProto::H1_ONLY},
    {"h2-only",  HttpProto::H2_ONLY},
    {"h2-or-h1", HttpProto::H2_OR_H1},
}};

} // anonymous namespace

const char* selection_kind_to_string(SelectionKind kind) { return name_of(kSelections, kind); }
const char* health_check_kind_to_string(HealthCheckKind kind) { return name_of(kHealthChecks, kind); }
const char* discovery_kind_to_string(DiscoveryKind kind) { return name_of(kDiscoveries, kind); }
const char* http_proto_to_string(HttpProto proto) { return name_of(kProtos, proto); }

bool FromText<SelectionKind>::parse(std::string_view text, SelectionKind& out, std::string& reason) {
    return lookup(kSelections, text, out, reason);
}

bool FromText<HealthCheckKind>::parse(std::string_view text, HealthCheckKind& out, std::string& reason) {
    return lookup(kHealthChecks, text, out, reason);
}

bool FromText<DiscoveryKind>::parse(std::string_view text, DiscoveryKind& out, std::string& reason) {
    return lookup(kDiscoveries, text, out, reason);
}

bool FromText<HttpProto>::parse(std::string_view text, HttpProto& out, std::string& reason) {
    return lookup(kProtos, text, out, reason);
}

} // namespace motya
