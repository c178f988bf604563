#pragma once

#include "core/from_text.hpp"

#include <string>
#include <string_view>

namespace motya {

/**
 * @brief Fully-qualified dotted identifier, e.g. "com.example.auth"
 *
 * Labels are 1-63 characters of [A-Za-z0-9-], not starting or ending with
 * '-'. The whole name is at most 253 characters; one trailing '.' is allowed
 * and preserved.
 */
class Fqdn {
public:
    Fqdn() = default;

    static bool parse(std::string_view text, Fqdn& out, std::string& reason);

    [[nodiscard]] const std::string& str() const { return name_; }

    bool operator==(const Fqdn&) const = default;

private:
    std::string name_;
};

template<>
struct FromText<Fqdn> {
    static constexpr std::string_view type_name = "FQDN";

    static bool parse(std::string_view text, Fqdn& out, std::string& reason) {
        return Fqdn::parse(text, out, reason);
    }
};

} // namespace motya
