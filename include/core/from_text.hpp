#pragma once

#include <concepts>
#include <string>
#include <string_view>

namespace motya {

/**
 * @brief Customization point for building a value from its textual form
 *
 * Specialize for every scalar type that configuration values may be parsed
 * into. A specialization provides:
 *
 *   static constexpr std::string_view type_name;   // "FQDN", "SocketAddr", ...
 *   static bool parse(std::string_view text, T& out, std::string& reason);
 *
 * `reason` receives a short explanation when parse() returns false; it is
 * quoted verbatim in FORMAT_ERROR diagnostics.
 */
template<typename T>
struct FromText;

template<typename T>
concept TextParsable = std::default_initializable<T> &&
    requires(std::string_view text, T& out, std::string& reason) {
        { FromText<T>::type_name } -> std::convertible_to<std::string_view>;
        { FromText<T>::parse(text, out, reason) } -> std::same_as<bool>;
    };

} // namespace motya
