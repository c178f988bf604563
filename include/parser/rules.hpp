#pragma once

#include "document/document.hpp"

#include <string_view>
#include <utility>
#include <vector>

namespace motya {

/**
 * @brief Literal checks a node's own name can be required to pass
 *
 * Used where the name carries data, e.g. listeners named by address:
 *   listeners { "127.0.0.1:8080" ; "[::1]:443" cert-path="..." key-path="..." }
 */
enum class NamePredicate {
    SOCKET_ADDR,
    FQDN
};

/**
 * @brief One declarative structural constraint on the focused node
 *
 * Rules are plain data; ParseContext::validate() evaluates a list of them
 * in order and stops at the first violation.
 */
struct Rule {
    enum class Kind {
        NO_CHILDREN,
        NO_POSITIONAL_ARGS,
        ONLY_KEYS_TYPED,
        NAME
    };

    using KeyType = std::pair<std::string_view, ValueKind>;

    Kind kind;
    std::vector<KeyType> keys;                       // ONLY_KEYS_TYPED
    NamePredicate predicate = NamePredicate::FQDN;   // NAME

    static Rule no_children() { return Rule{Kind::NO_CHILDREN, {}, {}}; }
    static Rule no_positional_args() { return Rule{Kind::NO_POSITIONAL_ARGS, {}, {}}; }
    static Rule only_keys_typed(std::vector<KeyType> keys) {
        return Rule{Kind::ONLY_KEYS_TYPED, std::move(keys), {}};
    }
    static Rule name(NamePredicate predicate) { return Rule{Kind::NAME, {}, predicate}; }
};

} // namespace motya
