#include "parser/rules.hpp"
#include "parser/parse_context.hpp"
#include "core/fqdn.hpp"
#include "core/socket_address.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace motya {

namespace {

template<typename T>
bool name_parses_as(std::string_view name, std::string& reason) {
    T scratch{};
    return FromText<T>::parse(name, scratch, reason);
}

std::string_view predicate_type_name(NamePredicate predicate) {
    switch (predicate) {
        case NamePredicate::SOCKET_ADDR: return FromText<SocketAddress>::type_name;
        case NamePredicate::FQDN:        return FromText<Fqdn>::type_name;
    }
    return "name";
}

bool check_name(NamePredicate predicate, std::string_view name, std::string& reason) {
    switch (predicate) {
        case NamePredicate::SOCKET_ADDR: return name_parses_as<SocketAddress>(name, reason);
        case NamePredicate::FQDN:        return name_parses_as<Fqdn>(name, reason);
    }
    return false;
}

} // anonymous namespace

Result<void> ParseContext::validate(std::span<const Rule> rules) const {
    const Node* node = current_node();
    if (node == nullptr) return Result<void>::error(not_a_node());

    for (const auto& rule : rules) {
        switch (rule.kind) {
            case Rule::Kind::NO_CHILDREN:
                if (node->children) {
                    return Result<void>::error(error_with_span(
                        std::format("Directive '{}' does not accept a children block", node->name),
                        node->children_span));
                }
                break;

            case Rule::Kind::NO_POSITIONAL_ARGS:
                for (const auto& entry : node->entries) {
                    if (entry.is_positional()) {
                        return Result<void>::error(error_with_span(
                            std::format("Directive '{}' does not accept positional arguments, found {}",
                                        node->name, entry.value.describe()),
                            entry.span));
                    }
                }
                break;

            case Rule::Kind::ONLY_KEYS_TYPED:
                for (const auto& entry : node->entries) {
                    if (!entry.name) continue;
                    const auto it = std::find_if(rule.keys.begin(), rule.keys.end(),
                        [&](const Rule::KeyType& k) { return k.first == *entry.name; });
                    if (it == rule.keys.end()) {
                        std::vector<std::string_view> allowed;
                        allowed.reserve(rule.keys.size());
                        for (const auto& k : rule.keys) allowed.push_back(k.first);
                        return Result<void>::error(error_with_span(
                            std::format("Unknown configuration key: '{}'. Allowed keys are: {}",
                                        *entry.name, utils::quoted_list(allowed)),
                            entry.span, ErrorCategory::UNKNOWN_KEY));
                    }
                    if (entry.value.kind() != it->second) {
                        return Result<void>::error(error_with_span(
                            std::format("Property '{}' must be of type {}, found {}",
                                        *entry.name, value_kind_to_string(it->second),
                                        entry.value.describe()),
                            entry.span, ErrorCategory::TYPE_MISMATCH));
                    }
                }
                break;

            case Rule::Kind::NAME: {
                std::string reason;
                if (!check_name(rule.predicate, node->name, reason)) {
                    return Result<void>::error(error_with_span(
                        std::format("Invalid {} '{}'. Reason: {}",
                                    predicate_type_name(rule.predicate), node->name, reason),
                        node->name_span, ErrorCategory::FORMAT_ERROR));
                }
                break;
            }
        }
    }
    return Result<void>::ok();
}

} // namespace motya
