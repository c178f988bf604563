#include "config/config_loader.hpp"
#include "config/chain_parser.hpp"
#include "config/connectors_section.hpp"
#include "config/key_profile_parser.hpp"
#include "config/listeners_section.hpp"
#include "config/service_section.hpp"
#include "core/utils.hpp"
#include "document/document_reader.hpp"
#include "parser/block_parser.hpp"
#include "parser/typed_value.hpp"

#include <format>
#include <iterator>
#include <unordered_set>

namespace motya {

namespace {

template<typename T>
void append(std::vector<T>& into, std::vector<T>&& from) {
    into.insert(into.end(),
                std::make_move_iterator(from.begin()),
                std::make_move_iterator(from.end()));
}

} // anonymous namespace

// ============================================================================
// Entry points
// ============================================================================

Result<Config> ConfigLoader::load_from_file(const std::filesystem::path& config_path) {
    FileConfigSource source;
    return load_from_source(source, config_path);
}

Result<Config> ConfigLoader::load_from_source(IConfigSource& source,
                                              const std::filesystem::path& entry) {
    auto docs = source.collect(entry);
    if (!docs.is_ok()) {
        utils::log::error(std::format("Failed to collect config: {}", docs.error_message()));
        return Result<Config>::error(docs.diagnostic());
    }
    return parse_documents(docs.value());
}

Result<Config> ConfigLoader::load_from_string(std::string kdl_content,
                                              std::string_view source_name) {
    auto doc = DocumentReader::read(std::move(kdl_content), source_name);
    if (!doc.is_ok()) return Result<Config>::error(doc.diagnostic());

    std::vector<SourceDocument> docs;
    docs.push_back(SourceDocument{std::move(doc.value()), std::string(source_name)});
    return parse_documents(docs);
}

Result<Config> ConfigLoader::parse_documents(const std::vector<SourceDocument>& docs) {
    Config merged;
    for (const auto& source : docs) {
        const ParseContext root(source.document, source.source_name);
        auto parsed = parse_root(root);
        if (!parsed.is_ok()) return parsed;

        append(merged.services, std::move(parsed.value().services));
        append(merged.filter_chains, std::move(parsed.value().filter_chains));
        append(merged.key_profiles, std::move(parsed.value().key_profiles));
    }

    utils::log::info(std::format(
        "Config loaded: {} service(s), {} filter chain(s), {} key profile(s)",
        merged.services.size(), merged.filter_chains.size(), merged.key_profiles.size()));
    return Result<Config>::ok(std::move(merged));
}

Result<Config> ConfigLoader::parse_root(const ParseContext& root) {
    auto block = BlockParser::create(root);
    if (!block.is_ok()) return Result<Config>::error(block.diagnostic());
    auto& b = block.value();

    auto services = b.repeated("services", extract_services);
    if (!services.is_ok()) return Result<Config>::error(services.diagnostic());

    auto definitions = b.repeated("definitions", extract_definitions);
    if (!definitions.is_ok()) return Result<Config>::error(definitions.diagnostic());

    const auto done = b.exhaust();
    if (!done.is_ok()) return Result<Config>::error(done.diagnostic());

    Config cfg;
    for (auto& list : services.value()) {
        append(cfg.services, std::move(list));
    }
    for (auto& defs : definitions.value()) {
        append(cfg.filter_chains, std::move(defs.filter_chains));
        append(cfg.key_profiles, std::move(defs.key_profiles));
    }
    return Result<Config>::ok(std::move(cfg));
}

// ============================================================================
// Sections
// ============================================================================

Result<std::vector<ProxyConfig>> ConfigLoader::extract_services(const ParseContext& ctx) {
    static const Rule rules[] = {Rule::no_positional_args(), Rule::only_keys_typed({})};
    const auto valid = ctx.validate(rules);
    if (!valid.is_ok()) return Result<std::vector<ProxyConfig>>::error(valid.diagnostic());

    auto nodes = ctx.nodes();
    if (!nodes.is_ok()) return Result<std::vector<ProxyConfig>>::error(nodes.diagnostic());

    const ListenersSection listeners;
    const ConnectorsSection connectors;

    std::vector<ProxyConfig> out;
    std::unordered_set<std::string> seen;
    for (const auto& service_ctx : nodes.value()) {
        const Node& node = *service_ctx.current_node();
        if (!seen.insert(node.name).second) {
            return Result<std::vector<ProxyConfig>>::error(service_ctx.error_with_span(
                std::format("Duplicate service definition '{}'", node.name),
                node.name_span, ErrorCategory::DUPLICATE_DEFINITION));
        }

        const auto header = service_ctx.validate(rules);
        if (!header.is_ok()) return Result<std::vector<ProxyConfig>>::error(header.diagnostic());

        const ServiceSection service(listeners, connectors, node.name);
        auto parsed = service.parse(service_ctx);
        if (!parsed.is_ok()) return Result<std::vector<ProxyConfig>>::error(parsed.diagnostic());
        out.push_back(std::move(parsed.value()));
    }
    return Result<std::vector<ProxyConfig>>::ok(std::move(out));
}

Result<ConfigLoader::Definitions> ConfigLoader::extract_definitions(const ParseContext& ctx) {
    static const Rule rules[] = {Rule::no_positional_args(), Rule::only_keys_typed({})};
    const auto valid = ctx.validate(rules);
    if (!valid.is_ok()) return Result<Definitions>::error(valid.diagnostic());

    auto block = BlockParser::create(ctx);
    if (!block.is_ok()) return Result<Definitions>::error(block.diagnostic());
    auto& b = block.value();

    const ChainParser chain_parser;
    const KeyProfileParser key_parser;
    std::unordered_set<std::string> chain_names;
    std::unordered_set<std::string> profile_names;

    auto duplicate = [](const ParseContext& c, std::string_view kind, const std::string& name) {
        return c.error_with_span(
            std::format("Duplicate {} definition '{}'", kind, name),
            c.current_node()->name_span, ErrorCategory::DUPLICATE_DEFINITION);
    };

    auto chains = b.repeated("filter-chain", [&](const ParseContext& c) -> Result<NamedFilterChain> {
        auto name = definition_name(c);
        if (!name.is_ok()) return Result<NamedFilterChain>::error(name.diagnostic());
        if (!chain_names.insert(name.value()).second) {
            return Result<NamedFilterChain>::error(duplicate(c, "filter-chain", name.value()));
        }
        auto chain = chain_parser.parse(c);
        if (!chain.is_ok()) return Result<NamedFilterChain>::error(chain.diagnostic());
        return Result<NamedFilterChain>::ok(
            NamedFilterChain{std::move(name.value()), std::move(chain.value())});
    });
    if (!chains.is_ok()) return Result<Definitions>::error(chains.diagnostic());

    auto profiles = b.repeated("key-profile", [&](const ParseContext& c) -> Result<NamedKeyProfile> {
        auto name = definition_name(c);
        if (!name.is_ok()) return Result<NamedKeyProfile>::error(name.diagnostic());
        if (!profile_names.insert(name.value()).second) {
            return Result<NamedKeyProfile>::error(duplicate(c, "key-profile", name.value()));
        }
        auto profile = key_parser.parse(c);
        if (!profile.is_ok()) return Result<NamedKeyProfile>::error(profile.diagnostic());
        return Result<NamedKeyProfile>::ok(
            NamedKeyProfile{std::move(name.value()), std::move(profile.value())});
    });
    if (!profiles.is_ok()) return Result<Definitions>::error(profiles.diagnostic());

    const auto done = b.exhaust();
    if (!done.is_ok()) return Result<Definitions>::error(done.diagnostic());

    return Result<Definitions>::ok(
        Definitions{std::move(chains.value()), std::move(profiles.value())});
}

Result<std::string> ConfigLoader::definition_name(const ParseContext& ctx) {
    static const Rule rules[] = {Rule::only_keys_typed({})};
    const auto valid = ctx.validate(rules);
    if (!valid.is_ok()) return Result<std::string>::error(valid.diagnostic());

    auto name = ctx.single_arg();
    if (!name.is_ok()) return Result<std::string>::error(name.diagnostic());
    return name.value().as_str();
}

} // namespace motya
