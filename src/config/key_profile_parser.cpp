#include "config/key_profile_parser.hpp"
#include "parser/block_parser.hpp"
#include "parser/typed_value.hpp"

#include <array>

namespace motya {

Result<KeyTemplateConfig> KeyProfileParser::parse(const ParseContext& ctx) const {
    auto block = BlockParser::create(ctx);
    if (!block.is_ok()) return Result<KeyTemplateConfig>::error(block.diagnostic());
    auto& b = block.value();

    auto key = b.required("key", extract_key);
    if (!key.is_ok()) return Result<KeyTemplateConfig>::error(key.diagnostic());

    auto algorithm = b.optional("algorithm", extract_algorithm);
    if (!algorithm.is_ok()) return Result<KeyTemplateConfig>::error(algorithm.diagnostic());

    auto transforms = b.optional("transforms-order", extract_transforms);
    if (!transforms.is_ok()) return Result<KeyTemplateConfig>::error(transforms.diagnostic());

    const auto done = b.exhaust();
    if (!done.is_ok()) return Result<KeyTemplateConfig>::error(done.diagnostic());

    KeyTemplateConfig cfg;
    cfg.source = std::move(key.value().source);
    cfg.fallback = std::move(key.value().fallback);
    cfg.algorithm = algorithm.value().value_or(HashAlgorithm{});
    cfg.transforms = std::move(transforms.value()).value_or(std::vector<Transform>{});
    return Result<KeyTemplateConfig>::ok(std::move(cfg));
}

Result<KeyProfileParser::KeySource> KeyProfileParser::extract_key(const ParseContext& ctx) {
    static const Rule rules[] = {Rule::no_children()};
    const auto valid = ctx.validate(rules);
    if (!valid.is_ok()) return Result<KeySource>::error(valid.diagnostic());

    auto first = ctx.single_arg();
    if (!first.is_ok()) return Result<KeySource>::error(first.diagnostic());
    auto source = first.value().as_str();
    if (!source.is_ok()) return Result<KeySource>::error(source.diagnostic());

    static constexpr std::array<std::string_view, 1> kAllowed{"fallback"};
    auto opts = ctx.args_map_with_only_keys(ArgRange::all(), kAllowed);
    if (!opts.is_ok()) return Result<KeySource>::error(opts.diagnostic());

    KeySource out;
    out.source = std::move(source.value());
    if (const auto it = opts.value().find("fallback"); it != opts.value().end()) {
        out.fallback = it->second;
    }
    return Result<KeySource>::ok(std::move(out));
}

Result<HashAlgorithm> KeyProfileParser::extract_algorithm(const ParseContext& ctx) {
    static const Rule rules[] = {Rule::no_children(), Rule::no_positional_args()};
    const auto valid = ctx.validate(rules);
    if (!valid.is_ok()) return Result<HashAlgorithm>::error(valid.diagnostic());

    static constexpr std::array<std::string_view, 2> kAllowed{"name", "seed"};
    auto opts = ctx.args_map_with_only_keys(ArgRange::all(), kAllowed);
    if (!opts.is_ok()) return Result<HashAlgorithm>::error(opts.diagnostic());

    HashAlgorithm algo;
    const auto& map = opts.value();
    if (const auto it = map.find("name"); it != map.end()) algo.name = it->second;
    if (const auto it = map.find("seed"); it != map.end()) algo.seed = it->second;
    return Result<HashAlgorithm>::ok(std::move(algo));
}

Result<std::vector<Transform>> KeyProfileParser::extract_transforms(const ParseContext& ctx) {
    auto steps = ctx.nodes();
    if (!steps.is_ok()) return Result<std::vector<Transform>>::error(steps.diagnostic());

    static const Rule step_rules[] = {Rule::no_children(), Rule::no_positional_args()};

    std::vector<Transform> out;
    out.reserve(steps.value().size());
    for (const auto& step : steps.value()) {
        const auto valid = step.validate(step_rules);
        if (!valid.is_ok()) return Result<std::vector<Transform>>::error(valid.diagnostic());

        auto params = step.args_map(ArgRange::all());
        if (!params.is_ok()) return Result<std::vector<Transform>>::error(params.diagnostic());

        out.push_back(Transform{std::string(step.name().value()), std::move(params.value())});
    }
    return Result<std::vector<Transform>>::ok(std::move(out));
}

} // namespace motya
