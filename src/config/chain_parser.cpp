#include "config/chain_parser.hpp"
#include "parser/block_parser.hpp"
#include "parser/typed_value.hpp"

namespace motya {

Result<FilterChain> ChainParser::parse(const ParseContext& ctx) const {
    auto block = BlockParser::create(ctx);
    if (!block.is_ok()) return Result<FilterChain>::error(block.diagnostic());

    auto filters = block.value().repeated("filter", extract_filter);
    if (!filters.is_ok()) return Result<FilterChain>::error(filters.diagnostic());

    const auto done = block.value().exhaust();
    if (!done.is_ok()) return Result<FilterChain>::error(done.diagnostic());

    return Result<FilterChain>::ok(FilterChain{std::move(filters.value())});
}

Result<ConfiguredFilter> ChainParser::extract_filter(const ParseContext& ctx) {
    static const Rule rules[] = {Rule::no_children(), Rule::no_positional_args()};
    const auto valid = ctx.validate(rules);
    if (!valid.is_ok()) return Result<ConfiguredFilter>::error(valid.diagnostic());

    auto name_value = ctx.prop("name");
    if (!name_value.is_ok()) return Result<ConfiguredFilter>::error(name_value.diagnostic());
    auto name = name_value.value().parse_as<Fqdn>();
    if (!name.is_ok()) return Result<ConfiguredFilter>::error(name.diagnostic());

    auto args = ctx.args_map(ArgRange::all());
    if (!args.is_ok()) return Result<ConfiguredFilter>::error(args.diagnostic());
    args.value().erase("name");

    return Result<ConfiguredFilter>::ok(
        ConfiguredFilter{std::move(name.value()), std::move(args.value())});
}

} // namespace motya
