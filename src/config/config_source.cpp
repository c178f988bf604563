#include "config/config_source.hpp"
#include "core/utils.hpp"
#include "document/document_reader.hpp"
#include "parser/parse_context.hpp"
#include "parser/typed_value.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <system_error>

namespace motya {

namespace {

Result<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::error(Diagnostic::detached(
            ErrorCategory::IO_ERROR,
            std::format("Cannot open config file: {}", path.string()),
            path.string()));
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return Result<std::string>::error(Diagnostic::detached(
            ErrorCategory::IO_ERROR,
            std::format("Failed to read config file: {}", path.string()),
            path.string()));
    }
    return Result<std::string>::ok(buf.str());
}

} // anonymous namespace

Result<std::vector<SourceDocument>> FileConfigSource::collect(const std::filesystem::path& entry) {
    std::vector<SourceDocument> out;
    std::unordered_set<std::string> active;
    const auto collected = collect_file(entry, active, 0, out);
    if (!collected.is_ok()) {
        return Result<std::vector<SourceDocument>>::error(collected.diagnostic());
    }
    utils::log::info(std::format("Collected {} config document(s) from {}",
                                 out.size(), entry.string()));
    return Result<std::vector<SourceDocument>>::ok(std::move(out));
}

Result<void> FileConfigSource::collect_file(const std::filesystem::path& path,
                                            std::unordered_set<std::string>& active,
                                            const int depth,
                                            std::vector<SourceDocument>& out) {
    namespace fs = std::filesystem;
    const std::string source_name = path.lexically_normal().string();

    if (depth > kMaxIncludeDepth) {
        return Result<void>::error(Diagnostic::detached(
            ErrorCategory::IO_ERROR,
            std::format("Config include depth exceeds {}, possible circular include",
                        kMaxIncludeDepth),
            source_name));
    }

    std::error_code ec;
    const fs::path canonical = fs::canonical(path, ec);
    if (ec) {
        return Result<void>::error(Diagnostic::detached(
            ErrorCategory::IO_ERROR,
            std::format("Cannot resolve config file {}: {}", source_name, ec.message()),
            source_name));
    }
    // ifstream opens a directory on glibc and then reads nothing
    if (!fs::is_regular_file(canonical, ec)) {
        return Result<void>::error(Diagnostic::detached(
            ErrorCategory::IO_ERROR,
            std::format("Config path is not a regular file: {}", source_name),
            source_name));
    }
    if (!active.insert(canonical.string()).second) {
        return Result<void>::error(Diagnostic::detached(
            ErrorCategory::IO_ERROR,
            std::format("Circular config include detected: {}", canonical.string()),
            source_name));
    }

    auto text = read_file(path);
    if (!text.is_ok()) return Result<void>::error(text.diagnostic());

    auto doc = DocumentReader::read(std::move(text.value()), source_name);
    if (!doc.is_ok()) return Result<void>::error(doc.diagnostic());

    auto includes = take_includes(doc.value(), source_name);
    if (!includes.is_ok()) return Result<void>::error(includes.diagnostic());

    const fs::path base_dir = path.parent_path();
    for (const auto& rel : includes.value()) {
        const auto included = collect_file(base_dir / rel, active, depth + 1, out);
        if (!included.is_ok()) return included;
    }

    // Only the current include chain counts as circular; the same file may
    // be included again from a sibling branch.
    active.erase(canonical.string());

    out.push_back(SourceDocument{std::move(doc.value()), source_name});
    return Result<void>::ok();
}

Result<std::vector<std::string>> FileConfigSource::take_includes(Document& doc,
                                                                 const std::string& source_name) {
    static const Rule rules[] = {
        Rule::no_children(),
        Rule::only_keys_typed({}),
    };

    std::vector<std::string> paths;
    const ParseContext root(doc, source_name);
    for (const NodeId id : doc.roots()) {
        if (doc.node(id).name != "include") continue;

        const auto ctx = root.for_node(id);
        const auto valid = ctx.validate(rules);
        if (!valid.is_ok()) return Result<std::vector<std::string>>::error(valid.diagnostic());

        // At least one path; `include "a.kdl" "b.kdl"` loads both in order
        const auto first = ctx.arg(0);
        if (!first.is_ok()) return Result<std::vector<std::string>>::error(first.diagnostic());

        const auto entries = ctx.args().value();
        for (const auto& entry : entries) {
            auto path = TypedValue(ctx, entry).as_str();
            if (!path.is_ok()) return Result<std::vector<std::string>>::error(path.diagnostic());
            paths.push_back(std::move(path.value()));
        }
    }

    doc.erase_roots("include");
    return Result<std::vector<std::string>>::ok(std::move(paths));
}

} // namespace motya
