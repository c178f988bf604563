#pragma once

#include "core/error.hpp"
#include "document/document.hpp"

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

namespace motya {

/**
 * @brief A parsed document and the label its diagnostics carry
 */
struct SourceDocument {
    Document document;
    std::string source_name;
};

/**
 * @brief Abstract configuration source
 *
 * Resolves an entry point into every document the configuration is made
 * of. Enables pluggable backends: files on disk (FileConfigSource) or
 * in-memory documents for testing.
 */
class IConfigSource {
public:
    virtual ~IConfigSource() = default;

    [[nodiscard]] virtual Result<std::vector<SourceDocument>> collect(
        const std::filesystem::path& entry) = 0;
};

/**
 * @brief Reads KDL files from disk, following root-level includes
 *
 *   include "listeners.kdl"
 *
 * An include may name several files. Paths are relative to the including file. Included documents
 * come before the document that includes them. The `include` directives
 * are removed from the returned documents.
 */
class FileConfigSource : public IConfigSource {
public:
    static constexpr int kMaxIncludeDepth = 10;

    [[nodiscard]] Result<std::vector<SourceDocument>> collect(
        const std::filesystem::path& entry) override;

private:
    Result<void> collect_file(const std::filesystem::path& path,
                              std::unordered_set<std::string>& active,
                              int depth,
                              std::vector<SourceDocument>& out);

    static Result<std::vector<std::string>> take_includes(Document& doc,
                                                          const std::string& source_name);
};

} // namespace motya
