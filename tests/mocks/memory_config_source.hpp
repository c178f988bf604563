#pragma once

#include "config/config_source.hpp"
#include "document/document_reader.hpp"

#include <map>
#include <string>
#include <utility>

namespace motya::test {

/**
 * @brief In-memory config source: each registered name yields the
 * documents listed for it, parsed on collect()
 */
class MemoryConfigSource : public IConfigSource {
public:
    void add(const std::string& entry, std::string source_name, std::string text) {
        files_[entry].emplace_back(std::move(source_name), std::move(text));
    }

    [[nodiscard]] Result<std::vector<SourceDocument>> collect(
            const std::filesystem::path& entry) override {
        ++collect_calls;
        const auto it = files_.find(entry.string());
        if (it == files_.end()) {
            return Result<std::vector<SourceDocument>>::error(Diagnostic::detached(
                ErrorCategory::IO_ERROR, "no such entry", entry.string()));
        }

        std::vector<SourceDocument> docs;
        for (const auto& [name, text] : it->second) {
            auto doc = DocumentReader::read(text, name);
            if (!doc.is_ok()) return Result<std::vector<SourceDocument>>::error(doc.diagnostic());
            docs.push_back(SourceDocument{std::move(doc.value()), name});
        }
        return Result<std::vector<SourceDocument>>::ok(std::move(docs));
    }

    int collect_calls = 0;

private:
    std::map<std::string, std::vector<std::pair<std::string, std::string>>> files_;
};

} // namespace motya::test
