#pragma once

#include "core/error.hpp"
#include "document/document.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace motya {

/**
 * @brief Reads KDL text into a Document
 *
 * Syntax, escapes, numbers, keywords and slashdash comments are handled by
 * ckdl (KDL v2, with v1 documents accepted through version detection).
 * ckdl reports no source positions, so node and entry spans are recovered
 * from ckdl's tokenizer, whose tokens are slices of the source text.
 */
class DocumentReader {
public:
    /// Deepest children-block nesting accepted before the read fails.
    static constexpr size_t kMaxNesting = 256;

    /**
     * @brief Parse KDL text
     * @param text Source text (moved into the resulting Document)
     * @param source_name Label used in diagnostics
     * @return Document, or a SYNTAX_ERROR diagnostic
     */
    [[nodiscard]] static Result<Document> read(std::string text, std::string_view source_name);
};

} // namespace motya
