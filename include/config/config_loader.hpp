#pragma once

#include "config/config_source.hpp"
#include "config/config_types.hpp"
#include "core/error.hpp"
#include "parser/parse_context.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace motya {

/**
 * @brief Turns motya KDL documents into a Config
 *
 * Root layout:
 *
 *   services {
 *       Example1 {
 *           listeners { ... }
 *           connectors { ... }
 *       }
 *   }
 *   definitions {
 *       filter-chain "auth" { ... }
 *       key-profile "default" { ... }
 *   }
 *
 * Both root blocks may appear any number of times, in any document; the
 * results are concatenated in source order. The first error aborts the load.
 */
class ConfigLoader {
public:
    /**
     * @brief Load a config file and everything it includes
     * @param config_path Entry KDL file
     * @return Config or the first diagnostic
     */
    [[nodiscard]] static Result<Config> load_from_file(const std::filesystem::path& config_path);

    /**
     * @brief Load through an arbitrary source (in-memory sources in tests)
     */
    [[nodiscard]] static Result<Config> load_from_source(IConfigSource& source,
                                                         const std::filesystem::path& entry);

    /**
     * @brief Load a config from KDL text (includes are not followed)
     * @param kdl_content KDL content
     * @param source_name Label used in diagnostics
     */
    [[nodiscard]] static Result<Config> load_from_string(std::string kdl_content,
                                                         std::string_view source_name = "<string>");

    /// Parse already collected documents, concatenating their sections.
    [[nodiscard]] static Result<Config> parse_documents(const std::vector<SourceDocument>& docs);

    /// Parse the root of a single document.
    [[nodiscard]] static Result<Config> parse_root(const ParseContext& root);

private:
    struct Definitions {
        std::vector<NamedFilterChain> filter_chains;
        std::vector<NamedKeyProfile> key_profiles;
    };

    static Result<std::vector<ProxyConfig>> extract_services(const ParseContext& ctx);
    static Result<Definitions> extract_definitions(const ParseContext& ctx);

    // Validates `filter-chain "<name>" { ... }` style headers, returns the name
    static Result<std::string> definition_name(const ParseContext& ctx);
};

} // namespace motya
