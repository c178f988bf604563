#include "config/config_json.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <string>
#include <string_view>

using namespace motya;

static void print_usage(const char* argv0) {
    std::cerr << std::format("Usage: {} <entry.kdl> [--json]\n", argv0)
              << "  Validates a motya configuration and everything it includes.\n"
              << "  --json    print the parsed configuration as JSON on success\n"
              << "Environment:\n"
              << "  MOTYA_LOG_QUIET=1    suppress info log lines\n";
}

int main(int argc, char* argv[]) {
    try {
        std::string config_file;
        bool dump_json = false;
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];
            if (arg == "--json") {
                dump_json = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (config_file.empty() && !arg.starts_with("-")) {
                config_file = arg;
            } else {
                utils::log::error(std::format("Unexpected argument '{}'", arg));
                print_usage(argv[0]);
                return 2;
            }
        }
        if (config_file.empty()) {
            print_usage(argv[0]);
            return 2;
        }

        utils::log::info(std::format("Checking configuration {}", config_file));

        auto result = ConfigLoader::load_from_file(config_file);
        if (!result.is_ok()) {
            std::cerr << result.diagnostic().help() << '\n';
            utils::log::error(std::format("Configuration rejected ({})",
                error_category_to_string(result.error_category())));
            return 1;
        }

        if (dump_json) {
            const nlohmann::json j = result.value();
            std::cout << j.dump(2) << '\n';
        }
        utils::log::info("Configuration OK");

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
