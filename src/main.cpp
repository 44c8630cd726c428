#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "document/document_redactor.hpp"
#include "policy/policy_registry.hpp"

#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

using namespace redactor;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitConfig = 2;
constexpr int kExitDocument = 3;

struct CliOptions {
    std::string config_file;
    std::optional<std::string> input_file;
};

void print_usage(const char* program) {
    std::cerr << std::format(
        "Usage: {} --config <redactor.toml> [--input <document.json>]\n"
        "Reads a JSON document (from --input or stdin) and prints it with the\n"
        "configured document rules applied.\n",
        program);
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            options.config_file = argv[++i];
        } else if ((arg == "--input" || arg == "-i") && i + 1 < argc) {
            options.input_file = argv[++i];
        } else {
            utils::log::error(std::format("Unexpected argument '{}'", arg));
            return std::nullopt;
        }
    }
    if (options.config_file.empty()) {
        utils::log::error("--config is required");
        return std::nullopt;
    }
    return options;
}

std::optional<std::string> read_input(const std::optional<std::string>& input_file) {
    if (!input_file.has_value()) {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream in(*input_file, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

template<typename T>
void log_failure(const Result<T>& result) {
    utils::log::error(std::format("[{}] {}", error_category_to_string(result.error_category()),
                                  result.error_message()));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        const auto options = parse_args(argc, argv);
        if (!options.has_value()) {
            print_usage(argv[0]);
            return kExitUsage;
        }

        // [1/3] Configuration
        const auto config_result = ConfigLoader::load_from_file(options->config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return kExitConfig;
        }
        const auto& config = config_result.config;

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }
        utils::log::debug(std::format("[1/3] Loaded configuration from {}", options->config_file));

        // [2/3] Policies and rules
        auto registry = PolicyRegistry::with_builtins();
        for (const auto& policy_config : config.policies) {
            auto policy = ConfigLoader::build_policy(policy_config);
            if (policy.is_error()) {
                log_failure(policy);
                return kExitConfig;
            }
            const auto registered = registry.register_policy(policy_config.name, policy.value());
            if (registered.is_error()) {
                log_failure(registered);
                return kExitConfig;
            }
        }

        auto redactor = DocumentRedactor::create(config.document_rules, registry);
        if (redactor.is_error()) {
            log_failure(redactor);
            return kExitConfig;
        }
        utils::log::debug(std::format("[2/3] {} classifications, {} document rules",
                                      registry.size(), redactor.value().rule_count()));

        // [3/3] Document
        const auto input = read_input(options->input_file);
        if (!input.has_value()) {
            utils::log::error(std::format("Cannot read input file {}", *options->input_file));
            return kExitDocument;
        }

        const auto output = redactor.value().redact_text(*input);
        if (output.is_error()) {
            log_failure(output);
            return kExitDocument;
        }

        std::cout << output.value() << '\n';
        utils::log::debug("[3/3] Document redacted");
        return kExitOk;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return EXIT_FAILURE;
    }
}
