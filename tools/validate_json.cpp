// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "common/utils.hpp"
#include "config.hpp"
#include "configuration/config_parser.hpp"
#include "json_utils.hpp"
#include "log.hpp"
#include "tree_walker.hpp"
#include "validator.hpp"

using namespace jsentry;

namespace {

void usage(std::string_view name)
{
    std::cerr << "Usage: " << name
              << " [--preset strict|relaxed|api] [--config <json file>]"
                 " [--log-level trace|debug|info|warn|error] [--sanitize] [--hash]"
                 " <json file>\n";
}

validation_config load_config(const std::string &filename)
{
    auto parsed = json_to_object(read_file(filename));
    if (!parsed.ok()) {
        throw std::runtime_error("invalid configuration file: " + parsed.error);
    }
    return parse_config(parsed.value);
}

} // namespace

int main(int argc, char *argv[])
{
    const std::vector<std::string_view> args(argv, argv + argc);

    validation_config config;
    std::string_view input_file;
    bool print_sanitized = false;
    bool print_hash = false;

    try {
        for (std::size_t i = 1; i < args.size(); ++i) {
            const auto arg = args[i];
            const bool has_value = i + 1 < args.size();
            if (arg == "--preset" && has_value) {
                auto value = preset_from_string(args[++i]);
                if (!value.has_value()) {
                    std::cerr << "Unknown preset: " << args[i] << '\n';
                    return EXIT_FAILURE;
                }
                config = config_from_preset(*value);
            } else if (arg == "--config" && has_value) {
                config = load_config(std::string{args[++i]});
            } else if (arg == "--log-level" && has_value) {
                auto level = log_level_from_str(args[++i]);
                if (!level.has_value()) {
                    std::cerr << "Unknown log level: " << args[i] << '\n';
                    return EXIT_FAILURE;
                }
                logger::init(log_cb, *level);
            } else if (arg == "--sanitize") {
                print_sanitized = true;
            } else if (arg == "--hash") {
                print_hash = true;
            } else if (input_file.empty() && !arg.starts_with("--")) {
                input_file = arg;
            } else {
                usage(args[0]);
                return EXIT_FAILURE;
            }
        }

        if (input_file.empty()) {
            usage(args[0]);
            return EXIT_FAILURE;
        }

        const validator engine;
        const auto text = read_file(input_file);
        const auto result = engine.validate_text(text, config);
        std::cout << result_to_json(result) << '\n';

        // An oversized input is reported but never parsed
        const bool oversized = tree_walker::check_total_size(text, config).has_value();
        if ((print_sanitized || print_hash) && !oversized) {
            auto parsed = json_to_document(text);
            if (parsed.ok()) {
                if (print_sanitized) {
                    std::cout << object_to_json(engine.sanitize(parsed.value, config)) << '\n';
                }
                if (print_hash) {
                    std::cout << validator::hash(parsed.value) << '\n';
                }
            }
        }

        return result.is_valid() ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const std::exception &e) {
        std::cerr << "Unexpected exception: " << e.what() << '\n';
    }

    return EXIT_FAILURE;
}
