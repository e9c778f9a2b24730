#include "core/engine.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "io/table_io.hpp"
#include "plugin/plugin_loader.hpp"
#include "report/findings_report.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace piishield;

namespace {

enum class InputFormat { TEXT, CSV, JSON };

struct CliOptions {
    std::optional<std::string> config_file;
    std::optional<InputFormat> format;
    std::optional<std::string> output;
    std::optional<std::string> report;
    std::vector<RuleDefinition> rules;
    std::string input;
};

void print_usage(const char* argv0) {
    std::cerr << std::format(
        "Usage: {} [options] INPUT\n"
        "  --config FILE                 TOML configuration\n"
        "  --format text|csv|json        Input format (default: from extension)\n"
        "  --output FILE                 Sanitized copy (default: safe_<INPUT>)\n"
        "  --report FILE                 JSON findings report (default: stdout)\n"
        "  --rule-regex NAME=PATTERN     Add a regex rule (score 0.8)\n"
        "  --rule-whitelist NAME=a,b,c   Add a whitelist rule (score 0.8)\n",
        argv0);
}

std::optional<InputFormat> parse_format(const std::string& s) {
    const std::string lower = utils::to_lower(s);
    if (lower == "text" || lower == "txt") return InputFormat::TEXT;
    if (lower == "csv") return InputFormat::CSV;
    if (lower == "json") return InputFormat::JSON;
    return std::nullopt;
}

InputFormat format_from_path(const std::string& path) {
    auto ext = std::filesystem::path(path).extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    return parse_format(ext).value_or(InputFormat::TEXT);
}

// NAME=VALUE; throws std::invalid_argument on a missing '='
std::pair<std::string, std::string> split_assignment(const std::string& arg, const char* flag) {
    const auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw std::invalid_argument(std::format("{} expects NAME=VALUE, got '{}'", flag, arg));
    }
    return {arg.substr(0, eq), arg.substr(eq + 1)};
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(std::format("{} requires a value", arg));
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (arg == "--config") {
            opts.config_file = next();
        } else if (arg == "--format") {
            const auto value = next();
            opts.format = parse_format(value);
            if (!opts.format) {
                throw std::invalid_argument(std::format("Unknown format '{}'", value));
            }
        } else if (arg == "--output") {
            opts.output = next();
        } else if (arg == "--report") {
            opts.report = next();
        } else if (arg == "--rule-regex") {
            auto [name, pattern] = split_assignment(next(), "--rule-regex");
            RuleDefinition rule;
            rule.name = std::move(name);
            rule.kind = RuleKind::REGEX;
            rule.pattern = std::move(pattern);
            opts.rules.push_back(std::move(rule));
        } else if (arg == "--rule-whitelist") {
            auto [name, list] = split_assignment(next(), "--rule-whitelist");
            RuleDefinition rule;
            rule.name = std::move(name);
            rule.kind = RuleKind::WHITELIST;
            rule.examples = utils::split(list, ',');
            opts.rules.push_back(std::move(rule));
        } else if (!arg.empty() && arg.front() == '-') {
            throw std::invalid_argument(std::format("Unknown option '{}'", arg));
        } else if (opts.input.empty()) {
            opts.input = arg;
        } else {
            throw std::invalid_argument(std::format("Unexpected argument '{}'", arg));
        }
    }
    if (opts.input.empty()) {
        return std::nullopt;
    }
    return opts;
}

std::string default_output_path(const std::string& input) {
    namespace fs = std::filesystem;
    const fs::path p(input);
    return (p.parent_path() / ("safe_" + p.filename().string())).string();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        auto parsed = parse_args(argc, argv);
        if (!parsed) {
            print_usage(argv[0]);
            return 1;
        }
        auto& opts = *parsed;

        // [1/4] Configuration
        ShieldConfig config;
        if (opts.config_file) {
            utils::log::info(std::format("[1/4] Loading configuration from {}", *opts.config_file));
            auto result = ConfigLoader::load_from_file(*opts.config_file);
            if (!result.success) {
                utils::log::error(result.error_message);
                return 1;
            }
            config = std::move(result.config);
        } else {
            utils::log::info("[1/4] No configuration file, using defaults");
        }
        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        // [2/4] Engine, plugins and rules
        PiiShield engine(config.engine);

        PluginRegistry plugins;
        for (const auto& plugin_cfg : config.plugins) {
            if (!plugins.load_plugin(plugin_cfg)) {
                utils::log::error(std::format("Plugin {} failed to load", plugin_cfg.path));
                return 1;
            }
            engine.add_entity_detector(plugins.entity_detectors().back(), plugin_cfg.entities);
        }

        for (const auto& rule : config.rules) {
            engine.add_rule(rule);
        }
        for (const auto& rule : opts.rules) {
            engine.add_rule(rule);
        }
        utils::log::info(std::format("[2/4] Engine ready: {} recognizer(s), {} plugin(s), default action '{}'",
            engine.registry().size(), plugins.plugin_count(),
            redaction_action_to_string(engine.config().redactor.default_action)));

        // [3/4] Analysis
        const auto format = opts.format.value_or(format_from_path(opts.input));
        const std::string content = io::read_file(opts.input);
        const std::string output_path = opts.output.value_or(default_output_path(opts.input));

        FindingsReport report;
        report.source = std::filesystem::path(opts.input).filename().string();
        std::string sanitized;

        utils::Timer timer;
        if (format == InputFormat::TEXT) {
            auto result = engine.analyze_text(content);
            report.findings = std::move(result.findings);
            report.warnings = std::move(result.warnings);
            sanitized = std::move(result.sanitized);
        } else {
            const Table table = (format == InputFormat::CSV) ? io::parse_csv(content)
                                                             : io::parse_json_records(content);
            auto result = engine.analyze_table(table);
            report.findings = std::move(result.findings);
            report.warnings = std::move(result.warnings);
            sanitized = (format == InputFormat::CSV) ? io::to_csv(result.sanitized)
                                                     : io::to_json_records(result.sanitized);
        }
        utils::log::info(std::format("[3/4] {} finding(s) in {} ms{}",
            report.total(), timer.elapsed_ms().count(),
            report.degraded() ? " (degraded: some recognizers failed)" : ""));

        // [4/4] Output: serialize everything before writing anything
        const auto report_json = report.to_json_string(2);
        io::write_file(output_path, sanitized);
        if (opts.report) {
            io::write_file(*opts.report, report_json + "\n");
            utils::log::info(std::format("[4/4] Wrote {} and {}", output_path, *opts.report));
        } else {
            std::cout << report_json << std::endl;
            utils::log::info(std::format("[4/4] Wrote {}", output_path));
        }
        return 0;

    } catch (const PiiShieldError& e) {
        utils::log::error(e.what());
        return 1;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
