#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace piishield {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} and ${VAR_NAME:-default} patterns with environment
 * variables. An unset or empty variable takes the default (or "").
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string expr = input.substr(i + 2, close - i - 2);
            const size_t sep = expr.find(":-");
            const std::string var_name = expr.substr(0, sep);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val && *env_val) {
                result += env_val;
            } else if (sep != std::string::npos) {
                result += expr.substr(sep + 2);
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars, arrays concatenate
 * (so included [[rules]] files accumulate).
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include = "file" | ["a", "b"] directives relative to base_dir.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included is base, root is overlay (main file wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

void extract_analyzer(const toml::table& root, EngineConfig& engine) {
    const auto* analyzer = root["analyzer"].as_table();
    if (!analyzer) return;
    const auto& a = *analyzer;

    engine.analyzer.parallel = a["parallel"].value_or(false);
    engine.analyzer.recognizer_timeout =
        std::chrono::milliseconds(a["recognizer_timeout_ms"].value_or(int64_t{0}));
    engine.analyzer.score_threshold = a["score_threshold"].value_or(0.0);
    engine.analyzer.entities = toml_string_array(a, "entities");
    engine.builtin_recognizers = a["builtin_recognizers"].value_or(true);

    const auto threshold = a["table_parallel_threshold"].value_or(int64_t{1000});
    const auto workers = a["table_workers"].value_or(int64_t{4});
    if (threshold < 0) {
        throw std::invalid_argument("analyzer.table_parallel_threshold must be >= 0");
    }
    if (workers < 1) {
        throw std::invalid_argument("analyzer.table_workers must be >= 1");
    }
    engine.tabular.parallel_threshold = static_cast<size_t>(threshold);
    engine.tabular.max_workers = static_cast<unsigned>(workers);
}

void extract_redactor(const toml::table& root, EngineConfig& engine) {
    const auto* redactor = root["redactor"].as_table();
    if (!redactor) return;
    const auto& r = *redactor;

    const std::string default_action = r["default_action"].value_or("replace"s);
    const auto action = ConfigLoader::parse_action(default_action);
    if (!action) {
        throw std::invalid_argument(
            std::format("redactor.default_action: unknown action '{}'", default_action));
    }
    engine.redactor.default_action = *action;

    if (const auto* actions = r["actions"].as_table()) {
        for (const auto& [key, val] : *actions) {
            const auto* s = val.as_string();
            const auto parsed = s ? ConfigLoader::parse_action(s->get()) : std::nullopt;
            if (!parsed) {
                throw std::invalid_argument(
                    std::format("redactor.actions.{}: expected \"replace\", \"mask\" or \"hash\"",
                                key.str()));
            }
            engine.redactor.actions[std::string(key.str())] = *parsed;
        }
    }
}

std::vector<RuleDefinition> extract_rules(const toml::table& root) {
    std::vector<RuleDefinition> result;
    const auto* arr = root["rules"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* tbl = (*arr)[i].as_table();
        if (!tbl) {
            throw std::invalid_argument(std::format("rules[{}]: expected a table", i));
        }
        const auto& t = *tbl;

        RuleDefinition rule;
        rule.name = t["name"].value_or(""s);
        if (rule.name.empty()) {
            throw std::invalid_argument(std::format("rules[{}].name is required", i));
        }

        const std::string kind = t["kind"].value_or("regex"s);
        const auto parsed = ConfigLoader::parse_rule_kind(kind);
        if (!parsed) {
            throw std::invalid_argument(
                std::format("rules[{}].kind: unknown kind '{}' (rule '{}')", i, kind, rule.name));
        }
        rule.kind = *parsed;
        rule.score = t["score"].value_or(0.8);

        if (rule.kind == RuleKind::REGEX) {
            rule.pattern = t["pattern"].value_or(""s);
            if (rule.pattern.empty()) {
                throw std::invalid_argument(
                    std::format("rules[{}].pattern is required for regex rule '{}'", i, rule.name));
            }
        } else {
            rule.examples = toml_string_array(t, "examples");
            if (rule.examples.empty()) {
                throw std::invalid_argument(std::format(
                    "rules[{}].examples is required for whitelist rule '{}'", i, rule.name));
            }
        }

        if (!(rule.score >= 0.0 && rule.score <= 1.0)) {
            throw std::invalid_argument(
                std::format("rules[{}].score must be within [0, 1] (rule '{}')", i, rule.name));
        }
        result.emplace_back(std::move(rule));
    }
    return result;
}

std::vector<PluginConfig> extract_plugins(const toml::table& root) {
    std::vector<PluginConfig> result;
    const auto* arr = root["plugins"].as_array();
    if (!arr) return result;

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* tbl = (*arr)[i].as_table();
        if (!tbl) continue;

        PluginConfig cfg;
        cfg.path = (*tbl)["path"].value_or(""s);
        cfg.type = (*tbl)["type"].value_or("entity_detector"s);
        cfg.config = (*tbl)["config"].value_or(""s);
        cfg.entities = toml_string_array(*tbl, "entities");
        if (cfg.path.empty()) {
            throw std::invalid_argument(std::format("plugins[{}].path is required", i));
        }
        result.emplace_back(std::move(cfg));
    }
    return result;
}

/**
 * @brief Range checks after extraction; returns an error message naming the key
 */
std::optional<std::string> validate(const ShieldConfig& config) {
    if (!utils::log::parse_level(config.logging.level)) {
        return std::format("logging.level: unknown level '{}'", config.logging.level);
    }
    const auto& a = config.engine.analyzer;
    if (a.recognizer_timeout.count() < 0) {
        return "analyzer.recognizer_timeout_ms must be >= 0"s;
    }
    if (!(a.score_threshold >= 0.0 && a.score_threshold <= 1.0)) {
        return "analyzer.score_threshold must be within [0, 1]"s;
    }

    std::unordered_set<std::string> names;
    for (const auto& rule : config.rules) {
        if (!names.insert(rule.name).second) {
            return std::format("rules: duplicate rule name '{}'", rule.name);
        }
    }
    return std::nullopt;
}

ConfigLoader::LoadResult extract_all(const toml::table& tbl) {
    ShieldConfig config;
    config.logging = extract_logging(tbl);
    extract_analyzer(tbl, config.engine);
    extract_redactor(tbl, config.engine);
    config.rules = extract_rules(tbl);
    config.plugins = extract_plugins(tbl);

    if (auto error = validate(config)) {
        return ConfigLoader::LoadResult::error(std::move(*error));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

std::optional<RedactionAction> ConfigLoader::parse_action(const std::string& action_str) {
    const std::string lower = utils::to_lower(action_str);
    if (lower == "replace") return RedactionAction::REPLACE;
    if (lower == "mask") return RedactionAction::MASK;
    if (lower == "hash") return RedactionAction::HASH;
    return std::nullopt;
}

std::optional<RuleKind> ConfigLoader::parse_rule_kind(const std::string& kind_str) {
    const std::string lower = utils::to_lower(kind_str);
    if (lower == "regex") return RuleKind::REGEX;
    if (lower == "whitelist") return RuleKind::WHITELIST;
    return std::nullopt;
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);

        namespace fs = std::filesystem;
        const std::string base_dir = fs::path(config_path).parent_path().string();
        std::unordered_set<std::string> visited;
        visited.insert(fs::canonical(config_path).string());
        resolve_includes(tbl, base_dir.empty() ? "." : base_dir, visited, 0);

        expand_env_vars_recursive(tbl);
        return extract_all(tbl);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error in {}: {}",
            config_path, std::string(e.description())));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Config error in {}: {}", config_path, e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return extract_all(tbl);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("TOML parse error: {}", std::string(e.description())));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Config error: {}", e.what()));
    }
}

} // namespace piishield
