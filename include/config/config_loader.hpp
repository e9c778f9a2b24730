#pragma once

#include "core/engine.hpp"
#include "core/types.hpp"
#include "plugin/plugin_loader.hpp"

#include <optional>
#include <string>
#include <vector>

namespace piishield {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Top-level Config (mirrors TOML hierarchy)
// ============================================================================

/**
 * [logging]          level
 * [analyzer]         parallel, recognizer_timeout_ms, score_threshold, entities,
 *                    builtin_recognizers, table_parallel_threshold, table_workers
 * [redactor]         default_action
 * [redactor.actions] ENTITY_TYPE = "replace" | "mask" | "hash"
 * [[rules]]          name, kind = "regex" | "whitelist", pattern | examples, score
 * [[plugins]]        path, config, entities
 */
struct ShieldConfig {
    LoggingConfig logging;
    EngineConfig engine;
    std::vector<RuleDefinition> rules;
    std::vector<PluginConfig> plugins;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ShieldConfig config;

        static LoadResult ok(ShieldConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file (include directives resolved
     * relative to the file, ${VAR} and ${VAR:-default} expanded from the environment)
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    // "replace" | "mask" | "hash" (case-insensitive)
    [[nodiscard]] static std::optional<RedactionAction> parse_action(const std::string& action_str);

    // "regex" | "whitelist" (case-insensitive)
    [[nodiscard]] static std::optional<RuleKind> parse_rule_kind(const std::string& kind_str);
};

} // namespace piishield
