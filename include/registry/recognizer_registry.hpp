#pragma once

#include "core/types.hpp"
#include "recognizer/recognizer.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace piishield {

/**
 * @brief Immutable view of the recognizer set for one analysis pass
 */
struct RecognizerSet {
    std::vector<std::shared_ptr<const IRecognizer>> recognizers;   // registration order
    std::unordered_map<std::string, size_t> index;                 // name -> position
    std::unordered_set<std::string> builtin;                       // non-removable names

    [[nodiscard]] size_t size() const { return recognizers.size(); }
    [[nodiscard]] bool empty() const { return recognizers.empty(); }
};

using RegistrySnapshot = std::shared_ptr<const RecognizerSet>;

/**
 * @brief Recognizer Registry - ordered name -> recognizer mapping
 *
 * Re-registering a custom name overwrites it in place (position kept).
 * Built-in recognizers are installed at construction and can only be
 * supplemented: a custom registration reusing a built-in name is rejected.
 *
 * Thread-safety: RCU. Readers take snapshot() (atomic shared_ptr load) and
 * keep a consistent set for the whole pass; writers are serialized by a
 * mutex and publish a fresh copy with one atomic store, so a snapshot sees
 * either the pre- or the post-registration state, never a partial one.
 */
class RecognizerRegistry {
public:
    /**
     * @param with_builtins Install the standard pattern recognizers
     */
    explicit RecognizerRegistry(bool with_builtins = true);

    RecognizerRegistry(const RecognizerRegistry&) = delete;
    RecognizerRegistry& operator=(const RecognizerRegistry&) = delete;

    /**
     * @brief Add or overwrite a custom recognizer by name
     * @throws InvalidRuleError on null recognizer, empty name or built-in name clash
     */
    void register_recognizer(std::shared_ptr<const IRecognizer> recognizer);

    /**
     * @brief Install a non-removable recognizer (e.g. a model-backed one)
     * @throws InvalidRuleError on null recognizer, empty name or duplicate built-in
     */
    void register_builtin(std::shared_ptr<const IRecognizer> recognizer);

    /**
     * @brief Build a regex/whitelist recognizer from a rule definition and register it
     * @throws InvalidRuleError on malformed definition; registry unchanged
     */
    std::shared_ptr<const IRecognizer> add_rule(const RuleDefinition& rule);

    /**
     * @brief Current recognizer set; never null
     */
    [[nodiscard]] RegistrySnapshot snapshot() const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] bool is_builtin(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> names() const;

private:
    void publish(std::shared_ptr<const IRecognizer> recognizer, bool builtin);

    std::shared_ptr<const RecognizerSet> store_;
    std::mutex write_mutex_;
};

/**
 * @brief Construct the recognizer described by a rule definition
 *
 * Entity type equals the rule name. Regex patterns are compiled here;
 * whitelist examples are trimmed and blank ones dropped.
 * @throws InvalidRuleError on malformed definition
 */
[[nodiscard]] std::shared_ptr<const IRecognizer> make_rule_recognizer(const RuleDefinition& rule);

} // namespace piishield
