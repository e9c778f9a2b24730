#include "registry/recognizer_registry.hpp"
#include "recognizer/builtin_recognizers.hpp"
#include "recognizer/pattern_recognizer.hpp"
#include "recognizer/whitelist_recognizer.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <atomic>
#include <format>

namespace piishield {

std::shared_ptr<const IRecognizer> make_rule_recognizer(const RuleDefinition& rule) {
    switch (rule.kind) {
        case RuleKind::REGEX:
            return std::make_shared<PatternRecognizer>(
                rule.name, rule.name, rule.pattern, rule.score);
        case RuleKind::WHITELIST:
            return std::make_shared<WhitelistRecognizer>(
                rule.name, rule.name, rule.examples, rule.score);
    }
    throw InvalidRuleError(std::format("Rule '{}': unknown rule kind", rule.name));
}

RecognizerRegistry::RecognizerRegistry(bool with_builtins)
    : store_(std::make_shared<RecognizerSet>()) {
    if (!with_builtins) {
        return;
    }
    for (auto& recognizer : make_builtin_recognizers()) {
        publish(std::move(recognizer), true);
    }
}

void RecognizerRegistry::register_recognizer(std::shared_ptr<const IRecognizer> recognizer) {
    publish(std::move(recognizer), false);
}

void RecognizerRegistry::register_builtin(std::shared_ptr<const IRecognizer> recognizer) {
    publish(std::move(recognizer), true);
}

std::shared_ptr<const IRecognizer> RecognizerRegistry::add_rule(const RuleDefinition& rule) {
    auto recognizer = make_rule_recognizer(rule);
    register_recognizer(recognizer);
    utils::log::info(std::format("Registered {} rule '{}' (score {:.2f})",
        recognizer_kind_to_string(recognizer->kind()), rule.name, rule.score));
    return recognizer;
}

void RecognizerRegistry::publish(std::shared_ptr<const IRecognizer> recognizer, bool builtin) {
    if (!recognizer) {
        throw InvalidRuleError("Cannot register a null recognizer");
    }
    const std::string name = recognizer->name();
    if (name.empty()) {
        throw InvalidRuleError("Recognizer name must not be empty");
    }

    std::lock_guard<std::mutex> lock(write_mutex_);

    const auto current = std::atomic_load_explicit(&store_, std::memory_order_acquire);

    if (current->builtin.contains(name)) {
        throw InvalidRuleError(
            std::format("'{}' is a built-in recognizer and cannot be replaced", name));
    }
    if (builtin && current->index.contains(name)) {
        throw InvalidRuleError(std::format("Recognizer '{}' is already registered", name));
    }

    // Copy-on-write: readers holding the old set are unaffected
    auto next = std::make_shared<RecognizerSet>(*current);
    if (const auto it = next->index.find(name); it != next->index.end()) {
        next->recognizers[it->second] = std::move(recognizer);
        utils::log::debug(std::format("Recognizer '{}' overwritten", name));
    } else {
        next->index.emplace(name, next->recognizers.size());
        next->recognizers.emplace_back(std::move(recognizer));
    }
    if (builtin) {
        next->builtin.insert(name);
    }

    std::atomic_store_explicit(&store_,
        std::shared_ptr<const RecognizerSet>(std::move(next)), std::memory_order_release);
}

RegistrySnapshot RecognizerRegistry::snapshot() const {
    return std::atomic_load_explicit(&store_, std::memory_order_acquire);
}

size_t RecognizerRegistry::size() const {
    return snapshot()->size();
}

bool RecognizerRegistry::contains(const std::string& name) const {
    return snapshot()->index.contains(name);
}

bool RecognizerRegistry::is_builtin(const std::string& name) const {
    return snapshot()->builtin.contains(name);
}

std::vector<std::string> RecognizerRegistry::names() const {
    const auto set = snapshot();
    std::vector<std::string> result;
    result.reserve(set->size());
    for (const auto& recognizer : set->recognizers) {
        result.push_back(recognizer->name());
    }
    return result;
}

} // namespace piishield
