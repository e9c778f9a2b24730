#include <catch2/catch_test_macros.hpp>
#include "plugin/plugin_interface.hpp"
#include "plugin/plugin_loader.hpp"
#include "core/engine.hpp"
#include "mocks/mock_entity_detector.hpp"

#include <atomic>

using namespace piishield;
using test::MockEntityDetectorPlugin;

namespace {

MockEntityDetectorPlugin* state_of(EntityDetectorPlugin* plugin) {
    return static_cast<MockEntityDetectorPlugin*>(plugin->instance);
}

} // anonymous namespace

TEST_CASE("Plugin interface: API version constant", "[plugin]") {
    REQUIRE(PIISHIELD_PLUGIN_API_VERSION == 1);
}

TEST_CASE("MockEntityDetectorPlugin: create and get_info", "[plugin]") {
    auto* plugin = MockEntityDetectorPlugin::create();
    REQUIRE(plugin != nullptr);
    REQUIRE(plugin->instance != nullptr);

    auto info = plugin->get_info(plugin->instance);
    REQUIRE(std::string(info.name) == "mock_detector");
    REQUIRE(std::string(info.type) == "entity_detector");
    REQUIRE(info.api_version == PIISHIELD_PLUGIN_API_VERSION);

    plugin->destroy(plugin->instance);
    delete plugin;
}

// ============================================================================
// PluginRegistry
// ============================================================================

TEST_CASE("PluginRegistry: adopt exposes an entity detector", "[plugin]") {
    PluginRegistry registry;
    auto* plugin = MockEntityDetectorPlugin::create();
    auto* state = state_of(plugin);
    state->spans = {EntitySpanC{"PERSON", 0, 5, 0.85}};

    REQUIRE(registry.adopt(plugin, "mock"));
    REQUIRE(registry.plugin_count() == 1);
    REQUIRE(registry.entity_detectors().size() == 1);

    const auto& detector = registry.entity_detectors()[0];
    CHECK(detector->name() == "mock_detector");

    auto spans = detector->detect("Alice met Bob", {"PERSON", "EMAIL_ADDRESS"});
    REQUIRE(spans.size() == 1);
    CHECK(spans[0].type == "PERSON");
    CHECK(spans[0].start == 0);
    CHECK(spans[0].end == 5);
    CHECK(spans[0].score == 0.85);

    REQUIRE(state->texts.size() == 1);
    CHECK(state->texts[0] == "Alice met Bob");
    CHECK(state->requested == std::vector<std::string>{"PERSON", "EMAIL_ADDRESS"});
    CHECK(state->frees == 1);
}

TEST_CASE("PluginRegistry: plugin error surfaces as exception", "[plugin]") {
    PluginRegistry registry;
    auto* plugin = MockEntityDetectorPlugin::create();
    auto* state = state_of(plugin);
    state->error = "model not loaded";

    REQUIRE(registry.adopt(plugin, "mock"));
    const auto& detector = registry.entity_detectors()[0];

    CHECK_THROWS_AS(detector->detect("text", {}), std::runtime_error);
    CHECK(state->frees == 1);
}

TEST_CASE("PluginRegistry: rejects incompatible plugins", "[plugin]") {
    PluginRegistry registry;
    std::atomic<bool> destroyed{false};

    SECTION("API version mismatch") {
        auto* plugin = MockEntityDetectorPlugin::create();
        state_of(plugin)->api_version = PIISHIELD_PLUGIN_API_VERSION + 1;
        state_of(plugin)->destroyed = &destroyed;
        CHECK_FALSE(registry.adopt(plugin, "mock"));
    }
    SECTION("wrong plugin type") {
        auto* plugin = MockEntityDetectorPlugin::create();
        state_of(plugin)->type = "audit_sink";
        state_of(plugin)->destroyed = &destroyed;
        CHECK_FALSE(registry.adopt(plugin, "mock"));
    }
    SECTION("incomplete vtable") {
        auto* plugin = MockEntityDetectorPlugin::create();
        plugin->detect = nullptr;
        state_of(plugin)->destroyed = &destroyed;
        CHECK_FALSE(registry.adopt(plugin, "mock"));
    }

    // Rejected plugins are destroyed, not leaked
    CHECK(destroyed.load());
    CHECK(registry.plugin_count() == 0);
    CHECK(registry.entity_detectors().empty());
}

TEST_CASE("PluginRegistry: null and missing plugins", "[plugin]") {
    PluginRegistry registry;
    CHECK_FALSE(registry.adopt(nullptr, "none"));

    PluginConfig missing;
    missing.path = "/nonexistent/libdetector.so";
    CHECK_FALSE(registry.load_plugin(missing));

    PluginConfig wrong_type;
    wrong_type.path = "/nonexistent/libdetector.so";
    wrong_type.type = "classifier";
    CHECK_FALSE(registry.load_plugin(wrong_type));

    CHECK(registry.plugin_count() == 0);
}

TEST_CASE("PluginRegistry: detector keeps its plugin alive after unload", "[plugin]") {
    std::atomic<bool> destroyed{false};
    std::shared_ptr<const IEntityDetector> detector;
    {
        PluginRegistry registry;
        auto* plugin = MockEntityDetectorPlugin::create();
        state_of(plugin)->destroyed = &destroyed;
        REQUIRE(registry.adopt(plugin, "mock"));
        detector = registry.entity_detectors()[0];
        registry.unload_all();
        CHECK(registry.plugin_count() == 0);
    }
    CHECK_FALSE(destroyed.load());
    CHECK(detector->detect("abc", {}).empty());

    detector.reset();
    CHECK(destroyed.load());
}

// ============================================================================
// Engine integration
// ============================================================================

TEST_CASE("Plugin detector drives a model-backed recognizer", "[plugin][engine]") {
    PluginRegistry plugins;
    auto* plugin = MockEntityDetectorPlugin::create();
    state_of(plugin)->spans = {
        EntitySpanC{"PERSON", 0, 5, 0.85},
        EntitySpanC{"LOCATION", 10, 16, 0.9},   // outside the catalog
        EntitySpanC{"PERSON", 40, 60, 0.9},     // outside the text
    };
    REQUIRE(plugins.adopt(plugin, "mock"));

    EngineConfig config;
    config.builtin_recognizers = false;
    PiiShield engine(config);
    engine.add_entity_detector(plugins.entity_detectors()[0], {"PERSON"});

    CHECK(engine.registry().is_builtin("ModelRecognizer:mock_detector"));

    auto result = engine.analyze_text("Alice from Berlin");
    REQUIRE(result.findings.size() == 1);
    CHECK(result.findings[0].type == "PERSON");
    CHECK(result.findings[0].excerpt == "Alice");
    CHECK(result.findings[0].recognizer == "ModelRecognizer:mock_detector");
    CHECK(result.sanitized == "[PII:PERSON] from Berlin");

    REQUIRE(result.warnings.size() == 1);
    CHECK(result.warnings[0].kind == FailureKind::INVALID_SPAN);
}
