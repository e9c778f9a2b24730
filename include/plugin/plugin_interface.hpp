#pragma once

#include <cstddef>
#include <cstdint>

// C ABI plugin interface for entity detectors loaded via dlopen/dlsym.
// Plugins implement these structs and export a factory function.

extern "C" {

// Plugin metadata
struct PluginInfo {
    const char* name;
    const char* version;
    const char* type;       // "entity_detector"
    uint32_t api_version;   // Must match PIISHIELD_PLUGIN_API_VERSION
};

constexpr uint32_t PIISHIELD_PLUGIN_API_VERSION = 1;

// One detected entity; offsets are byte offsets into the text passed to detect()
struct EntitySpanC {
    const char* type;
    size_t start;
    size_t end;
    double score;           // 0.0 - 1.0
};

// Result of one detect() call; released with free_result()
struct EntityDetectionResult {
    EntitySpanC* spans;
    size_t count;
    const char* error;      // non-null = detection failed, spans ignored
};

// Entity detector plugin vtable
struct EntityDetectorPlugin {
    void* instance;
    PluginInfo (*get_info)(void* instance);
    // requested_types empty (type_count == 0) means all supported types
    EntityDetectionResult (*detect)(void* instance, const char* text, size_t text_len,
                                    const char** requested_types, size_t type_count);
    void (*free_result)(void* instance, EntityDetectionResult result);
    void (*destroy)(void* instance);
};

// Factory function signature (plugins export this)
// "create_entity_detector_plugin" -> EntityDetectorPlugin* (const char* config_json)

} // extern "C"
