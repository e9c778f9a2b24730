// Example entity detector plugin: reports PERSON spans for a configured list of
// names. Build as a shared library and reference it from [[plugins]].

#include "plugin/plugin_interface.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <string>
#include <vector>

namespace {

struct NameListDetector {
    std::vector<std::string> names;     // lowercased
};

std::string lower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

PluginInfo get_info(void* /*instance*/) {
    return PluginInfo{"name_list_detector", "1.0.0", "entity_detector",
                      PIISHIELD_PLUGIN_API_VERSION};
}

bool wants_person(const char** requested_types, size_t type_count) {
    if (type_count == 0) return true;
    for (size_t i = 0; i < type_count; ++i) {
        if (std::string(requested_types[i]) == "PERSON") return true;
    }
    return false;
}

EntityDetectionResult detect(void* instance, const char* text, size_t text_len,
                             const char** requested_types, size_t type_count) {
    auto* self = static_cast<NameListDetector*>(instance);
    EntityDetectionResult result{nullptr, 0, nullptr};
    if (!wants_person(requested_types, type_count)) {
        return result;
    }

    const std::string haystack = lower(std::string(text, text_len));
    std::vector<EntitySpanC> spans;
    for (const auto& name : self->names) {
        for (size_t pos = haystack.find(name); pos != std::string::npos;
             pos = haystack.find(name, pos + 1)) {
            spans.push_back(EntitySpanC{"PERSON", pos, pos + name.size(), 0.85});
        }
    }
    if (spans.empty()) {
        return result;
    }

    result.count = spans.size();
    result.spans = new EntitySpanC[spans.size()];
    for (size_t i = 0; i < spans.size(); ++i) {
        result.spans[i] = spans[i];
    }
    return result;
}

void free_result(void* /*instance*/, EntityDetectionResult result) {
    delete[] result.spans;
}

void destroy(void* instance) {
    delete static_cast<NameListDetector*>(instance);
}

} // anonymous namespace

extern "C" EntityDetectorPlugin* create_entity_detector_plugin(const char* config_json) {
    auto* self = new NameListDetector();

    const auto config = nlohmann::json::parse(config_json ? config_json : "", nullptr, false);
    if (!config.is_discarded() && config.is_object() && config.contains("names")) {
        for (const auto& n : config["names"]) {
            if (n.is_string() && !n.get<std::string>().empty()) {
                self->names.push_back(lower(n.get<std::string>()));
            }
        }
    }

    auto* plugin = new EntityDetectorPlugin{};
    plugin->instance = self;
    plugin->get_info = get_info;
    plugin->detect = detect;
    plugin->free_result = free_result;
    plugin->destroy = destroy;
    return plugin;
}
